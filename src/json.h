#pragma once
#include <string>
#include <variant>
#include <vector>
#include <map>
#include <cstdint>
namespace bme {
struct JNull{};
using JVal = std::variant<JNull, bool, double, std::string, std::vector<class JNode>, std::map<std::string, class JNode>>;
class JNode { public: JVal v; };
using JArray  = std::vector<JNode>;
using JObject = std::map<std::string, JNode>;

bool json_parse(const std::string& s, JNode& out);
// Numbers that are whole and fit in 2^53 are written without a fraction.
std::string json_dump(const JNode& n);

JNode jnull();
JNode jbool(bool v);
JNode jnum(double v);
JNode jstr(const std::string& s);

// Typed member lookup on an object node; false if missing or of another type.
const JNode* json_member(const JObject& o, const std::string& key);
bool json_get_number(const JObject& o, const std::string& key, double& out);
bool json_get_string(const JObject& o, const std::string& key, std::string& out);
}
