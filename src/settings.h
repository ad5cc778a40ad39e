#pragma once
#include <string>
#include <vector>
#include "config.h"
#include "ledger.h"

namespace bme {

// Keys accepted by `set` and `get`. Rate, Cringe and Synonym live in the
// ledger; the rest live in the config file.
enum class CfgKey {
    Rate,
    Path,
    AccessKey,
    SecretKey,
    BucketName,
    Region,
    Endpoint,
    Provider,
    Cringe,
    Synonym,
    LogLevel
};

// Case-insensitive; '-' and '_' are interchangeable ("access-key", "accesskey").
bool parse_cfg_key(const std::string& s, CfgKey& out);
const char* cfg_key_name(CfgKey k);
bool cfg_key_is_ledger(CfgKey k);

// Parses a numeric argument. Throws std::runtime_error when `v` is not a
// finite number.
double parse_number_arg(const std::string& v, const std::string& what);

enum class SetStatus {
    Ok,
    MissingValue,
    InvalidForProvider,
    UnknownProvider,
    InvalidValue
};

// Applies `set <key> <values...>`. On Ok `message` describes the new value,
// otherwise why nothing changed. Numeric values that do not parse throw.
SetStatus set_setting(Config& cfg, Ledger& ledger, CfgKey key,
                      const std::vector<std::string>& values, std::string& message);

// Renders `get <key> [args]`. Returns false (with the reason in `out`) if the
// key does not apply to the active provider.
bool get_setting(const Config& cfg, const Ledger& ledger, CfgKey key,
                 const std::vector<std::string>& args, std::string& out);

}
