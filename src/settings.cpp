#include "settings.h"
#include "category.h"
#include "format.h"
#include "log.h"
#include "util.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace bme {

static std::string normalize_key(const std::string& s){
    std::string out;
    for (char c : to_lower(trim(s))) {
        if (c == '-' || c == '_') continue;
        out += c;
    }
    return out;
}

bool parse_cfg_key(const std::string& s, CfgKey& out){
    const std::string k = normalize_key(s);
    if (k == "rate")            out = CfgKey::Rate;
    else if (k == "path")       out = CfgKey::Path;
    else if (k == "accesskey")  out = CfgKey::AccessKey;
    else if (k == "secretkey")  out = CfgKey::SecretKey;
    else if (k == "bucketname" || k == "bucket") out = CfgKey::BucketName;
    else if (k == "region")     out = CfgKey::Region;
    else if (k == "endpoint")   out = CfgKey::Endpoint;
    else if (k == "provider")   out = CfgKey::Provider;
    else if (k == "cringe")     out = CfgKey::Cringe;
    else if (k == "synonym")    out = CfgKey::Synonym;
    else if (k == "loglevel")   out = CfgKey::LogLevel;
    else return false;
    return true;
}

const char* cfg_key_name(CfgKey k){
    switch (k) {
        case CfgKey::Rate:       return "rate";
        case CfgKey::Path:       return "path";
        case CfgKey::AccessKey:  return "access_key";
        case CfgKey::SecretKey:  return "secret_key";
        case CfgKey::BucketName: return "bucket_name";
        case CfgKey::Region:     return "region";
        case CfgKey::Endpoint:   return "endpoint";
        case CfgKey::Provider:   return "provider";
        case CfgKey::Cringe:     return "cringe";
        case CfgKey::Synonym:    return "synonym";
        case CfgKey::LogLevel:   return "log_level";
    }
    return "?";
}

bool cfg_key_is_ledger(CfgKey k){
    return k == CfgKey::Rate || k == CfgKey::Cringe || k == CfgKey::Synonym;
}

double parse_number_arg(const std::string& v, const std::string& what){
    const std::string s = trim(v);
    if (s.empty()) throw std::runtime_error("invalid " + what + ": empty value");
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end == s.c_str() || *end != '\0' || !std::isfinite(d))
        throw std::runtime_error("invalid " + what + ": '" + v + "' is not a number");
    return d;
}

static bool is_remote_key(CfgKey k){
    return k == CfgKey::AccessKey || k == CfgKey::SecretKey || k == CfgKey::BucketName ||
           k == CfgKey::Region || k == CfgKey::Endpoint;
}

static std::string* remote_field(RemoteConfig& r, CfgKey k){
    switch (k) {
        case CfgKey::AccessKey:  return &r.access_key;
        case CfgKey::SecretKey:  return &r.secret_key;
        case CfgKey::BucketName: return &r.bucket_name;
        case CfgKey::Region:     return &r.region;
        case CfgKey::Endpoint:   return &r.endpoint;
        default:                 return nullptr;
    }
}

static std::string mask_secret(const std::string& s){
    if (s.empty()) return "";
    if (s.size() <= 4) return std::string(s.size(), '*');
    return std::string(s.size() - 4, '*') + s.substr(s.size() - 4);
}

SetStatus set_setting(Config& cfg, Ledger& ledger, CfgKey key,
                      const std::vector<std::string>& values, std::string& message)
{
    const size_t need = (key == CfgKey::Cringe || key == CfgKey::Synonym) ? 2 : 1;
    if (values.size() < need) {
        message = std::string("set ") + cfg_key_name(key) + ": missing value";
        return SetStatus::MissingValue;
    }

    if (is_remote_key(key)) {
        auto* r = std::get_if<RemoteConfig>(&cfg.storage);
        if (!r) {
            message = std::string("invalid key for provider ") + provider_name(cfg.storage) + ": " + cfg_key_name(key);
            return SetStatus::InvalidForProvider;
        }
        *remote_field(*r, key) = values[0];
        message = std::string(cfg_key_name(key)) + " set";
        log_info(LogCategory::CONFIG, message);
        return SetStatus::Ok;
    }

    switch (key) {
        case CfgKey::Rate: {
            double rate = parse_number_arg(values[0], "rate");
            if (rate < 0) {
                message = "rate must not be negative";
                return SetStatus::InvalidValue;
            }
            ledger.rate = rate;
            message = "Rate is " + format_dollars(rate) + " per day";
            break;
        }
        case CfgKey::Cringe: {
            double factor = parse_number_arg(values[1], "cringe factor");
            if (factor <= 0) {
                message = "cringe factor must be positive";
                return SetStatus::InvalidValue;
            }
            set_cringe(ledger, values[0], factor);
            message = "Cringe factor for " + fold_category(values[0]) + " is " + trim(values[1]);
            break;
        }
        case CfgKey::Synonym: {
            if (!set_synonym(ledger, values[0], values[1])) {
                message = "a keyword cannot be a synonym of itself";
                return SetStatus::InvalidValue;
            }
            message = fold_category(values[0]) + " and " + fold_category(values[1]) + " are now synonyms";
            break;
        }
        case CfgKey::Provider: {
            const std::string p = to_lower(trim(values[0]));
            if (p == "local") {
                if (!std::holds_alternative<LocalConfig>(cfg.storage)) cfg.storage = LocalConfig{};
            } else if (p == "aws") {
                if (!std::holds_alternative<RemoteConfig>(cfg.storage)) {
                    RemoteConfig r;
                    r.bucket_name = generate_bucket_name();
                    cfg.storage = r;
                }
            } else {
                message = "unknown provider '" + values[0] + "' (expected local or aws)";
                return SetStatus::UnknownProvider;
            }
            message = "Provider is " + p;
            break;
        }
        case CfgKey::Path: {
            auto* l = std::get_if<LocalConfig>(&cfg.storage);
            if (!l) {
                message = std::string("invalid key for provider ") + provider_name(cfg.storage) + ": path";
                return SetStatus::InvalidForProvider;
            }
            l->path = to_lower(trim(values[0])) == "none" ? std::string() : values[0];
            message = l->path.empty() ? "Path reset to default" : "Path is " + l->path;
            break;
        }
        case CfgKey::LogLevel: {
            LogLevel lvl;
            if (!log_parse_level(values[0], lvl)) {
                message = "unknown log level '" + values[0] + "'";
                return SetStatus::InvalidValue;
            }
            cfg.log_level = to_lower(trim(values[0]));
            message = "Log level is " + cfg.log_level;
            break;
        }
        default:
            message = "unsupported key";
            return SetStatus::InvalidValue;
    }
    log_info(LogCategory::CONFIG, message);
    return SetStatus::Ok;
}

bool get_setting(const Config& cfg, const Ledger& ledger, CfgKey key,
                 const std::vector<std::string>& args, std::string& out)
{
    if (is_remote_key(key)) {
        const auto* r = std::get_if<RemoteConfig>(&cfg.storage);
        if (!r) {
            out = std::string("invalid key for provider ") + provider_name(cfg.storage) + ": " + cfg_key_name(key);
            return false;
        }
        if (key == CfgKey::SecretKey) out = mask_secret(r->secret_key);
        else if (key == CfgKey::Endpoint && r->endpoint.empty()) out = "s3." + r->region + ".amazonaws.com";
        else {
            RemoteConfig copy = *r;
            out = *remote_field(copy, key);
        }
        return true;
    }

    switch (key) {
        case CfgKey::Rate:
            out = format_dollars(ledger.effective_rate());
            return true;
        case CfgKey::Provider:
            out = provider_name(cfg.storage);
            return true;
        case CfgKey::Path: {
            const auto* l = std::get_if<LocalConfig>(&cfg.storage);
            if (!l) {
                out = std::string("invalid key for provider ") + provider_name(cfg.storage) + ": path";
                return false;
            }
            out = l->path.empty() ? "(default)" : l->path;
            return true;
        }
        case CfgKey::LogLevel:
            out = cfg.log_level.empty() ? "warn" : cfg.log_level;
            return true;
        case CfgKey::Cringe: {
            if (!args.empty()) {
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%g", effective_multiplier(ledger, args[0]));
                out = buf;
                return true;
            }
            out.clear();
            for (const auto& e : ledger.cringe_factors) {
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%g", e.second);
                if (!out.empty()) out += "\n";
                out += e.first + ": " + buf;
            }
            return true;
        }
        case CfgKey::Synonym: {
            out.clear();
            if (!args.empty()) {
                for (const auto& s : synonym_group(ledger, args[0])) {
                    if (!out.empty()) out += ", ";
                    out += s;
                }
                return true;
            }
            for (const auto& e : ledger.synonyms) {
                std::string line = e.first + ":";
                for (const auto& s : e.second) line += " " + s;
                if (!out.empty()) out += "\n";
                out += line;
            }
            return true;
        }
        default:
            break;
    }
    out = "unsupported key";
    return false;
}

}
