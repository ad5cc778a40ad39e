// set / get keys
#include "../src/category.h"
#include "../src/config.h"
#include "../src/ledger.h"
#include "../src/log.h"
#include "../src/settings.h"
#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>

using namespace bme;

int main() {
    log_set_level(LogLevel::NONE);
    printf("Testing settings...\n");

    {
        CfgKey k;
        assert(parse_cfg_key("RATE", k) && k == CfgKey::Rate);
        assert(parse_cfg_key("access-key", k) && k == CfgKey::AccessKey);
        assert(parse_cfg_key("secret_key", k) && k == CfgKey::SecretKey);
        assert(parse_cfg_key("bucketname", k) && k == CfgKey::BucketName);
        assert(!parse_cfg_key("colour", k));
        printf("  [PASS] key names\n");
    }

    // rate
    {
        Config c;
        Ledger l = Ledger::fresh(0);
        std::string msg;
        assert(set_setting(c, l, CfgKey::Rate, {"7.5"}, msg) == SetStatus::Ok);
        assert(l.rate && *l.rate == 7.5);
        std::string out;
        assert(get_setting(c, l, CfgKey::Rate, {}, out) && out == "$7.50");

        bool threw = false;
        try { set_setting(c, l, CfgKey::Rate, {"lots"}, msg); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        assert(*l.rate == 7.5);
        assert(set_setting(c, l, CfgKey::Rate, {}, msg) == SetStatus::MissingValue);
        printf("  [PASS] rate\n");
    }

    // cringe and synonym go to the ledger
    {
        Config c;
        Ledger l = Ledger::fresh(0);
        std::string msg, out;
        assert(set_setting(c, l, CfgKey::Synonym, {"Coffee", "latte"}, msg) == SetStatus::Ok);
        assert(set_setting(c, l, CfgKey::Cringe, {"latte", "2"}, msg) == SetStatus::Ok);
        assert(effective_multiplier(l, "coffee") == 2.0);
        assert(get_setting(c, l, CfgKey::Cringe, {"coffee"}, out) && out == "2");
        assert(get_setting(c, l, CfgKey::Synonym, {"coffee"}, out) && out == "coffee, latte");
        assert(set_setting(c, l, CfgKey::Synonym, {"x", "X"}, msg) == SetStatus::InvalidValue);
        assert(set_setting(c, l, CfgKey::Cringe, {"x"}, msg) == SetStatus::MissingValue);
        bool threw = false;
        try { set_setting(c, l, CfgKey::Cringe, {"x", "abc"}, msg); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        printf("  [PASS] cringe and synonym\n");
    }

    // provider-specific keys
    {
        Config c;
        Ledger l = Ledger::fresh(0);
        std::string msg, out;
        assert(set_setting(c, l, CfgKey::AccessKey, {"AK"}, msg) == SetStatus::InvalidForProvider);
        assert(msg.find("invalid key for provider") == 0);
        assert(!get_setting(c, l, CfgKey::SecretKey, {}, out));

        assert(set_setting(c, l, CfgKey::Path, {"/data/ledger"}, msg) == SetStatus::Ok);
        assert(std::get<LocalConfig>(c.storage).path == "/data/ledger");
        assert(set_setting(c, l, CfgKey::Path, {"none"}, msg) == SetStatus::Ok);
        assert(std::get<LocalConfig>(c.storage).path.empty());

        assert(set_setting(c, l, CfgKey::Provider, {"dropbox"}, msg) == SetStatus::UnknownProvider);
        assert(std::holds_alternative<LocalConfig>(c.storage));

        assert(set_setting(c, l, CfgKey::Provider, {"AWS"}, msg) == SetStatus::Ok);
        const auto& r = std::get<RemoteConfig>(c.storage);
        assert(r.bucket_name.rfind("bucket-", 0) == 0);
        assert(set_setting(c, l, CfgKey::SecretKey, {"abcdefgh1234"}, msg) == SetStatus::Ok);
        assert(get_setting(c, l, CfgKey::SecretKey, {}, out) && out == "********1234");
        assert(get_setting(c, l, CfgKey::Endpoint, {}, out) && out == "s3.us-east-1.amazonaws.com");
        assert(get_setting(c, l, CfgKey::Provider, {}, out) && out == "aws");
        assert(set_setting(c, l, CfgKey::Path, {"/x"}, msg) == SetStatus::InvalidForProvider);

        // switching to the active provider keeps its settings
        std::string bucket = r.bucket_name;
        assert(set_setting(c, l, CfgKey::Provider, {"aws"}, msg) == SetStatus::Ok);
        assert(std::get<RemoteConfig>(c.storage).bucket_name == bucket);
        printf("  [PASS] provider switching and scoped keys\n");
    }

    // log level
    {
        Config c;
        Ledger l = Ledger::fresh(0);
        std::string msg;
        assert(set_setting(c, l, CfgKey::LogLevel, {"Debug"}, msg) == SetStatus::Ok);
        assert(c.log_level == "debug");
        assert(set_setting(c, l, CfgKey::LogLevel, {"chatty"}, msg) == SetStatus::InvalidValue);
        printf("  [PASS] log level\n");
    }

    printf("All settings tests passed.\n");
    return 0;
}
