#pragma once
#include <string>
#include <cstdint>
#include <variant>

#include "constants.h"

namespace bme {

struct LocalConfig {
    std::string path;                       // data directory; empty = config dir
};

struct RemoteConfig {
    std::string access_key;
    std::string secret_key;
    std::string bucket_name;                // generated when empty
    std::string region   = DEFAULT_REGION;
    std::string endpoint;                   // empty = s3.<region>.amazonaws.com
    uint16_t    port     = DEFAULT_S3_PORT;
    bool        use_tls  = true;
};

// Exactly one backend is active; `provider=local|aws` selects it.
using StorageKind = std::variant<LocalConfig, RemoteConfig>;

struct Config {
    StorageKind storage{LocalConfig{}};
    std::string log_level;                  // empty = CLI default
    std::string log_file;
};

const char* provider_name(const StorageKind& s);

// "bucket-" + 8 random lowercase alphanumerics.
std::string generate_bucket_name();

// Simple key=value loader. Keys for the inactive backend and unknown keys are
// ignored with a warning. Returns false if the file is not found.
bool load_config(const std::string& path, Config& out);

// Writes the config atomically in the same key=value format.
bool save_config(const std::string& path, const Config& cfg, std::string& err);

std::string default_config_path();

}
