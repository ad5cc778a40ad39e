#include "config.h"
#include "log.h"
#include "paths.h"
#include "util.h"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

using namespace bme;

static bool parse_bool(const std::string& v){ return v=="1" || v=="true" || v=="yes" || v=="on"; }

static bool safe_parse_uint16(const std::string& v, uint16_t& out, const std::string& key) {
    try {
        unsigned long val = std::stoul(v);
        if (val == 0 || val > 65535) {
            log_error(LogCategory::CONFIG, "Config: " + key + " value '" + v + "' outside valid port range (1-65535)");
            return false;
        }
        out = static_cast<uint16_t>(val);
        return true;
    } catch (const std::exception& e) {
        log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

const char* bme::provider_name(const StorageKind& s){
    return std::holds_alternative<LocalConfig>(s) ? "local" : "aws";
}

std::string bme::generate_bucket_name(){
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    unsigned char raw[8];
    if(RAND_bytes(raw, sizeof(raw)) != 1) throw std::runtime_error("RAND_bytes failed");
    std::string out = "bucket-";
    for(unsigned char b : raw) out += alphabet[b % (sizeof(alphabet) - 1)];
    return out;
}

std::string bme::default_config_path(){
    return join_path(config_dir(), CONFIG_FILE_NAME);
}

bool bme::load_config(const std::string& path, Config& out){
    std::ifstream f(path);
    if(!f.is_open()) return false;

    // Collect first so `provider` may appear anywhere in the file.
    std::map<std::string, std::pair<std::string, int>> kv;
    std::string line;
    int line_num = 0;
    while(std::getline(f, line)){
        ++line_num;
        line = trim(line);
        if(line.empty()) continue;
        if(line[0]=='#') continue;
        if(line.rfind("//",0)==0) continue;

        auto kpos = line.find('=');
        if(kpos==std::string::npos) {
            log_error(LogCategory::CONFIG, "Config line " + std::to_string(line_num) + ": missing '=' in '" + line + "'");
            continue;
        }
        kv[to_lower(trim(line.substr(0,kpos)))] = {trim(line.substr(kpos+1)), line_num};
    }

    std::string provider = "local";
    auto pit = kv.find("provider");
    if(pit != kv.end()){
        provider = to_lower(pit->second.first);
        if(provider != "local" && provider != "aws"){
            log_warn(LogCategory::CONFIG, "Config: unknown provider '" + provider + "', using local");
            provider = "local";
        }
        kv.erase(pit);
    }

    LocalConfig local;
    RemoteConfig remote;
    const bool is_local = provider == "local";
    for(const auto& e : kv){
        const std::string& k = e.first;
        const std::string& v = e.second.first;
        const bool remote_key = k=="access_key" || k=="secret_key" || k=="bucket_name" ||
                                k=="region" || k=="endpoint" || k=="port" || k=="use_tls";

        if(k=="log_level") out.log_level = v;
        else if(k=="log_file") out.log_file = v;
        else if(k=="path" && is_local) local.path = v;
        else if(remote_key && !is_local){
            if(k=="access_key") remote.access_key = v;
            else if(k=="secret_key") remote.secret_key = v;
            else if(k=="bucket_name") remote.bucket_name = v;
            else if(k=="region") remote.region = v;
            else if(k=="endpoint") remote.endpoint = v;
            else if(k=="port") safe_parse_uint16(v, remote.port, "port");
            else if(k=="use_tls") remote.use_tls = parse_bool(v);
        }
        else if(k=="path" || remote_key){
            log_warn(LogCategory::CONFIG, "Config line " + std::to_string(e.second.second) + ": '" + k +
                     "' does not apply to provider " + provider + ", ignored");
        }
        else {
            log_warn(LogCategory::CONFIG, "Config line " + std::to_string(e.second.second) + ": unknown key '" + k + "'");
        }
    }

    if(is_local){
        out.storage = local;
    } else {
        if(remote.bucket_name.empty()) remote.bucket_name = generate_bucket_name();
        out.storage = remote;
    }
    return true;
}

bool bme::save_config(const std::string& path, const Config& cfg, std::string& err){
    std::ostringstream o;
    o << "# " << APP_NAME << " configuration\n";
    o << "provider=" << provider_name(cfg.storage) << "\n";
    if(const auto* l = std::get_if<LocalConfig>(&cfg.storage)){
        if(!l->path.empty()) o << "path=" << l->path << "\n";
    } else {
        const auto& r = std::get<RemoteConfig>(cfg.storage);
        o << "access_key=" << r.access_key << "\n";
        o << "secret_key=" << r.secret_key << "\n";
        o << "bucket_name=" << r.bucket_name << "\n";
        o << "region=" << r.region << "\n";
        if(!r.endpoint.empty()) o << "endpoint=" << r.endpoint << "\n";
        if(r.port != DEFAULT_S3_PORT) o << "port=" << r.port << "\n";
        if(!r.use_tls) o << "use_tls=false\n";
    }
    if(!cfg.log_level.empty()) o << "log_level=" << cfg.log_level << "\n";
    if(!cfg.log_file.empty()) o << "log_file=" << cfg.log_file << "\n";
    // Holds the secret key
    return atomic_write_file(path, o.str(), err, true);
}
