#include "local_store.h"
#include "../ledger_codec.h"
#include "../log.h"
#include "../paths.h"
#include "../util.h"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace bme {

LocalStore::LocalStore(std::string dir) : dir_(std::move(dir)) {}

std::string LocalStore::file_path() const {
    return join_path(expand_home(dir_), DATA_FILE_NAME);
}

std::optional<Ledger> LocalStore::fetch(){
    const std::string path = file_path();
    std::error_code ec;
    if(!fs::exists(path, ec)){
        BME_LOG_DEBUG(LogCategory::STORAGE, "no ledger at " + path);
        return std::nullopt;
    }

    std::string text;
    if(!read_file_all(path, text)){
        log_warn(LogCategory::STORAGE, "cannot read " + path + ", treating as empty");
        return std::nullopt;
    }

    Ledger l;
    std::string err;
    if(!decode_ledger(text, l, err)){
        throw std::runtime_error(path + ": " + err);
    }
    return l;
}

bool LocalStore::store(const Ledger& ledger, std::string& err){
    const std::string path = file_path();
    if(!atomic_write_file(path, encode_ledger(ledger), err)){
        err = path + ": " + err;
        return false;
    }
    BME_LOG_DEBUG(LogCategory::STORAGE, "wrote " + path);
    return true;
}

}
