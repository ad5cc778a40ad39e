#include "store_factory.h"
#include "local_store.h"
#include "s3_store.h"
#include "../paths.h"

namespace bme {

std::unique_ptr<LedgerStore> make_store(const Config& cfg){
    if(const auto* l = std::get_if<LocalConfig>(&cfg.storage)){
        return std::make_unique<LocalStore>(l->path.empty() ? config_dir() : l->path);
    }
    return std::make_unique<S3Store>(std::get<RemoteConfig>(cfg.storage));
}

}
