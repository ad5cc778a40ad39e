#pragma once
#include <memory>
#include "ledger_store.h"
#include "../config.h"

namespace bme {

// Builds the backend selected by cfg.storage.
std::unique_ptr<LedgerStore> make_store(const Config& cfg);

}
