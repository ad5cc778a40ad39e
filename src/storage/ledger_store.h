#pragma once
#include <optional>
#include <string>
#include "../ledger.h"

namespace bme {

// A place the single current ledger snapshot lives. There is no locking or
// versioning: store() is a full overwrite.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    // The persisted ledger, or nullopt if none was ever written (or the
    // backend could not be reached). Throws std::runtime_error if a document
    // exists but cannot be decoded.
    virtual std::optional<Ledger> fetch() = 0;

    virtual bool store(const Ledger& ledger, std::string& err) = 0;

    // Human-readable location, for logs.
    virtual std::string describe() const = 0;
};

}
