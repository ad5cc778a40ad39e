#pragma once
#include <string>
#include "ledger_store.h"

namespace bme {

// <dir>/data.json on the local filesystem. A leading "~" in dir is expanded.
class LocalStore : public LedgerStore {
public:
    explicit LocalStore(std::string dir);

    std::optional<Ledger> fetch() override;
    bool store(const Ledger& ledger, std::string& err) override;
    std::string describe() const override { return file_path(); }

    std::string file_path() const;

private:
    std::string dir_;
};

}
