#pragma once
#include <cstdint>
#include <string>
#include "ledger.h"

namespace bme {

enum class VerifyStatus {
    // safe to overwrite
    Identical,        // nothing diverged
    UndoDetected,     // local is remote minus its newest entry
    SpendDetected,    // local is remote plus one new entry
    ConfigOnly,       // same history and total balance, tables/stacks differ
    // refused
    Diverged,         // a stack differs by more than MAX_HISTORY_DRIFT entries
    UndoMismatch,     // one entry missing locally but balances disagree
    SpendMismatch,    // one entry added locally but balances disagree
    Incompatible,     // neither history is a one-entry extension of the other
    Unknown
};

struct VerifyResult {
    VerifyStatus status{VerifyStatus::Unknown};
    std::string  message;

    bool ok() const {
        return status == VerifyStatus::Identical || status == VerifyStatus::UndoDetected ||
               status == VerifyStatus::SpendDetected || status == VerifyStatus::ConfigOnly;
    }
};

const char* verify_status_str(VerifyStatus s);

// Decides whether `local` (this invocation's accrued and mutated ledger) may
// overwrite `remote` (the ledger persisted right now). `remote` is first
// accrued to `now_ms` at local's rate so both describe the same instant.
//
// This is a bounded optimistic-concurrency check, not a merge: anything beyond
// a single undo or a single spend relative to remote is refused. Throws
// std::runtime_error if remote's last_updated lies on a later day than now_ms.
VerifyResult verify(const Ledger& local, const Ledger& remote, int64_t now_ms);

}
