#include "reconcile.h"
#include "accrual.h"
#include "log.h"

#include <algorithm>
#include <sstream>

namespace bme {

const char* verify_status_str(VerifyStatus s){
    switch(s){
        case VerifyStatus::Identical:     return "identical";
        case VerifyStatus::UndoDetected:  return "undo";
        case VerifyStatus::SpendDetected: return "spend";
        case VerifyStatus::ConfigOnly:    return "config-only";
        case VerifyStatus::Diverged:      return "diverged";
        case VerifyStatus::UndoMismatch:  return "undo-mismatch";
        case VerifyStatus::SpendMismatch: return "spend-mismatch";
        case VerifyStatus::Incompatible:  return "incompatible";
        case VerifyStatus::Unknown:       return "unknown";
    }
    return "unknown";
}

static size_t size_gap(size_t a, size_t b){ return a > b ? a - b : b - a; }

// true if `longer` minus its newest entry equals `shorter`
static bool is_one_entry_extension(const std::vector<HistoryItem>& longer,
                                   const std::vector<HistoryItem>& shorter)
{
    if(longer.size() != shorter.size() + 1) return false;
    return std::equal(shorter.begin(), shorter.end(), longer.begin());
}

static std::string fmt_amount(double v){
    std::ostringstream o; o << v; return o.str();
}

static VerifyResult result(VerifyStatus s, std::string msg){
    VerifyResult r; r.status = s; r.message = std::move(msg); return r;
}

VerifyResult verify(const Ledger& local, const Ledger& remote_in, int64_t now){
    Ledger remote = remote_in;
    remote.rate = local.rate;
    accrue_at_rate(remote, local.effective_rate(), now);

    if(local == remote) return result(VerifyStatus::Identical, "no divergence");

    const size_t lh = local.history.size(), rh = remote.history.size();
    if(size_gap(lh, rh) > MAX_HISTORY_DRIFT ||
       size_gap(local.redo_stack.size(), remote.redo_stack.size()) > MAX_HISTORY_DRIFT)
    {
        return result(VerifyStatus::Diverged, "Histories diverge by more than one entry");
    }

    if(rh > lh){
        if(!is_one_entry_extension(remote.history, local.history)){
            return result(VerifyStatus::Incompatible, "Histories are incompatible");
        }
        // local must have undone remote's newest entry
        const double expected = remote.total_balance() + remote.history.back().amount;
        if(amounts_equal(local.total_balance(), expected)){
            return result(VerifyStatus::UndoDetected, "local ledger undid one entry");
        }
        return result(VerifyStatus::UndoMismatch,
                      "Data missing entry but balances disagree (expected " + fmt_amount(expected) +
                      " but found " + fmt_amount(local.total_balance()) + ")");
    }

    if(lh > rh){
        if(!is_one_entry_extension(local.history, remote.history)){
            return result(VerifyStatus::Incompatible, "Histories are incompatible");
        }
        // local must have added one entry on top of remote
        const double expected = remote.total_balance() - local.history.back().amount;
        if(amounts_equal(local.total_balance(), expected)){
            return result(VerifyStatus::SpendDetected, "local ledger added one entry");
        }
        return result(VerifyStatus::SpendMismatch,
                      "Data has new entry but diverges from stored data (expected " + fmt_amount(expected) +
                      " but found " + fmt_amount(local.total_balance()) + ")");
    }

    if(local.history != remote.history){
        return result(VerifyStatus::Incompatible, "Histories are incompatible");
    }
    if(amounts_equal(local.total_balance(), remote.total_balance())){
        return result(VerifyStatus::ConfigOnly, "only configuration differs");
    }

    BME_LOG_ERROR(LogCategory::LEDGER,
                  "unclassified verification failure: local total " + fmt_amount(local.total_balance()) +
                  " remote total " + fmt_amount(remote.total_balance()) +
                  " redo " + std::to_string(local.redo_stack.size()) + "/" + std::to_string(remote.redo_stack.size()));
    return result(VerifyStatus::Unknown, "Unknown verification failure");
}

}
