#include "history.h"
#include "category.h"
#include "log.h"

#include <stdexcept>

namespace bme {

const char* spend_status_str(SpendStatus s){
    switch(s){
        case SpendStatus::Ok:                return "ok";
        case SpendStatus::NonPositiveAmount: return "amount must be positive";
        case SpendStatus::OverBudget:        return "request is over budget";
    }
    return "unknown";
}

SpendStatus spend(Ledger& ledger,
                  double amount,
                  const std::string& reason,
                  const std::optional<std::string>& specific,
                  bool loan,
                  int64_t now,
                  HistoryItem* out)
{
    if(!(amount > 0.0)) return SpendStatus::NonPositiveAmount;

    const double multiplier = effective_multiplier(ledger, reason);
    const double scaled = amount * multiplier;
    const double new_balance = ledger.balance - scaled;
    if(new_balance < 0.0 && !loan) return SpendStatus::OverBudget;

    HistoryItem item;
    item.amount = scaled;
    item.reason = reason;
    item.specific = specific;
    item.time = now;
    ledger.history.push_back(item);
    ledger.balance = new_balance;

    if(multiplier != 1.0){
        BME_LOG_DEBUG(LogCategory::LEDGER, "'" + reason + "' scaled by " + std::to_string(multiplier));
    }
    if(out) *out = item;
    return SpendStatus::Ok;
}

HistoryItem undo(Ledger& ledger){
    if(ledger.history.empty()) throw std::runtime_error("nothing to undo");
    HistoryItem item = ledger.history.back();
    ledger.history.pop_back();
    ledger.balance += item.amount;
    ledger.redo_stack.push_back(item);
    return item;
}

HistoryItem redo(Ledger& ledger){
    if(ledger.redo_stack.empty()) throw std::runtime_error("nothing to redo");
    HistoryItem item = ledger.redo_stack.back();
    ledger.redo_stack.pop_back();
    ledger.balance -= item.amount;
    ledger.history.push_back(item);
    return item;
}

bool garnish(Ledger& ledger){
    if(ledger.balance >= 0.0) return false;
    ledger.debt -= ledger.balance;
    ledger.balance = 0.0;
    BME_LOG_DEBUG(LogCategory::LEDGER, "garnished, debt now " + std::to_string(ledger.debt));
    return true;
}

}
