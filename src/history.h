#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "ledger.h"

namespace bme {

enum class SpendStatus {
    Ok,
    NonPositiveAmount,   // refused, ledger unchanged
    OverBudget           // refused: would go negative without the loan override
};

const char* spend_status_str(SpendStatus s);

// Appends a HistoryItem for amount * effective_multiplier(reason) and debits
// the balance. The redo stack is left as is. On success the new item is
// copied to *out if given.
SpendStatus spend(Ledger& ledger,
                  double amount,
                  const std::string& reason,
                  const std::optional<std::string>& specific,
                  bool loan,
                  int64_t now_ms,
                  HistoryItem* out = nullptr);

// Moves the newest history item onto the redo stack and credits it back.
// Throws std::runtime_error("nothing to undo") if history is empty.
HistoryItem undo(Ledger& ledger);

// Re-applies the newest redo item. Throws std::runtime_error("nothing to
// redo") if the redo stack is empty.
HistoryItem redo(Ledger& ledger);

// Converts a negative balance into debt and zeroes the balance. Returns false
// (no change) when the balance is not negative.
bool garnish(Ledger& ledger);

}
