#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "constants.h"

namespace bme {

// One committed spend. `amount` is the scaled amount actually deducted.
struct HistoryItem {
    double                     amount{0.0};
    std::string                reason;
    std::optional<std::string> specific;
    int64_t                    time{0};   // ms since epoch
};

bool operator==(const HistoryItem& a, const HistoryItem& b);
bool operator!=(const HistoryItem& a, const HistoryItem& b);

// The persisted aggregate. Every write replaces the whole document.
struct Ledger {
    std::vector<HistoryItem> history;      // oldest first
    std::vector<HistoryItem> redo_stack;   // filled by undo, consumed by redo
    double                   balance{DEFAULT_BALANCE};
    double                   debt{0.0};
    std::optional<double>    rate;
    int64_t                  last_updated{0};
    std::map<std::string, double>                cringe_factors;
    std::map<std::string, std::set<std::string>> synonyms;
    uint32_t                 version{DATA_VERSION};

    // Fresh ledger: balance 10, rate 5, empty history, stamped `now_ms`.
    static Ledger fresh(int64_t now_ms);

    double total_balance() const { return balance - debt; }
    double effective_rate() const { return rate ? *rate : DEFAULT_RATE; }
};

// Structural equality on every field except last_updated.
bool operator==(const Ledger& a, const Ledger& b);
bool operator!=(const Ledger& a, const Ledger& b);

bool amounts_equal(double a, double b);

// Current wall clock in ms since epoch.
int64_t now_ms();

}
