#include "ledger.h"

#include <chrono>
#include <cmath>

namespace bme {

bool operator==(const HistoryItem& a, const HistoryItem& b){
    return a.amount == b.amount && a.reason == b.reason &&
           a.specific == b.specific && a.time == b.time;
}

bool operator!=(const HistoryItem& a, const HistoryItem& b){ return !(a == b); }

Ledger Ledger::fresh(int64_t now){
    Ledger l;
    l.balance = DEFAULT_BALANCE;
    l.rate = DEFAULT_RATE;
    l.last_updated = now;
    l.version = DATA_VERSION;
    return l;
}

bool operator==(const Ledger& a, const Ledger& b){
    // last_updated intentionally excluded
    return a.history == b.history &&
           a.redo_stack == b.redo_stack &&
           a.balance == b.balance &&
           a.debt == b.debt &&
           a.rate == b.rate &&
           a.cringe_factors == b.cringe_factors &&
           a.synonyms == b.synonyms &&
           a.version == b.version;
}

bool operator!=(const Ledger& a, const Ledger& b){ return !(a == b); }

bool amounts_equal(double a, double b){
    return std::fabs(a - b) <= AMOUNT_EPSILON;
}

int64_t now_ms(){
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}
