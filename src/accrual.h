#pragma once
#include <cstdint>
#include "ledger.h"

namespace bme {

// Local calendar day number of a ms timestamp (days since 1970-01-01 in the
// local time zone).
int64_t local_day_number(int64_t ms);

// Advances balance/debt by `rate * elapsed_days`, diverting at most half of
// the gross accrual into debt repayment. Sets last_updated = now_ms.
//
// Throws std::runtime_error if now_ms falls on an earlier local day than
// last_updated; the ledger is left untouched in that case.
//
// Must be applied once per loaded snapshot: a second call with a non-zero
// elapsed day count accrues twice.
void accrue(Ledger& ledger, int64_t now_ms);

// Same as accrue() but with an explicit rate (reconciliation aligns the
// remote snapshot to the local rate).
void accrue_at_rate(Ledger& ledger, double rate, int64_t now_ms);

}
