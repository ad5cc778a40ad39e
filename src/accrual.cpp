#include "accrual.h"
#include "log.h"

#include <ctime>
#include <stdexcept>
#include <string>

namespace bme {

// Howard Hinnant's days_from_civil
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d){
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = (unsigned)(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (int64_t)doe - 719468;
}

int64_t local_day_number(int64_t ms){
    // floor division so pre-epoch timestamps land on the right second
    int64_t secs = ms / 1000;
    if(ms % 1000 < 0) --secs;
    std::time_t tt = (std::time_t)secs;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return days_from_civil((int64_t)tm.tm_year + 1900, (unsigned)tm.tm_mon + 1, (unsigned)tm.tm_mday);
}

void accrue_at_rate(Ledger& ledger, double rate, int64_t now){
    const int64_t elapsed = local_day_number(now) - local_day_number(ledger.last_updated);
    if(elapsed < 0){
        throw std::runtime_error("clock moved backwards: ledger last updated on a later day ("
                                 + std::to_string(-elapsed) + " days ahead)");
    }

    double gross = rate * (double)elapsed;
    if(ledger.debt > 0.0){
        const double half = gross / 2.0;
        if(ledger.debt > half){
            ledger.debt -= half;
            gross = half;
        } else {
            gross -= ledger.debt;
            ledger.debt = 0.0;
        }
    }
    ledger.balance += gross;
    ledger.last_updated = now;

    if(elapsed > 0){
        BME_LOG_DEBUG(LogCategory::LEDGER, "accrued " + std::to_string(elapsed) + " day(s) at rate "
                      + std::to_string(rate) + ", debt now " + std::to_string(ledger.debt));
    }
}

void accrue(Ledger& ledger, int64_t now){
    accrue_at_rate(ledger, ledger.effective_rate(), now);
}

}
