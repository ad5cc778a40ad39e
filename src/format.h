#pragma once
#include <cstdint>
#include <string>
#include "ledger.h"

namespace bme {

// ANSI styling, disabled unless stdout is a terminal.
namespace ui {
    void set_colors(bool enabled);
    bool colors_enabled();
    bool detect_terminal_colors();

    std::string reset();
    std::string bold();
    std::string dim();
    std::string green();
    std::string yellow();
    std::string red();
    std::string cyan();
}

// "$12.34" / "-$12.34", rounded to cents.
std::string format_dollars(double amount);

// "Oct 19 09:05AM", with ", 2025" appended when `ms` is not in the same
// local year as `now_ms`.
std::string format_item_time(int64_t ms, int64_t now_ms);

// "<date>: <amount> <reason> [(specific)]"
std::string format_history_line(const HistoryItem& item, int64_t now_ms);

// Balance line, plus the debt when there is any.
std::string format_balance(const Ledger& ledger);

}
