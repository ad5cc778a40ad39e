#include "format.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifdef _WIN32
  #include <io.h>
  #define isatty _isatty
  #define STDOUT_FILENO _fileno(stdout)
#else
  #include <unistd.h>
#endif

namespace bme {

namespace ui {
    static bool g_use_colors = false;

    void set_colors(bool enabled) { g_use_colors = enabled; }
    bool colors_enabled() { return g_use_colors; }

    bool detect_terminal_colors() {
        if (std::getenv("NO_COLOR")) return false;
        if (!isatty(STDOUT_FILENO)) return false;
        const char* term = std::getenv("TERM");
        if (term && std::string(term) == "dumb") return false;
        return true;
    }

    std::string reset()  { return g_use_colors ? "\033[0m" : ""; }
    std::string bold()   { return g_use_colors ? "\033[1m" : ""; }
    std::string dim()    { return g_use_colors ? "\033[2m" : ""; }
    std::string green()  { return g_use_colors ? "\033[32m" : ""; }
    std::string yellow() { return g_use_colors ? "\033[33m" : ""; }
    std::string red()    { return g_use_colors ? "\033[31m" : ""; }
    std::string cyan()   { return g_use_colors ? "\033[36m" : ""; }
}

std::string format_dollars(double amount){
    long long cents = std::llround(amount * 100.0);
    const bool neg = cents < 0;
    if (neg) cents = -cents;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s$%lld.%02lld", neg ? "-" : "", cents / 100, cents % 100);
    return buf;
}

static std::tm local_tm(int64_t ms){
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &t);
#else
    localtime_r(&t, &out);
#endif
    return out;
}

std::string format_item_time(int64_t ms, int64_t now_ms){
    std::tm tm = local_tm(ms);
    std::tm now = local_tm(now_ms);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%b %d %I:%M%p", &tm);
    std::string out = buf;
    if (tm.tm_year != now.tm_year) out += ", " + std::to_string(tm.tm_year + 1900);
    return out;
}

std::string format_history_line(const HistoryItem& item, int64_t now_ms){
    std::string out = ui::dim() + format_item_time(item.time, now_ms) + ":" + ui::reset() + " ";
    out += ui::red() + format_dollars(item.amount) + ui::reset() + " " + item.reason;
    if (item.specific) out += " (" + *item.specific + ")";
    return out;
}

std::string format_balance(const Ledger& ledger){
    const double bal = ledger.balance;
    std::string color = bal < 0 ? ui::red() : ui::green();
    std::string out = ui::bold() + color + format_dollars(bal) + ui::reset();
    if (!amounts_equal(ledger.debt, 0.0)) {
        out += " " + ui::yellow() + "(debt " + format_dollars(ledger.debt) + ", total " +
               format_dollars(ledger.total_balance()) + ")" + ui::reset();
    }
    return out;
}

}
