// src/log.cpp
#include "log.h"
#include "constants.h"
#include <mutex>
#include <atomic>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <filesystem>

namespace bme {

// ============================================================================
// Configuration
// ============================================================================
static std::atomic<LogLevel> g_log_level{LogLevel::WARN};
static std::atomic<uint32_t> g_log_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps_enabled{false};

static std::mutex g_log_mutex;
static std::ofstream g_log_file;
static std::string g_log_file_path;
static size_t g_log_max_file_size = BME_LOG_MAX_FILE_BYTES;

static std::string format_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

// Caller holds g_log_mutex.
static void rotate_if_needed() {
    if (!g_log_file.is_open() || g_log_max_file_size == 0) return;
    std::streampos pos = g_log_file.tellp();
    if (pos < 0 || static_cast<size_t>(pos) < g_log_max_file_size) return;

    g_log_file.close();
    std::error_code ec;
    std::filesystem::rename(g_log_file_path, g_log_file_path + ".1", ec);
    g_log_file.open(g_log_file_path, std::ios::out | std::ios::app);
}

static void write_line(const char* level, const std::string& msg) noexcept {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    try {
        const bool to_err = std::strcmp(level, "INFO") != 0 &&
                            std::strcmp(level, "DEBUG") != 0 &&
                            std::strcmp(level, "TRACE") != 0;
        std::ostream& os = to_err ? std::cerr : std::cout;
        if (g_timestamps_enabled.load(std::memory_order_relaxed)) {
            os << "[" << level << "][" << format_timestamp() << "] " << msg << '\n';
        } else {
            os << "[" << level << "] " << msg << '\n';
        }

        // The file always carries timestamps
        if (g_log_file.is_open()) {
            g_log_file << "[" << level << "][" << format_timestamp() << "] " << msg << '\n';
            rotate_if_needed();
        }
    } catch (const std::exception&) {
        // Never let logging crash the process
    }
}

// ============================================================================
// Public API
// ============================================================================

void log_info(const std::string& m) {
    if (g_log_level.load(std::memory_order_relaxed) <= LogLevel::INFO) {
        write_line("INFO", m);
    }
}

void log_warn(const std::string& m) {
    if (g_log_level.load(std::memory_order_relaxed) <= LogLevel::WARN) {
        write_line("WARN", m);
    }
}

void log_error(const std::string& m) {
    if (g_log_level.load(std::memory_order_relaxed) <= LogLevel::ERR) {
        write_line("ERROR", m);
    }
}

static inline bool enabled(LogLevel lvl, LogCategory cat) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl &&
           (g_log_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat));
}

void log_trace(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::TRACE, cat)) write_line("TRACE", s);
}

void log_debug(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::DEBUG, cat)) write_line("DEBUG", s);
}

void log_info(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::INFO, cat)) write_line("INFO", s);
}

void log_warn(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::WARN, cat)) write_line("WARN", s);
}

void log_error(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::ERR, cat)) write_line("ERROR", s);
}

void log_fatal(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::FATAL, cat)) write_line("FATAL", s);
}

void log_set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

void log_set_categories(uint32_t categories) {
    g_log_categories.store(categories, std::memory_order_relaxed);
}

void log_enable_timestamps(bool enable) {
    g_timestamps_enabled.store(enable, std::memory_order_relaxed);
}

LogLevel log_get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

uint32_t log_get_categories() {
    return g_log_categories.load(std::memory_order_relaxed);
}

bool log_parse_level(const std::string& s, LogLevel& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error" || v == "err") out = LogLevel::ERR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "none" || v == "off") out = LogLevel::NONE;
    else return false;
    return true;
}

bool log_enable_file(const std::string& filepath) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    if (g_log_file.is_open()) g_log_file.close();
    g_log_file_path = filepath;
    if (filepath.empty()) return true;
    g_log_file.open(filepath, std::ios::out | std::ios::app);
    return g_log_file.is_open();
}

void log_set_max_file_size(size_t bytes) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    g_log_max_file_size = bytes;
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cout.flush();
    std::cerr.flush();
    if (g_log_file.is_open()) g_log_file.flush();
}

void log_init(LogLevel level, uint32_t categories, const std::string& log_file) {
    g_log_level.store(level, std::memory_order_relaxed);
    g_log_categories.store(categories, std::memory_order_relaxed);
    if (!log_file.empty() && !log_enable_file(log_file)) {
        write_line("WARN", "cannot open log file '" + log_file + "'");
    }
}

void log_shutdown() {
    log_flush();
    std::lock_guard<std::mutex> lk(g_log_mutex);
    if (g_log_file.is_open()) g_log_file.close();
}

}  // namespace bme
