// =============================================================================
// LOGGING
// =============================================================================

#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

namespace bme {

// Note: Using ERR instead of ERROR to avoid conflict with Windows ERROR macro
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    NONE = 6
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    GENERAL = 0x0001,
    LEDGER  = 0x0002,
    STORAGE = 0x0004,
    NET     = 0x0008,
    CONFIG  = 0x0010,
    ALL     = 0xFFFF
};

// Configuration
void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);
bool log_enable_file(const std::string& filepath);
void log_set_max_file_size(size_t bytes);  // Rotate to <file>.1 when exceeded

LogLevel log_get_level();
uint32_t log_get_categories();

// Parses "trace".."fatal"/"none" (case-insensitive). Returns false if unknown.
bool log_parse_level(const std::string& s, LogLevel& out);

void log_info(const std::string& s);
void log_warn(const std::string& s);
void log_error(const std::string& s);

void log_trace(LogCategory cat, const std::string& s);
void log_debug(LogCategory cat, const std::string& s);
void log_info(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);
void log_fatal(LogCategory cat, const std::string& s);

// Conditional logging (avoids string construction if level is disabled)
#define BME_LOG_TRACE(cat, msg) do { \
    if (bme::log_get_level() <= bme::LogLevel::TRACE && \
        (bme::log_get_categories() & static_cast<uint32_t>(cat))) { \
        bme::log_trace(cat, msg); \
    } \
} while(0)

#define BME_LOG_DEBUG(cat, msg) do { \
    if (bme::log_get_level() <= bme::LogLevel::DEBUG && \
        (bme::log_get_categories() & static_cast<uint32_t>(cat))) { \
        bme::log_debug(cat, msg); \
    } \
} while(0)

#define BME_LOG_INFO(cat, msg) do { \
    if (bme::log_get_level() <= bme::LogLevel::INFO && \
        (bme::log_get_categories() & static_cast<uint32_t>(cat))) { \
        bme::log_info(cat, msg); \
    } \
} while(0)

#define BME_LOG_WARN(cat, msg) do { \
    if (bme::log_get_level() <= bme::LogLevel::WARN && \
        (bme::log_get_categories() & static_cast<uint32_t>(cat))) { \
        bme::log_warn(cat, msg); \
    } \
} while(0)

#define BME_LOG_ERROR(cat, msg) do { \
    if (bme::log_get_level() <= bme::LogLevel::ERR && \
        (bme::log_get_categories() & static_cast<uint32_t>(cat))) { \
        bme::log_error(cat, msg); \
    } \
} while(0)

void log_flush();

void log_init(LogLevel level = LogLevel::WARN,
              uint32_t categories = static_cast<uint32_t>(LogCategory::ALL),
              const std::string& log_file = "");

// Flush and close the log file
void log_shutdown();

}  // namespace bme
