#pragma once
#include <cstdint>
#include <cstddef>

// =============================================================================
// BUDGETME CONSTANTS
// =============================================================================

// === STORAGE OVERRIDES ===
#ifndef BME_S3_TIMEOUT_MS
#define BME_S3_TIMEOUT_MS 10000
#endif
#ifndef BME_LOG_MAX_FILE_BYTES
#define BME_LOG_MAX_FILE_BYTES (4u * 1024u * 1024u)
#endif

namespace bme {

static constexpr const char* APP_NAME = "budgetme";

// Schema marker written into every ledger document.
static constexpr uint32_t DATA_VERSION = 1;

// Fresh ledger defaults
static constexpr double DEFAULT_BALANCE = 10.0;
static constexpr double DEFAULT_RATE    = 5.0;   // per day

// Tolerance used when comparing monetary amounts
static constexpr double AMOUNT_EPSILON = 1e-6;

// Reconciliation refuses when either stack differs by more than this.
static constexpr size_t MAX_HISTORY_DRIFT = 2;

static constexpr const char* DATA_FILE_NAME   = "data.json";
static constexpr const char* CONFIG_FILE_NAME = "config.conf";

static constexpr const char* DEFAULT_REGION = "us-east-1";
static constexpr uint16_t    DEFAULT_S3_PORT = 443;
static constexpr int64_t     MS_PER_DAY = 86400000LL;

}
