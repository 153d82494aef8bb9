#pragma once

#include <chrono>
#include <cstddef>

/// @file include/sift/constants.hpp
/// @brief Pipeline-wide defaults and market thresholds for SIFT.

namespace sift::constants {

// ─── Fetching ─────────────────────────────────────────────────────────────────

/// Concurrent per-instrument fetches within one date.
static constexpr std::size_t DEFAULT_FETCH_WORKERS = 8;

/// Upper bound on attempts per instrument (first try included).
static constexpr int DEFAULT_MAX_ATTEMPTS = 4;

/// Backoff before the second attempt; doubles on every further attempt.
static constexpr std::chrono::milliseconds DEFAULT_BASE_BACKOFF{250};

/// Ceiling for a single backoff sleep.
static constexpr std::chrono::milliseconds DEFAULT_MAX_BACKOFF{5000};

/// Consecutive rate-limit signals before switching credential.
static constexpr int DEFAULT_ROTATE_AFTER_RATE_LIMITS = 2;

/// Consecutive rate-limit signals before a credential is cooled down.
static constexpr int DEFAULT_MARK_AFTER_RATE_LIMITS = 3;

/// How long a cooled-down credential stays unusable.
static constexpr std::chrono::milliseconds DEFAULT_CREDENTIAL_COOLDOWN{60000};

/// Maximum wait for a free credential.
static constexpr std::chrono::milliseconds DEFAULT_CHECKOUT_TIMEOUT{30000};

/// HTTP timeouts.
static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{5000};
static constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{10000};

// ─── Computation ──────────────────────────────────────────────────────────────

/// Bars of stored history loaded per instrument (covers ma250 plus a 60-bar
/// strategy window).
static constexpr std::size_t DEFAULT_HISTORY_BARS = 320;

/// Indicator rows handed to strategies per instrument: a 60-bar strategy
/// window plus the bar before it.
static constexpr std::size_t DEFAULT_STRATEGY_ROWS = 61;

/// Concurrent workers for indicator and strategy evaluation.
static constexpr std::size_t DEFAULT_COMPUTE_WORKERS = 8;

// ─── Commit ───────────────────────────────────────────────────────────────────

/// Total commit attempts for a date when the store reports Unavailable.
static constexpr int DEFAULT_COMMIT_ATTEMPTS = 2;

static constexpr std::chrono::milliseconds DEFAULT_COMMIT_RETRY_DELAY{500};

// ─── Market thresholds ────────────────────────────────────────────────────────

/// Daily move (percent) treated as limit-up / limit-down.
static constexpr double LIMIT_MOVE_PCT = 9.5;

/// Minimum traded value for liquidity-gated strategies.
static constexpr double MIN_LIQUID_AMOUNT = 2.0e8;

/// Numerical floor for denominators.
static constexpr double FLOAT_EPSILON = 1e-12;

}  // namespace sift::constants
