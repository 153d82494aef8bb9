#pragma once

/// @file include/sift/fetcher.hpp
/// @brief Upstream fetch: credential pool, retry state machine, Fetcher.
///
/// # Module: Fetcher
///
/// ## Responsibility
/// Retrieve one daily Bar per instrument of the universe for a date, and
/// classify every failure. The module never persists anything.
///
/// ## Pieces
/// - `BarSource`     : one attempt against the upstream (abstract)
/// - `CredentialPool`: exclusive checkout of credential/proxy entries with
///                      LRU assignment and cooldown after repeated throttling
/// - `RetryMachine`  : pure state machine for one instrument's attempts:
///                      Attempting → Backoff / RotatingCredential → … →
///                      Succeeded | Abandoned | Exhausted
/// - `Fetcher`       : drives the machine per instrument, fan-out bounded by
///                      `FetcherConfig::workers`
///
/// ## Guarantees
/// - Every instrument of the universe yields exactly one `FetchOutcome`
/// - Retry loops are bounded by `RetryPolicy::max_attempts`
/// - Credential checkout is bounded by `PoolConfig::checkout_timeout`

#include "sift/constants.hpp"
#include "sift/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sift::fetch {

// ─── Outcomes ─────────────────────────────────────────────────────────────────

/// A classified failure for one instrument.
struct FetchFailure {
    FetchError  error;
    std::string reason;
    int         attempts = 1;  ///< Attempts made before giving up
};

/// Success with a Bar, or a classified failure. Never silently dropped.
using FetchOutcome = std::variant<Bar, FetchFailure>;

/// All outcomes for one date, keyed by instrument code.
struct FetchReport {
    TradingDate                         date;
    std::map<std::string, FetchOutcome> outcomes;

    /// Successfully fetched bars, ordered by code.
    [[nodiscard]] std::vector<Bar> bars() const;

    [[nodiscard]] std::size_t success_count() const noexcept;
    [[nodiscard]] std::size_t failure_count(FetchError kind) const noexcept;
    [[nodiscard]] std::size_t failure_count() const noexcept;
};

// ─── Credentials ──────────────────────────────────────────────────────────────

/// One independently usable upstream identity: an access token and/or proxy.
struct Credential {
    std::string id;
    std::string token;  ///< Empty for anonymous access
    std::string proxy;  ///< e.g. "http://10.0.0.2:3128"; empty for direct
};

struct PoolConfig {
    /// Consecutive rate-limit reports before an entry is cooled down.
    int mark_after_rate_limits = constants::DEFAULT_MARK_AFTER_RATE_LIMITS;

    /// Time a cooled-down entry stays unusable.
    std::chrono::milliseconds cooldown = constants::DEFAULT_CREDENTIAL_COOLDOWN;

    /// Maximum wait in `checkout`.
    std::chrono::milliseconds checkout_timeout = constants::DEFAULT_CHECKOUT_TIMEOUT;
};

/// Bounded pool of credentials with exclusive checkout.
///
/// Assignment picks the least-recently-released idle entry that is not
/// cooling down. Thread-safe.
class CredentialPool {
public:
    /// RAII checkout. Returns the entry to the pool on destruction.
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        [[nodiscard]] const Credential& credential() const noexcept;

        /// Clear the entry's consecutive rate-limit count.
        void report_success() noexcept;

        /// Count a rate-limit signal; may put the entry into cooldown.
        void report_rate_limited() noexcept;

    private:
        friend class CredentialPool;
        Lease(CredentialPool* pool, std::size_t index) noexcept;
        void release() noexcept;

        CredentialPool* pool_  = nullptr;
        std::size_t     index_ = 0;
    };

    /// An empty `credentials` list yields one anonymous direct entry.
    explicit CredentialPool(std::vector<Credential> credentials,
                            PoolConfig config = PoolConfig{});

    /// Check out an idle, usable entry, waiting at most
    /// `config.checkout_timeout`.
    ///
    /// # Returns
    /// `nullopt` on timeout.
    [[nodiscard]] std::optional<Lease> checkout();

    [[nodiscard]] std::size_t size() const noexcept;

    /// Entries currently not cooling down (in use or idle).
    [[nodiscard]] std::size_t usable() const;

    /// Entries currently checked out.
    [[nodiscard]] std::size_t in_use() const;

    /// Parse `id,token,proxy` lines; `#` comments and blank lines skipped.
    /// Missing trailing fields are empty; a missing id defaults to "cred-N".
    [[nodiscard]] static std::vector<Credential> parse(std::string_view content);

    /// Load a credentials file. `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::vector<Credential>>
    load(const std::string& filepath);

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Credential        credential;
        bool              in_use = false;
        int               strikes = 0;
        Clock::time_point cooldown_until{};
        std::uint64_t     released_seq = 0;  ///< LRU order
    };

    void release(std::size_t index) noexcept;
    void record(std::size_t index, bool rate_limited) noexcept;

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::vector<Entry>      entries_;
    std::uint64_t           release_counter_ = 0;
    PoolConfig              config_;
};

// ─── RetryMachine ─────────────────────────────────────────────────────────────

enum class AttemptState {
    Attempting,          ///< Ready to issue the next attempt
    Backoff,             ///< Waiting `backoff()` before the next attempt
    RotatingCredential,  ///< Switch to another credential, then back off
    Exhausted,           ///< Attempt budget spent on retryable failures
    Succeeded,
    Abandoned,           ///< Non-retryable failure (NotFound, MalformedPayload)
};

[[nodiscard]] std::string_view to_string(AttemptState s) noexcept;

struct RetryPolicy {
    int                       max_attempts = constants::DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds base_backoff = constants::DEFAULT_BASE_BACKOFF;
    std::chrono::milliseconds max_backoff  = constants::DEFAULT_MAX_BACKOFF;
    double                    multiplier   = 2.0;
    int rotate_after_rate_limits = constants::DEFAULT_ROTATE_AFTER_RATE_LIMITS;
};

/// Retry/rotation policy for one instrument as an explicit state machine.
///
/// Performs no I/O. Events that do not apply to the current state are
/// ignored, so a terminal machine stays terminal.
class RetryMachine {
public:
    explicit RetryMachine(RetryPolicy policy = RetryPolicy{}) noexcept;

    [[nodiscard]] AttemptState state() const noexcept { return state_; }

    /// Attempts completed so far.
    [[nodiscard]] int attempts() const noexcept { return attempts_; }

    [[nodiscard]] bool terminal() const noexcept;

    /// Delay to wait while in Backoff:
    /// min(max_backoff, base_backoff · multiplier^(attempts − 1)).
    [[nodiscard]] std::chrono::milliseconds backoff() const noexcept;

    void on_success() noexcept;
    void on_failure(FetchError error) noexcept;
    void backoff_elapsed() noexcept;
    void rotated() noexcept;

private:
    RetryPolicy  policy_;
    AttemptState state_ = AttemptState::Attempting;
    int          attempts_ = 0;
    int          consecutive_rate_limits_ = 0;
};

// ─── BarSource ────────────────────────────────────────────────────────────────

/// One fetch attempt against an upstream. Implementations must bound every
/// call with a timeout and must be safe to call concurrently.
class BarSource {
public:
    virtual ~BarSource() = default;

    [[nodiscard]] virtual FetchOutcome fetch(const Instrument& instrument,
                                             TradingDate date,
                                             const Credential& credential) = 0;
};

// ─── Fetcher ──────────────────────────────────────────────────────────────────

struct FetcherConfig {
    std::size_t workers = constants::DEFAULT_FETCH_WORKERS;
    RetryPolicy retry{};
};

/// Sleeps for a backoff delay. Injectable so tests run without waiting.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

[[nodiscard]] Sleeper real_sleeper();

class Fetcher {
public:
    Fetcher(BarSource& source, CredentialPool& pool,
            FetcherConfig config = FetcherConfig{},
            Sleeper sleeper = real_sleeper());

    /// Fetch every instrument of `universe` for `date`.
    [[nodiscard]] FetchReport fetch(std::span<const Instrument> universe,
                                    TradingDate date) const;

    /// Fetch one instrument, running the retry machine to a terminal state.
    [[nodiscard]] FetchOutcome fetch_one(const Instrument& instrument,
                                         TradingDate date) const;

private:
    BarSource&      source_;
    CredentialPool& pool_;
    FetcherConfig   config_;
    Sleeper         sleeper_;
};

}  // namespace sift::fetch
