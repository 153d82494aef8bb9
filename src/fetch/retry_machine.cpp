/// @file src/fetch/retry_machine.cpp
/// @brief RetryMachine transitions.
///
/// Transition table (event → next state):
///
///   Attempting  + success                         → Succeeded
///   Attempting  + NotFound | MalformedPayload     → Abandoned
///   Attempting  + Transient                       → Backoff   (Exhausted at budget)
///   Attempting  + RateLimited, streak < rotate    → Backoff   (Exhausted at budget)
///   Attempting  + RateLimited, streak >= rotate   → RotatingCredential
///   RotatingCredential + rotated                  → Backoff
///   Backoff     + backoff_elapsed                 → Attempting

#include "sift/fetcher.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace sift::fetch {

std::string_view to_string(AttemptState s) noexcept {
    switch (s) {
        case AttemptState::Attempting:         return "Attempting";
        case AttemptState::Backoff:            return "Backoff";
        case AttemptState::RotatingCredential: return "RotatingCredential";
        case AttemptState::Exhausted:          return "Exhausted";
        case AttemptState::Succeeded:          return "Succeeded";
        case AttemptState::Abandoned:          return "Abandoned";
    }
    return "Unknown";
}

RetryMachine::RetryMachine(RetryPolicy policy) noexcept
    : policy_(policy) {
    policy_.max_attempts = std::max(1, policy_.max_attempts);
    policy_.rotate_after_rate_limits = std::max(1, policy_.rotate_after_rate_limits);
    if (!(policy_.multiplier >= 1.0)) policy_.multiplier = 1.0;
}

bool RetryMachine::terminal() const noexcept {
    return state_ == AttemptState::Succeeded ||
           state_ == AttemptState::Abandoned ||
           state_ == AttemptState::Exhausted;
}

std::chrono::milliseconds RetryMachine::backoff() const noexcept {
    const int exponent = std::max(0, attempts_ - 1);
    const double base  = static_cast<double>(policy_.base_backoff.count());
    const double cap   = static_cast<double>(policy_.max_backoff.count());
    const double delay = std::min(cap, base * std::pow(policy_.multiplier, exponent));
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, delay))};
}

void RetryMachine::on_success() noexcept {
    if (state_ != AttemptState::Attempting) return;
    ++attempts_;
    consecutive_rate_limits_ = 0;
    state_ = AttemptState::Succeeded;
}

void RetryMachine::on_failure(FetchError error) noexcept {
    if (state_ != AttemptState::Attempting) return;
    ++attempts_;

    switch (error) {
        case FetchError::NotFound:
        case FetchError::MalformedPayload:
            state_ = AttemptState::Abandoned;
            return;

        case FetchError::Transient:
            consecutive_rate_limits_ = 0;
            break;

        case FetchError::RateLimited:
            ++consecutive_rate_limits_;
            break;
    }

    if (attempts_ >= policy_.max_attempts) {
        state_ = AttemptState::Exhausted;
        return;
    }
    if (error == FetchError::RateLimited &&
        consecutive_rate_limits_ >= policy_.rotate_after_rate_limits) {
        consecutive_rate_limits_ = 0;
        state_ = AttemptState::RotatingCredential;
        return;
    }
    state_ = AttemptState::Backoff;
}

void RetryMachine::backoff_elapsed() noexcept {
    if (state_ == AttemptState::Backoff) state_ = AttemptState::Attempting;
}

void RetryMachine::rotated() noexcept {
    if (state_ == AttemptState::RotatingCredential) state_ = AttemptState::Backoff;
}

}  // namespace sift::fetch
