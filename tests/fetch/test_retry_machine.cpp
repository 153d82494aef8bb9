/// @file tests/fetch/test_retry_machine.cpp
/// @brief Transition tests for the per-instrument retry state machine.

#include "sift/fetcher.hpp"

#include <gtest/gtest.h>

using namespace sift;
using namespace sift::fetch;
using std::chrono::milliseconds;

namespace {

RetryPolicy policy(int max_attempts, int rotate_after = 2) {
    return RetryPolicy{
        .max_attempts             = max_attempts,
        .base_backoff             = milliseconds{100},
        .max_backoff              = milliseconds{1000},
        .multiplier               = 2.0,
        .rotate_after_rate_limits = rotate_after,
    };
}

}  // namespace

TEST(RetryMachine, StartsAttempting) {
    RetryMachine m;
    EXPECT_EQ(m.state(), AttemptState::Attempting);
    EXPECT_EQ(m.attempts(), 0);
    EXPECT_FALSE(m.terminal());
}

TEST(RetryMachine, Success_IsTerminal) {
    RetryMachine m(policy(4));
    m.on_success();
    EXPECT_EQ(m.state(), AttemptState::Succeeded);
    EXPECT_EQ(m.attempts(), 1);
    EXPECT_TRUE(m.terminal());
}

TEST(RetryMachine, NotFound_AbandonsWithoutRetry) {
    RetryMachine m(policy(4));
    m.on_failure(FetchError::NotFound);
    EXPECT_EQ(m.state(), AttemptState::Abandoned);
    EXPECT_EQ(m.attempts(), 1);
}

TEST(RetryMachine, Malformed_AbandonsWithoutRetry) {
    RetryMachine m(policy(4));
    m.on_failure(FetchError::MalformedPayload);
    EXPECT_EQ(m.state(), AttemptState::Abandoned);
}

TEST(RetryMachine, Transient_BacksOffThenRetries) {
    RetryMachine m(policy(4));
    m.on_failure(FetchError::Transient);
    EXPECT_EQ(m.state(), AttemptState::Backoff);
    m.backoff_elapsed();
    EXPECT_EQ(m.state(), AttemptState::Attempting);
    m.on_success();
    EXPECT_EQ(m.state(), AttemptState::Succeeded);
    EXPECT_EQ(m.attempts(), 2);
}

TEST(RetryMachine, Transient_ExhaustsAtMaxAttempts) {
    RetryMachine m(policy(3));
    for (int i = 0; i < 2; ++i) {
        m.on_failure(FetchError::Transient);
        ASSERT_EQ(m.state(), AttemptState::Backoff);
        m.backoff_elapsed();
    }
    m.on_failure(FetchError::Transient);
    EXPECT_EQ(m.state(), AttemptState::Exhausted);
    EXPECT_EQ(m.attempts(), 3);
}

TEST(RetryMachine, RateLimited_RotatesAfterStreak) {
    RetryMachine m(policy(6, 2));
    m.on_failure(FetchError::RateLimited);
    EXPECT_EQ(m.state(), AttemptState::Backoff);
    m.backoff_elapsed();
    m.on_failure(FetchError::RateLimited);
    EXPECT_EQ(m.state(), AttemptState::RotatingCredential);
    m.rotated();
    EXPECT_EQ(m.state(), AttemptState::Backoff);
    m.backoff_elapsed();
    // Streak restarts after a rotation.
    m.on_failure(FetchError::RateLimited);
    EXPECT_EQ(m.state(), AttemptState::Backoff);
}

TEST(RetryMachine, TransientBreaksRateLimitStreak) {
    RetryMachine m(policy(6, 2));
    m.on_failure(FetchError::RateLimited);
    m.backoff_elapsed();
    m.on_failure(FetchError::Transient);
    m.backoff_elapsed();
    m.on_failure(FetchError::RateLimited);
    EXPECT_EQ(m.state(), AttemptState::Backoff);
}

TEST(RetryMachine, Backoff_GrowsAndCaps) {
    RetryMachine m(policy(10));
    m.on_failure(FetchError::Transient);
    EXPECT_EQ(m.backoff(), milliseconds{100});
    m.backoff_elapsed();
    m.on_failure(FetchError::Transient);
    EXPECT_EQ(m.backoff(), milliseconds{200});
    m.backoff_elapsed();
    m.on_failure(FetchError::Transient);
    EXPECT_EQ(m.backoff(), milliseconds{400});
    for (int i = 0; i < 4; ++i) {
        m.backoff_elapsed();
        m.on_failure(FetchError::Transient);
    }
    EXPECT_EQ(m.backoff(), milliseconds{1000});
}

TEST(RetryMachine, EventsInWrongState_Ignored) {
    RetryMachine m(policy(4));
    m.backoff_elapsed();
    m.rotated();
    EXPECT_EQ(m.state(), AttemptState::Attempting);

    m.on_failure(FetchError::Transient);
    m.on_success();  // still in Backoff
    EXPECT_EQ(m.state(), AttemptState::Backoff);
    EXPECT_EQ(m.attempts(), 1);

    m.backoff_elapsed();
    m.on_success();
    m.on_failure(FetchError::Transient);  // terminal stays terminal
    EXPECT_EQ(m.state(), AttemptState::Succeeded);
    EXPECT_EQ(m.attempts(), 2);
}

TEST(RetryMachine, ZeroMaxAttempts_ClampedToOne) {
    RetryMachine m(policy(0));
    m.on_failure(FetchError::Transient);
    EXPECT_EQ(m.state(), AttemptState::Exhausted);
    EXPECT_EQ(m.attempts(), 1);
}
