/// @file tests/fetch/test_credential_pool.cpp
/// @brief Unit tests for CredentialPool checkout, LRU order and cooldown.

#include "sift/fetcher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace sift::fetch;
using std::chrono::milliseconds;

namespace {

std::vector<Credential> creds(std::initializer_list<const char*> ids) {
    std::vector<Credential> out;
    for (const char* id : ids) out.push_back(Credential{.id = id, .token = "t", .proxy = ""});
    return out;
}

PoolConfig fast(int mark_after = 3, milliseconds cooldown = milliseconds{60000}) {
    return PoolConfig{
        .mark_after_rate_limits = mark_after,
        .cooldown               = cooldown,
        .checkout_timeout       = milliseconds{20},
    };
}

}  // namespace

TEST(CredentialPool, EmptyList_YieldsDirectEntry) {
    CredentialPool pool({}, fast());
    EXPECT_EQ(pool.size(), 1u);
    auto lease = pool.checkout();
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->credential().id, "direct");
    EXPECT_TRUE(lease->credential().proxy.empty());
}

TEST(CredentialPool, Checkout_IsExclusive) {
    CredentialPool pool(creds({"a"}), fast());
    auto first = pool.checkout();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(pool.in_use(), 1u);
    EXPECT_FALSE(pool.checkout().has_value());  // times out
}

TEST(CredentialPool, Lease_ReturnsOnDestruction) {
    CredentialPool pool(creds({"a"}), fast());
    {
        auto lease = pool.checkout();
        ASSERT_TRUE(lease.has_value());
    }
    EXPECT_EQ(pool.in_use(), 0u);
    EXPECT_TRUE(pool.checkout().has_value());
}

TEST(CredentialPool, Lease_MoveTransfersOwnership) {
    CredentialPool pool(creds({"a"}), fast());
    auto lease = pool.checkout();
    ASSERT_TRUE(lease.has_value());
    CredentialPool::Lease moved = std::move(*lease);
    lease.reset();
    EXPECT_EQ(pool.in_use(), 1u);
}

TEST(CredentialPool, Checkout_PrefersLeastRecentlyReleased) {
    CredentialPool pool(creds({"a", "b", "c"}), fast());
    {
        auto a = pool.checkout();
        ASSERT_EQ(a->credential().id, "a");
    }
    // "a" was just released; "b" and "c" have never been used.
    auto next = pool.checkout();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->credential().id, "b");
}

TEST(CredentialPool, RepeatedRateLimits_CoolDownEntry) {
    CredentialPool pool(creds({"a", "b"}), fast(2));
    {
        auto a = pool.checkout();
        ASSERT_EQ(a->credential().id, "a");
        a->report_rate_limited();
        a->report_rate_limited();
    }
    EXPECT_EQ(pool.usable(), 1u);

    auto b = pool.checkout();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->credential().id, "b");
    EXPECT_FALSE(pool.checkout().has_value());  // "a" cooling, "b" busy
}

TEST(CredentialPool, Success_ResetsStrikes) {
    CredentialPool pool(creds({"a"}), fast(2));
    auto a = pool.checkout();
    a->report_rate_limited();
    a->report_success();
    a->report_rate_limited();
    EXPECT_EQ(pool.usable(), 1u);
}

TEST(CredentialPool, CooledEntry_ReturnsAfterCooldown) {
    auto cfg = fast(1, milliseconds{30});
    cfg.checkout_timeout = milliseconds{2000};
    CredentialPool pool(creds({"a"}), cfg);
    {
        auto a = pool.checkout();
        a->report_rate_limited();
    }
    auto again = pool.checkout();  // waits for the cooldown to expire
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->credential().id, "a");
}

TEST(CredentialPool, ConcurrentCheckouts_NeverShareEntry) {
    auto cfg = fast();
    cfg.checkout_timeout = milliseconds{5000};
    CredentialPool pool(creds({"a", "b"}), cfg);
    std::atomic<int> concurrent{0};
    std::atomic<int> peak{0};

    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto lease = pool.checkout();
                ASSERT_TRUE(lease.has_value());
                const int now = ++concurrent;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::yield();
                --concurrent;
            }
        });
    }
    threads.clear();
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pool.in_use(), 0u);
}

TEST(CredentialPool, Parse_FillsMissingFields) {
    const auto parsed = CredentialPool::parse(
        "# id,token,proxy\n"
        "main,tok1,http://10.0.0.2:3128\n"
        ",tok2\n"
        "\n"
        "bare\r\n");
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed[0].proxy, "http://10.0.0.2:3128");
    EXPECT_EQ(parsed[1].id, "cred-2");
    EXPECT_EQ(parsed[1].token, "tok2");
    EXPECT_TRUE(parsed[1].proxy.empty());
    EXPECT_EQ(parsed[2].id, "bare");
    EXPECT_TRUE(parsed[2].token.empty());
}

TEST(CredentialPool, Load_MissingFile) {
    EXPECT_FALSE(CredentialPool::load("/nonexistent/credentials").has_value());
}
