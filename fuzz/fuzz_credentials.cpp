/**
 * @file  fuzz_credentials.cpp
 * @brief libFuzzer target for CredentialPool::parse and the holiday parser.
 *
 * Build:
 *   cmake -DSIFT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_credentials
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. Every parsed credential has a non-empty id.
 *   3. A pool built from the parsed entries hands out at most one lease per
 *      entry and takes every lease back.
 *   4. A parsed holiday calendar never marks a weekend as a trading day.
 */

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sift/calendar.hpp"
#include "sift/fetcher.hpp"

using namespace sift;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view content(reinterpret_cast<const char*>(data), size);

    const auto credentials = fetch::CredentialPool::parse(content);
    for (const auto& c : credentials) {
        assert(!c.id.empty());
    }

    if (!credentials.empty() && credentials.size() <= 16) {
        fetch::PoolConfig config;
        config.checkout_timeout = std::chrono::milliseconds(0);
        fetch::CredentialPool pool(credentials, config);

        std::vector<fetch::CredentialPool::Lease> leases;
        while (auto lease = pool.checkout()) leases.push_back(std::move(*lease));
        assert(leases.size() == credentials.size());
        leases.clear();
        assert(pool.checkout().has_value());
    }

    if (const auto calendar = core::TradingCalendar::parse_holidays(content)) {
        const auto saturday = TradingDate::from_ymd(2024, 1, 6);
        assert(!calendar->is_trading_day(saturday));
        assert(!calendar->is_trading_day(saturday.plus_days(1)));
    }

    return 0;
}
