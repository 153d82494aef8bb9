/**
 * @file  prop_batch_canonical.cpp
 * @brief Property: committing a batch is order-insensitive and idempotent.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_batch_canonical
 *
 * For any set of distinct instrument codes, a batch and any permutation of
 * it (with identical duplicates sprinkled in) normalise to the same
 * canonical batch, and committing it once or twice leaves the same store
 * state.
 */

#include <rapidcheck.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "sift/store.hpp"

using namespace sift;
using namespace sift::store;

namespace {

const TradingDate DAY = TradingDate::from_ymd(2024, 1, 2);

DateBatch make_batch(const std::set<int>& codes) {
    DateBatch batch{.date = DAY};
    for (const int c : codes) {
        const std::string code = std::to_string(c);
        const double close = 1.0 + c % 97;
        batch.bars.push_back(Bar{.code = code, .date = DAY, .open = close, .high = close,
                                 .low = close, .close = close, .volume = 1.0, .amount = close});
        batch.indicators.push_back(IndicatorRow{
            .code = code, .date = DAY,
            .values = {{"ma5", c % 3 == 0 ? IndicatorValue{} : IndicatorValue{close}}}});
        if (c % 2 == 0) {
            batch.results.push_back(StrategyResult{.strategy = c % 4 == 0 ? "even4" : "even",
                                                   .code = code, .date = DAY, .score = close});
        }
    }
    return batch;
}

}  // namespace

int main() {
    // ── Property 1: permutation and identical duplicates do not matter ───────
    rc::check(
        "batch: canonical form independent of input order",
        []() {
            const auto codes = *rc::gen::container<std::set<int>>(rc::gen::inRange(0, 10000));
            const DateBatch batch = make_batch(codes);

            DateBatch shuffled = batch;
            std::reverse(shuffled.bars.begin(), shuffled.bars.end());
            std::rotate(shuffled.indicators.begin(),
                        shuffled.indicators.begin() + shuffled.indicators.size() / 2,
                        shuffled.indicators.end());
            if (!shuffled.results.empty()) shuffled.results.push_back(shuffled.results.front());
            if (!shuffled.bars.empty()) shuffled.bars.push_back(shuffled.bars.back());

            const auto a = normalize_batch(batch);
            const auto b = normalize_batch(shuffled);
            RC_ASSERT(ok(a));
            RC_ASSERT(ok(b));
            const auto& ca = std::get<DateBatch>(a);
            const auto& cb = std::get<DateBatch>(b);
            RC_ASSERT(ca.bars == cb.bars);
            RC_ASSERT(ca.indicators == cb.indicators);
            RC_ASSERT(ca.results == cb.results);
            RC_ASSERT(ca.bars.size() == codes.size());
        }
    );

    // ── Property 2: committing twice equals committing once ──────────────────
    rc::check(
        "batch: commit is idempotent",
        []() {
            const auto codes = *rc::gen::container<std::set<int>>(rc::gen::inRange(0, 500));
            const DateBatch batch = make_batch(codes);

            MemoryStore once;
            MemoryStore twice;
            RC_ASSERT(!once.commit(batch).has_value());
            RC_ASSERT(!twice.commit(batch).has_value());
            RC_ASSERT(!twice.commit(batch).has_value());

            const auto ra = once.get_strategy_results(DAY, std::nullopt);
            const auto rb = twice.get_strategy_results(DAY, std::nullopt);
            RC_ASSERT(ok(ra) && ok(rb));
            RC_ASSERT(std::get<std::vector<StrategyResult>>(ra) ==
                      std::get<std::vector<StrategyResult>>(rb));
            RC_ASSERT(once.bar_count() == twice.bar_count());
            RC_ASSERT(once.bar_count() == codes.size());
        }
    );

    // ── Property 3: any conflicting duplicate is rejected ─────────────────────
    rc::check(
        "batch: conflicting duplicate bar is a constraint violation",
        []() {
            const auto codes = *rc::gen::nonEmpty(
                rc::gen::container<std::set<int>>(rc::gen::inRange(0, 1000)));
            DateBatch batch = make_batch(codes);
            Bar clash = batch.bars.front();
            clash.close += 1.0;
            clash.high  += 1.0;
            batch.bars.push_back(clash);

            const auto r = normalize_batch(batch);
            RC_ASSERT(!ok(r));
            RC_ASSERT(std::get<StoreFailure>(r).error == StoreError::ConstraintViolation);
        }
    );

    return 0;
}
