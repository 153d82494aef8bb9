/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the bar and universe CSV parsers.
 *
 * Build:
 *   cmake -DSIFT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. Every parsed bar passes validate_bar and carries the requested code.
 *   3. Parsed bars are strictly ascending by date.
 *   4. Universe codes are non-empty and unique.
 *   5. find_row returns either a valid bar for the date or a classified failure;
 *      content without the bar header is always MalformedPayload.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "sift/bar_sources.hpp"
#include "sift/data_loader.hpp"

using namespace sift;
using sift::core::DataLoader;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view content(reinterpret_cast<const char*>(data), size);

    const auto bars = DataLoader::parse_bar_csv(content, "FUZZ");
    for (std::size_t i = 0; i < bars.size(); ++i) {
        assert(bars[i].code == "FUZZ");
        assert(DataLoader::validate_bar(bars[i]));
        if (i > 0) assert(bars[i - 1].date < bars[i].date);
    }

    const auto universe = DataLoader::parse_universe_csv(content);
    std::set<std::string> seen;
    for (const auto& inst : universe) {
        assert(!inst.code.empty());
        assert(seen.insert(inst.code).second);
    }

    // Look up the first parsed date, or an arbitrary one.
    const TradingDate date = bars.empty() ? TradingDate::from_ymd(2024, 1, 2) : bars.front().date;
    const Instrument inst{.code = "FUZZ"};
    const auto outcome = fetch::FileBarSource::find_row(content, inst, date);
    if (const auto* bar = std::get_if<Bar>(&outcome)) {
        assert(bar->date == date);
        assert(DataLoader::validate_bar(*bar));
    }
    if (!DataLoader::has_bar_header(content)) {
        assert(std::holds_alternative<FetchFailure>(outcome));
        assert(std::get<FetchFailure>(outcome).error == FetchError::MalformedPayload);
    }

    return 0;
}
