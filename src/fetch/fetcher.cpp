/// @file src/fetch/fetcher.cpp
/// @brief Fetcher: runs a RetryMachine per instrument across a worker pool.

#include "sift/fetcher.hpp"
#include "sift/data_loader.hpp"
#include "sift/parallel.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace sift::fetch {

// ─── FetchReport ──────────────────────────────────────────────────────────────

std::vector<Bar> FetchReport::bars() const {
    std::vector<Bar> out;
    out.reserve(outcomes.size());
    for (const auto& [code, outcome] : outcomes) {
        if (const auto* bar = std::get_if<Bar>(&outcome)) {
            out.push_back(*bar);
        }
    }
    return out;
}

std::size_t FetchReport::success_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        outcomes.begin(), outcomes.end(),
        [](const auto& kv) { return std::holds_alternative<Bar>(kv.second); }));
}

std::size_t FetchReport::failure_count(FetchError kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(
        outcomes.begin(), outcomes.end(), [kind](const auto& kv) {
            const auto* f = std::get_if<FetchFailure>(&kv.second);
            return f != nullptr && f->error == kind;
        }));
}

std::size_t FetchReport::failure_count() const noexcept {
    return outcomes.size() - success_count();
}

// ─── Fetcher ──────────────────────────────────────────────────────────────────

Sleeper real_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

Fetcher::Fetcher(BarSource& source, CredentialPool& pool,
                 FetcherConfig config, Sleeper sleeper)
    : source_(source)
    , pool_(pool)
    , config_(config)
    , sleeper_(std::move(sleeper)) {}

namespace {

/// Check a successful source response against the request.
std::optional<std::string> reject_reason(const Bar& bar, const Instrument& instrument,
                                         TradingDate date) {
    if (bar.code != instrument.code) {
        return fmt::format("bar code '{}' does not match request", bar.code);
    }
    if (bar.date != date) {
        return fmt::format("bar dated {} does not match request", bar.date.to_string());
    }
    if (!core::DataLoader::validate_bar(bar)) {
        return std::string("bar fails OHLCV validation");
    }
    return std::nullopt;
}

}  // namespace

FetchOutcome Fetcher::fetch_one(const Instrument& instrument, TradingDate date) const {
    if (instrument.status == ListingStatus::Delisted) {
        return FetchFailure{.error = FetchError::NotFound, .reason = "delisted", .attempts = 0};
    }

    RetryMachine machine(config_.retry);
    std::optional<CredentialPool::Lease> lease;
    FetchFailure last{.error = FetchError::Transient, .reason = "no attempt made", .attempts = 0};

    while (!machine.terminal()) {
        switch (machine.state()) {
            case AttemptState::Attempting: {
                if (!lease) {
                    lease = pool_.checkout();
                }
                if (!lease) {
                    last = FetchFailure{.error = FetchError::Transient,
                                        .reason = "no credential available before checkout timeout"};
                    machine.on_failure(FetchError::Transient);
                    break;
                }

                FetchOutcome outcome;
                try {
                    outcome = source_.fetch(instrument, date, lease->credential());
                } catch (const std::exception& e) {
                    outcome = FetchFailure{.error = FetchError::Transient,
                                           .reason = fmt::format("source threw: {}", e.what())};
                } catch (...) {
                    outcome = FetchFailure{.error = FetchError::Transient,
                                           .reason = "source threw a non-standard exception"};
                }

                if (auto* bar = std::get_if<Bar>(&outcome)) {
                    if (auto reason = reject_reason(*bar, instrument, date)) {
                        outcome = FetchFailure{.error = FetchError::MalformedPayload,
                                               .reason = std::move(*reason)};
                    } else {
                        lease->report_success();
                        machine.on_success();
                        return std::move(*bar);
                    }
                }

                last = std::get<FetchFailure>(std::move(outcome));
                if (last.error == FetchError::RateLimited) {
                    lease->report_rate_limited();
                }
                machine.on_failure(last.error);
                spdlog::debug("fetch {} {} attempt {}: {} ({})", instrument.code,
                              date.to_string(), machine.attempts(),
                              to_string(last.error), last.reason);
                break;
            }

            case AttemptState::Backoff:
                sleeper_(machine.backoff());
                machine.backoff_elapsed();
                break;

            case AttemptState::RotatingCredential: {
                // Returning the entry first makes it the most recently used,
                // so LRU checkout prefers any other idle entry.
                const std::string previous = lease ? lease->credential().id : std::string{};
                lease.reset();
                lease = pool_.checkout();
                spdlog::debug("fetch {} rotated credential '{}' -> '{}'", instrument.code,
                              previous, lease ? lease->credential().id : "<none>");
                machine.rotated();
                break;
            }

            case AttemptState::Exhausted:
            case AttemptState::Succeeded:
            case AttemptState::Abandoned:
                break;
        }
    }

    last.attempts = machine.attempts();
    if (last.error == FetchError::MalformedPayload) {
        spdlog::warn("malformed payload for {} on {}: {} (upstream schema change?)",
                     instrument.code, date.to_string(), last.reason);
    }
    return last;
}

FetchReport Fetcher::fetch(std::span<const Instrument> universe, TradingDate date) const {
    std::vector<FetchOutcome> slots(universe.size());
    core::parallel_for(universe.size(), config_.workers, [&](std::size_t i) {
        slots[i] = fetch_one(universe[i], date);
    });

    FetchReport report{.date = date, .outcomes = {}};
    for (std::size_t i = 0; i < universe.size(); ++i) {
        report.outcomes.insert_or_assign(universe[i].code, std::move(slots[i]));
    }

    spdlog::info("fetched {}: {} ok, {} not found, {} rate limited, {} transient, {} malformed",
                 date.to_string(), report.success_count(),
                 report.failure_count(FetchError::NotFound),
                 report.failure_count(FetchError::RateLimited),
                 report.failure_count(FetchError::Transient),
                 report.failure_count(FetchError::MalformedPayload));
    return report;
}

}  // namespace sift::fetch
