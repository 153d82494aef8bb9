/// @file src/main.cpp
/// @brief SIFT CLI entry point.
///
/// Usage:
///   sift run --date D | --dates D1,D2,... | --from D1 --to D2
///   sift matches --date D [--strategy S]
///   sift bars --code C --from D1 --to D2
///   sift indicators --code C --date D
///   sift rates --date D [--horizon N] [--strategy S]
///   sift strategies
///   sift --help
///
/// Common options override the SIFT_* environment:
///   --db PATH  --source-dir DIR  --http-url URL  --universe PATH
///   --credentials PATH  --holidays PATH  --workers N  --strategies A,B
///   --log-level LEVEL  --log-file PATH  --patterns on|off

#include "sift/bar_sources.hpp"
#include "sift/calendar.hpp"
#include "sift/config.hpp"
#include "sift/data_loader.hpp"
#include "sift/forward_returns.hpp"
#include "sift/log.hpp"
#include "sift/orchestrator.hpp"
#include "sift/store.hpp"
#include "sift/strategy.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

constexpr int EXIT_OK     = 0;
constexpr int EXIT_ERROR  = 1;
constexpr int EXIT_CONFIG = 2;

std::atomic<bool> g_shutdown_requested{false};

extern "C" void on_signal(int /*sig*/) {
    g_shutdown_requested.store(true);
}

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  sift run --date D | --dates D1,D2,... | --from D1 --to D2\n"
        "  sift matches --date D [--strategy S]\n"
        "  sift bars --code C --from D1 --to D2\n"
        "  sift indicators --code C --date D\n"
        "  sift rates --date D [--horizon N] [--strategy S]\n"
        "  sift strategies\n"
        "\n"
        "Options (override SIFT_* environment variables):\n"
        "  --db PATH           SQLite database (SIFT_DB)\n"
        "  --source-dir DIR    Offline bar CSV directory (SIFT_SOURCE_DIR)\n"
        "  --http-url URL      HTTP bar endpoint (SIFT_HTTP_URL)\n"
        "  --universe PATH     Universe CSV: code,name,status (SIFT_UNIVERSE)\n"
        "  --credentials PATH  id,token,proxy per line (SIFT_CREDENTIALS)\n"
        "  --holidays PATH     One YYYY-MM-DD per line (SIFT_HOLIDAYS)\n"
        "  --workers N         Fetch and compute workers (SIFT_WORKERS)\n"
        "  --strategies A,B    Run only these strategies\n"
        "  --patterns on|off   Candlestick pattern indicators (SIFT_PATTERNS)\n"
        "  --log-level LEVEL   trace|debug|info|warn|error (SIFT_LOG_LEVEL)\n"
        "  --log-file PATH     Rotating log file (SIFT_LOG_FILE)\n"
        "\n"
        "Dates are YYYY-MM-DD.\n");
}

// ─── Argument handling ────────────────────────────────────────────────────────

/// `--key value` pairs after the command.
using Flags = std::map<std::string, std::string, std::less<>>;

std::optional<Flags> parse_flags(int argc, char* argv[], int first) {
    Flags flags;
    for (int i = first; i < argc; ++i) {
        const std::string key(argv[i]);
        if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
            fmt::print(stderr, "Error: expected '--option value', got '{}'\n", key);
            return std::nullopt;
        }
        flags.insert_or_assign(key.substr(2), std::string(argv[++i]));
    }
    return flags;
}

std::optional<std::string> flag(const Flags& flags, std::string_view key) {
    const auto it = flags.find(key);
    if (it == flags.end()) return std::nullopt;
    return it->second;
}

std::optional<sift::TradingDate> date_flag(const Flags& flags, std::string_view key) {
    const auto v = flag(flags, key);
    if (!v) {
        fmt::print(stderr, "Error: --{} is required\n", key);
        return std::nullopt;
    }
    const auto d = sift::TradingDate::parse(*v);
    if (!d) fmt::print(stderr, "Error: --{} '{}' is not a YYYY-MM-DD date\n", key, *v);
    return d;
}

/// Apply the common CLI options on top of the environment.
std::vector<std::string> apply_flags(sift::core::PipelineConfig& config, const Flags& flags) {
    std::vector<std::string> errors;
    if (auto v = flag(flags, "db"))          config.db_path          = *v;
    if (auto v = flag(flags, "source-dir"))  config.source_dir       = *v;
    if (auto v = flag(flags, "http-url"))    config.http_url         = *v;
    if (auto v = flag(flags, "universe"))    config.universe_path    = *v;
    if (auto v = flag(flags, "credentials")) config.credentials_path = *v;
    if (auto v = flag(flags, "holidays"))    config.holidays_path    = *v;
    if (auto v = flag(flags, "log-file"))    config.log_file         = *v;
    if (auto v = flag(flags, "log-level"))   config.log_level        = *v;
    if (auto v = flag(flags, "strategies"))  config.strategies       = sift::core::split_list(*v);
    if (auto v = flag(flags, "patterns")) {
        if (const auto on = sift::core::parse_switch(*v)) {
            config.candlestick_patterns = *on;
        } else {
            errors.push_back(fmt::format("--patterns: '{}' is not on or off", *v));
        }
    }
    if (auto v = flag(flags, "workers")) {
        if (const auto n = sift::core::parse_count(*v)) {
            config.set_workers(*n);
        } else {
            errors.push_back(fmt::format("--workers: '{}' is not a positive integer", *v));
        }
    }
    return errors;
}

int report_config_errors(const std::vector<std::string>& errors) {
    for (const auto& e : errors) fmt::print(stderr, "Configuration error: {}\n", e);
    return EXIT_CONFIG;
}

std::unique_ptr<sift::store::SqliteStore> open_store(const sift::core::PipelineConfig& config) {
    auto opened = sift::store::SqliteStore::open(config.db_path);
    if (auto* f = std::get_if<sift::store::StoreFailure>(&opened)) {
        spdlog::error("cannot open store {}: {}", config.db_path, f->detail);
        return nullptr;
    }
    return std::move(std::get<std::unique_ptr<sift::store::SqliteStore>>(opened));
}

// ─── Commands ─────────────────────────────────────────────────────────────────

int run_pipeline(const sift::core::PipelineConfig& config, const Flags& flags) {
    using namespace sift;

    if (auto errors = core::validate_for_run(config); !errors.empty()) {
        return report_config_errors(errors);
    }

    core::TradingCalendar calendar;
    if (config.holidays_path) {
        auto loaded = core::TradingCalendar::load_holidays(*config.holidays_path);
        if (!loaded) {
            return report_config_errors({fmt::format("cannot read holidays '{}'",
                                                     *config.holidays_path)});
        }
        calendar = std::move(*loaded);
    }

    // ── Dates ────────────────────────────────────────────────────────────────
    std::vector<TradingDate> requested;
    bool explicit_list = true;
    if (auto one = flag(flags, "date")) {
        const auto d = TradingDate::parse(*one);
        if (!d) return report_config_errors({fmt::format("--date '{}' is not a date", *one)});
        requested.push_back(*d);
    } else if (auto many = flag(flags, "dates")) {
        for (const auto& text : core::split_list(*many)) {
            const auto d = TradingDate::parse(text);
            if (!d) return report_config_errors({fmt::format("--dates: '{}' is not a date", text)});
            requested.push_back(*d);
        }
    } else if (flag(flags, "from") || flag(flags, "to")) {
        const auto from = date_flag(flags, "from");
        const auto to   = date_flag(flags, "to");
        if (!from || !to) return EXIT_CONFIG;
        requested     = calendar.trading_days(DateRange{.first = *from, .last = *to});
        explicit_list = false;
    } else {
        return report_config_errors({"run needs --date, --dates or --from/--to"});
    }

    std::vector<TradingDate> dates;
    for (const auto d : requested) {
        if (explicit_list && !calendar.is_trading_day(d)) {
            spdlog::info("{} is not a trading day; skipped", d.to_string());
            continue;
        }
        dates.push_back(d);
    }
    if (dates.empty()) {
        fmt::print("No trading days to run.\n");
        return EXIT_OK;
    }

    // ── Wiring ───────────────────────────────────────────────────────────────
    auto universe = core::DataLoader::load_universe(config.universe_path);
    if (!universe) {
        return report_config_errors({fmt::format("cannot read universe '{}'",
                                                 config.universe_path)});
    }

    std::vector<fetch::Credential> credentials;
    if (config.credentials_path) {
        auto loaded = fetch::CredentialPool::load(*config.credentials_path);
        if (!loaded) {
            return report_config_errors({fmt::format("cannot read credentials '{}'",
                                                     *config.credentials_path)});
        }
        credentials = std::move(*loaded);
    }
    fetch::CredentialPool pool(std::move(credentials), config.pool);

    strategy::StrategyRegistry registry;
    strategy::register_builtin_strategies(registry);
    std::optional<strategy::StrategySet> strategies =
        config.strategies.empty() ? std::optional(registry.snapshot())
                                  : registry.snapshot(config.strategies);
    if (!strategies) {
        return report_config_errors({fmt::format("unknown strategy in '{}'",
                                                 fmt::join(config.strategies, ","))});
    }

    auto store = open_store(config);
    if (!store) return EXIT_ERROR;

    std::unique_ptr<fetch::BarSource> source;
    if (config.http_url) {
        source = std::make_unique<fetch::HttpBarSource>(
            fetch::HttpSourceConfig{.base_url = *config.http_url});
    } else {
        source = std::make_unique<fetch::FileBarSource>(*config.source_dir);
    }

    const fetch::Fetcher fetcher(*source, pool, config.fetcher);
    const engine::Orchestrator orchestrator(
        fetcher,
        indicator::IndicatorEngine(indicator::pipeline_indicator_set(config.candlestick_patterns)),
        strategy::StrategyEngine(std::move(*strategies), config.orchestrator.compute_workers),
        *store, config.orchestrator);

    // ── Cancellation ─────────────────────────────────────────────────────────
    std::stop_source stop;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::jthread watcher([&stop](std::stop_token done) {
        while (!done.stop_requested()) {
            if (g_shutdown_requested.load()) {
                spdlog::warn("shutdown requested; finishing the current date");
                stop.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    spdlog::info("running {} date(s) over {} instruments", dates.size(), universe->size());
    const auto report = orchestrator.run(dates, *universe, stop.get_token());
    watcher.request_stop();

    fmt::print("{}\n", report.to_string());
    return report.exit_code();
}

int show_matches(const sift::store::Store& store, const Flags& flags) {
    const auto date = date_flag(flags, "date");
    if (!date) return EXIT_CONFIG;
    const auto strategy = flag(flags, "strategy");

    auto results = strategy ? store.get_strategy_results(*date, strategy)
                            : sift::store::list_matches(store, *date);
    if (auto* f = std::get_if<sift::store::StoreFailure>(&results)) {
        spdlog::error("matches: {}", f->detail);
        return EXIT_ERROR;
    }
    for (const auto& r : std::get<std::vector<sift::StrategyResult>>(results)) {
        fmt::print("{:<24} {:<10} {:>10.4f}\n", r.strategy, r.code, r.score);
    }
    return EXIT_OK;
}

int show_bars(const sift::store::Store& store, const Flags& flags) {
    const auto code = flag(flags, "code");
    if (!code) return report_config_errors({"--code is required"});
    const auto from = date_flag(flags, "from");
    const auto to   = date_flag(flags, "to");
    if (!from || !to) return EXIT_CONFIG;

    auto bars = store.get_bars(*code, sift::DateRange{.first = *from, .last = *to});
    if (auto* f = std::get_if<sift::store::StoreFailure>(&bars)) {
        spdlog::error("bars: {}", f->detail);
        return EXIT_ERROR;
    }
    fmt::print("date,open,high,low,close,volume,amount\n");
    for (const auto& b : std::get<std::vector<sift::Bar>>(bars)) {
        fmt::print("{},{},{},{},{},{},{}\n", b.date.to_string(), b.open, b.high, b.low,
                   b.close, b.volume, b.amount);
    }
    return EXIT_OK;
}

int show_indicators(const sift::store::Store& store, const Flags& flags) {
    const auto code = flag(flags, "code");
    if (!code) return report_config_errors({"--code is required"});
    const auto date = date_flag(flags, "date");
    if (!date) return EXIT_CONFIG;

    auto row = store.get_indicators(*code, *date);
    if (auto* f = std::get_if<sift::store::StoreFailure>(&row)) {
        spdlog::error("indicators: {}", f->detail);
        return EXIT_ERROR;
    }
    const auto& found = std::get<std::optional<sift::IndicatorRow>>(row);
    if (!found) {
        fmt::print(stderr, "No indicator row for {} on {}\n", *code, date->to_string());
        return EXIT_ERROR;
    }
    for (const auto& [name, value] : found->values) {
        if (value) {
            fmt::print("{:<26} {:.4f}\n", name, *value);
        } else {
            fmt::print("{:<26} -\n", name);
        }
    }
    return EXIT_OK;
}

int show_rates(const sift::store::Store& store, const Flags& flags) {
    const auto date = date_flag(flags, "date");
    if (!date) return EXIT_CONFIG;
    std::size_t horizon = sift::backtest::DEFAULT_HORIZON;
    if (auto v = flag(flags, "horizon")) {
        const auto n = sift::core::parse_count(*v);
        if (!n) return report_config_errors({fmt::format("--horizon: '{}' is invalid", *v)});
        horizon = *n;
    }

    auto rates = sift::backtest::forward_returns(store, *date, horizon, flag(flags, "strategy"));
    if (auto* f = std::get_if<sift::store::StoreFailure>(&rates)) {
        spdlog::error("rates: {}", f->detail);
        return EXIT_ERROR;
    }
    for (const auto& fr : std::get<std::vector<sift::backtest::ForwardReturns>>(rates)) {
        std::string line = fmt::format("{},{},{}", fr.date.to_string(), fr.strategy, fr.code);
        for (const auto& r : fr.rates) {
            line += r ? fmt::format(",{:.2f}", *r) : std::string(",");
        }
        fmt::print("{}\n", line);
    }
    return EXIT_OK;
}

int list_strategies() {
    sift::strategy::StrategyRegistry registry;
    sift::strategy::register_builtin_strategies(registry);
    const auto set = registry.snapshot();
    for (const auto& s : set.strategies()) {
        fmt::print("{:<24} lookback={}\n", s->name(), s->lookback());
    }
    return EXIT_OK;
}

int run_command(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_ERROR;
    }

    const std::string command(argv[1]);
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return EXIT_OK;
    }
    if (command == "strategies") {
        return list_strategies();
    }

    const auto flags = parse_flags(argc, argv, 2);
    if (!flags) {
        print_usage();
        return EXIT_CONFIG;
    }

    sift::core::PipelineConfig config;
    auto errors = sift::core::apply_environment(config, sift::core::process_environment());
    auto flag_errors = apply_flags(config, *flags);
    errors.insert(errors.end(), flag_errors.begin(), flag_errors.end());
    const auto level = sift::core::parse_log_level(config.log_level);
    if (!level) errors.push_back(fmt::format("unknown log level '{}'", config.log_level));
    if (!errors.empty()) return report_config_errors(errors);

    if (!sift::core::init_logging(*level, config.log_file)) {
        spdlog::warn("log file {} unavailable; logging to stderr only", *config.log_file);
    }

    if (command == "run") {
        return run_pipeline(config, *flags);
    }

    const auto store = open_store(config);
    if (!store) return EXIT_ERROR;

    if (command == "matches")    return show_matches(*store, *flags);
    if (command == "bars")       return show_bars(*store, *flags);
    if (command == "indicators") return show_indicators(*store, *flags);
    if (command == "rates")      return show_rates(*store, *flags);

    fmt::print(stderr, "Unknown command: {}\n", command);
    print_usage();
    return EXIT_CONFIG;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    return sift::core::run_guarded([&] { return run_command(argc, argv); }, EXIT_ERROR);
}
