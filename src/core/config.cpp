/// @file src/core/config.cpp
/// @brief PipelineConfig environment overrides and validation.

#include "sift/config.hpp"
#include "sift/data_loader.hpp"
#include "sift/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace sift::core {

void PipelineConfig::set_workers(std::size_t n) noexcept {
    fetcher.workers              = n;
    orchestrator.compute_workers = n;
}

Environment process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        const char* value = std::getenv(key.c_str());
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };
}

std::optional<std::size_t> parse_count(std::string_view text) noexcept {
    std::size_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value == 0) return std::nullopt;
    return value;
}

std::optional<bool> parse_switch(std::string_view text) {
    std::string lower(text.size(), '\0');
    std::transform(text.begin(), text.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "on" || lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "off" || lower == "false" || lower == "no" || lower == "0") return false;
    return std::nullopt;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> out;
    for (auto& field : DataLoader::split_fields(text)) {
        if (!field.empty()) out.push_back(std::move(field));
    }
    return out;
}

std::vector<std::string>
apply_environment(PipelineConfig& config, const Environment& env) {
    std::vector<std::string> errors;

    if (auto v = env("SIFT_DB"))          config.db_path          = *v;
    if (auto v = env("SIFT_SOURCE_DIR"))  config.source_dir       = *v;
    if (auto v = env("SIFT_HTTP_URL"))    config.http_url         = *v;
    if (auto v = env("SIFT_UNIVERSE"))    config.universe_path    = *v;
    if (auto v = env("SIFT_CREDENTIALS")) config.credentials_path = *v;
    if (auto v = env("SIFT_HOLIDAYS"))    config.holidays_path    = *v;
    if (auto v = env("SIFT_LOG_FILE"))    config.log_file         = *v;

    if (auto v = env("SIFT_WORKERS")) {
        if (const auto n = parse_count(*v)) {
            config.set_workers(*n);
        } else {
            errors.push_back(fmt::format("SIFT_WORKERS: '{}' is not a positive integer", *v));
        }
    }
    if (auto v = env("SIFT_PATTERNS")) {
        if (const auto on = parse_switch(*v)) {
            config.candlestick_patterns = *on;
        } else {
            errors.push_back(fmt::format("SIFT_PATTERNS: '{}' is not on or off", *v));
        }
    }
    if (auto v = env("SIFT_LOG_LEVEL")) {
        if (parse_log_level(*v)) {
            config.log_level = *v;
        } else {
            errors.push_back(fmt::format("SIFT_LOG_LEVEL: unknown level '{}'", *v));
        }
    }
    return errors;
}

std::vector<std::string> validate_for_run(const PipelineConfig& config) {
    std::vector<std::string> errors;

    if (config.source_dir && config.http_url) {
        errors.emplace_back("both a source directory and an HTTP URL are set; choose one");
    } else if (!config.source_dir && !config.http_url) {
        errors.emplace_back("no bar source: set SIFT_SOURCE_DIR / --source-dir "
                            "or SIFT_HTTP_URL / --http-url");
    }
    if (config.http_url && config.http_url->rfind("http", 0) != 0) {
        errors.push_back(fmt::format("HTTP URL '{}' must start with http:// or https://",
                                     *config.http_url));
    }
    if (config.db_path.empty())       errors.emplace_back("database path is empty");
    if (config.universe_path.empty()) errors.emplace_back("universe path is empty");
    if (!parse_log_level(config.log_level)) {
        errors.push_back(fmt::format("unknown log level '{}'", config.log_level));
    }
    if (config.fetcher.workers == 0 || config.orchestrator.compute_workers == 0) {
        errors.emplace_back("worker counts must be positive");
    }
    if (config.fetcher.retry.max_attempts < 1) {
        errors.emplace_back("max attempts must be at least 1");
    }
    if (config.orchestrator.history_bars < config.orchestrator.strategy_rows) {
        errors.push_back(fmt::format("history_bars ({}) is smaller than strategy_rows ({})",
                                     config.orchestrator.history_bars,
                                     config.orchestrator.strategy_rows));
    }
    if (config.orchestrator.commit_attempts < 1) {
        errors.emplace_back("commit attempts must be at least 1");
    }
    return errors;
}

}  // namespace sift::core
