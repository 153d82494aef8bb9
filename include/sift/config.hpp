#pragma once

/// @file include/sift/config.hpp
/// @brief Pipeline configuration: defaults, environment overrides, validation.
///
/// Precedence: built-in defaults < `SIFT_*` environment variables < CLI
/// flags (applied by the caller after `apply_environment`).
///
/// | Variable           | Field                                   |
/// |--------------------|-----------------------------------------|
/// | `SIFT_DB`          | `db_path`                               |
/// | `SIFT_SOURCE_DIR`  | `source_dir`                            |
/// | `SIFT_HTTP_URL`    | `http_url`                              |
/// | `SIFT_UNIVERSE`    | `universe_path`                         |
/// | `SIFT_CREDENTIALS` | `credentials_path`                      |
/// | `SIFT_HOLIDAYS`    | `holidays_path`                         |
/// | `SIFT_WORKERS`     | fetch and compute worker counts         |
/// | `SIFT_PATTERNS`    | `candlestick_patterns` (on/off)         |
/// | `SIFT_LOG_LEVEL`   | `log_level`                             |
/// | `SIFT_LOG_FILE`    | `log_file`                              |

#include "sift/fetcher.hpp"
#include "sift/orchestrator.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift::core {

struct PipelineConfig {
    std::string                db_path       = "sift.db";
    std::optional<std::string> source_dir;
    std::optional<std::string> http_url;
    std::string                universe_path = "universe.csv";
    std::optional<std::string> credentials_path;
    std::optional<std::string> holidays_path;
    std::string                log_level     = "info";
    std::optional<std::string> log_file;

    /// Compute the candlestick pattern indicators alongside the built-ins.
    bool candlestick_patterns = true;

    /// Strategy allow-list; empty runs every registered strategy.
    std::vector<std::string> strategies;

    fetch::FetcherConfig         fetcher{};
    fetch::PoolConfig            pool{};
    engine::OrchestratorConfig   orchestrator{};

    /// Sets both the fetch and the compute worker counts.
    void set_workers(std::size_t n) noexcept;
};

/// Lookup of one environment variable.
using Environment = std::function<std::optional<std::string>(std::string_view)>;

/// `std::getenv`-backed lookup; empty values count as unset.
[[nodiscard]] Environment process_environment();

/// Apply every `SIFT_*` variable present in `env`.
///
/// # Returns
/// One message per invalid value; valid values are applied regardless.
[[nodiscard]] std::vector<std::string>
apply_environment(PipelineConfig& config, const Environment& env);

/// Check a configuration before a pipeline run.
///
/// # Returns
/// One message per problem; empty when the configuration is usable.
[[nodiscard]] std::vector<std::string> validate_for_run(const PipelineConfig& config);

/// Parse a strictly positive count ("8"). `nullopt` otherwise.
[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view text) noexcept;

/// Parse on/off, true/false, yes/no or 1/0 (case-insensitive).
[[nodiscard]] std::optional<bool> parse_switch(std::string_view text);

/// Split "a,b,,c" into {"a", "b", "c"}; fields are trimmed.
[[nodiscard]] std::vector<std::string> split_list(std::string_view text);

}  // namespace sift::core
