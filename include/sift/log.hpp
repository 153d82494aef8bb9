#pragma once

/// @file include/sift/log.hpp
/// @brief spdlog setup for the pipeline.
///
/// Modules log through the default spdlog logger (`spdlog::info(...)` etc.).
/// `init_logging` replaces it with a logger named "sift" writing to stderr
/// and, optionally, to a rotating file.

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sift::core {

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
[[nodiscard]] std::optional<spdlog::level::level_enum>
parse_log_level(std::string_view name) noexcept;

/// Install the "sift" logger as the spdlog default.
///
/// # Arguments
/// * `level`   : Minimum level emitted by every sink
/// * `log_file`: Optional path for a rotating file sink (5 × 10 MiB)
///
/// # Returns
/// `false` if the file sink could not be created; the console logger is
/// installed regardless.
bool init_logging(spdlog::level::level_enum level,
                  const std::optional<std::string>& log_file = std::nullopt);

/// Run `body`, logging any exception that escapes it as an error.
///
/// # Returns
/// The value `body` returns, or `failure_code` when it throws.
int run_guarded(const std::function<int()>& body, int failure_code) noexcept;

}  // namespace sift::core
