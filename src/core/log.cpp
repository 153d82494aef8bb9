/// @file src/core/log.cpp
/// @brief spdlog logger construction.

#include "sift/log.hpp"

#include <fmt/core.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <memory>
#include <vector>

namespace sift::core {

std::optional<spdlog::level::level_enum>
parse_log_level(std::string_view name) noexcept {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

bool init_logging(spdlog::level::level_enum level,
                  const std::optional<std::string>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool file_ok = true;
    if (log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *log_file, 10 * 1024 * 1024, 5));
        } catch (const spdlog::spdlog_ex& e) {
            file_ok = false;
            fmt::print(stderr, "cannot open log file '{}': {}\n", *log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("sift", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
    return file_ok;
}

int run_guarded(const std::function<int()>& body, int failure_code) noexcept {
    try {
        return body();
    } catch (const std::exception& e) {
        spdlog::error("fatal: {}", e.what());
    } catch (...) {
        spdlog::error("fatal: non-standard exception");
    }
    return failure_code;
}

}  // namespace sift::core
