#pragma once

/// @file include/sift/bar_sources.hpp
/// @brief Concrete BarSource implementations: HTTP (libcurl) and local CSV.

#include "sift/constants.hpp"
#include "sift/fetcher.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sift::fetch {

// ─── HttpBarSource ────────────────────────────────────────────────────────────

struct HttpSourceConfig {
    /// Base URL; a request goes to `{base_url}/{code}?date=YYYY-MM-DD`.
    std::string               base_url;
    std::chrono::milliseconds connect_timeout = constants::DEFAULT_CONNECT_TIMEOUT;
    std::chrono::milliseconds request_timeout = constants::DEFAULT_REQUEST_TIMEOUT;
    std::string               user_agent      = "sift/1.0";
};

/// Daily bars over HTTP.
///
/// The credential's token is sent as `Authorization: Bearer <token>` and its
/// proxy (if any) is used for the connection. The response body is bar CSV
/// as understood by `core::DataLoader`.
class HttpBarSource final : public BarSource {
public:
    explicit HttpBarSource(HttpSourceConfig config);

    [[nodiscard]] FetchOutcome fetch(const Instrument& instrument,
                                     TradingDate date,
                                     const Credential& credential) override;

    /// Map a completed HTTP exchange to an outcome.
    ///
    /// | status          | outcome                                        |
    /// |-----------------|------------------------------------------------|
    /// | 200             | Bar for `date`, NotFound if absent, Malformed  |
    /// |                 | if the body is not bar CSV or the row is bad   |
    /// | 404             | NotFound                                       |
    /// | 403, 429        | RateLimited                                    |
    /// | 5xx, 408        | Transient                                      |
    /// | anything else   | MalformedPayload                               |
    [[nodiscard]] static FetchOutcome classify_response(long status,
                                                        std::string_view body,
                                                        const Instrument& instrument,
                                                        TradingDate date);

    [[nodiscard]] std::string url_for(const Instrument& instrument, TradingDate date) const;

private:
    HttpSourceConfig config_;
};

// ─── FileBarSource ────────────────────────────────────────────────────────────

/// Offline source reading `<directory>/<code>.csv`.
///
/// File contents are cached after the first read; concurrent calls are safe.
class FileBarSource final : public BarSource {
public:
    explicit FileBarSource(std::string directory);

    [[nodiscard]] FetchOutcome fetch(const Instrument& instrument,
                                     TradingDate date,
                                     const Credential& credential) override;

    /// Find the row for `date` in bar CSV `content`.
    ///
    /// Content without the bar CSV header is `MalformedPayload`, never
    /// `NotFound`: an HTML error page or a changed schema must not read as a
    /// missing instrument.
    [[nodiscard]] static FetchOutcome find_row(std::string_view content,
                                               const Instrument& instrument,
                                               TradingDate date);

private:
    std::string directory_;
    std::mutex  mtx_;
    std::map<std::string, std::optional<std::string>> cache_;  ///< nullopt = missing file
};

}  // namespace sift::fetch
