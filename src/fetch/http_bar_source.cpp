/// @file src/fetch/http_bar_source.cpp
/// @brief libcurl-backed BarSource.

#include "sift/bar_sources.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace sift::fetch {

namespace {

/// Process-wide libcurl initialisation, performed once before the first
/// easy handle is created.
class CurlGlobal {
public:
    CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (ok_) curl_global_cleanup();
    }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }

private:
    bool ok_;
};

const CurlGlobal& curl_global() {
    static const CurlGlobal instance;
    return instance;
}

struct EasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

/// Transport-level failures: timeouts, refused connections, DNS, TLS.
FetchFailure transport_failure(CURLcode code) {
    return FetchFailure{.error  = FetchError::Transient,
                        .reason = fmt::format("transport: {}", curl_easy_strerror(code))};
}

}  // namespace

HttpBarSource::HttpBarSource(HttpSourceConfig config)
    : config_(std::move(config)) {
    if (!curl_global().ok()) {
        spdlog::error("libcurl global initialisation failed; every HTTP fetch will fail");
    }
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

std::string HttpBarSource::url_for(const Instrument& instrument, TradingDate date) const {
    return fmt::format("{}/{}?date={}", config_.base_url, instrument.code, date.to_string());
}

FetchOutcome HttpBarSource::classify_response(long status, std::string_view body,
                                              const Instrument& instrument,
                                              TradingDate date) {
    if (status == 200) {
        return FileBarSource::find_row(body, instrument, date);
    }
    if (status == 404) {
        return FetchFailure{.error = FetchError::NotFound, .reason = "HTTP 404"};
    }
    if (status == 403 || status == 429) {
        return FetchFailure{.error  = FetchError::RateLimited,
                            .reason = fmt::format("HTTP {}", status)};
    }
    if (status == 408 || (status >= 500 && status <= 599)) {
        return FetchFailure{.error  = FetchError::Transient,
                            .reason = fmt::format("HTTP {}", status)};
    }
    return FetchFailure{.error  = FetchError::MalformedPayload,
                        .reason = fmt::format("unexpected HTTP status {}", status)};
}

FetchOutcome HttpBarSource::fetch(const Instrument& instrument, TradingDate date,
                                  const Credential& credential) {
    if (!curl_global().ok()) {
        return FetchFailure{.error = FetchError::Transient, .reason = "libcurl unavailable"};
    }

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        return FetchFailure{.error = FetchError::Transient, .reason = "curl_easy_init failed"};
    }
    CURL* h = handle.get();

    const std::string url = url_for(instrument, date);
    std::string body;

    HeaderList headers;
    if (!credential.token.empty()) {
        const std::string auth = "Authorization: Bearer " + credential.token;
        headers.reset(curl_slist_append(nullptr, auth.c_str()));
    }

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    if (headers) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    }
    if (!credential.proxy.empty()) {
        curl_easy_setopt(h, CURLOPT_PROXY, credential.proxy.c_str());
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        return transport_failure(rc);
    }

    long status = 0;
    if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
        return FetchFailure{.error = FetchError::Transient, .reason = "no HTTP status"};
    }
    return classify_response(status, body, instrument, date);
}

}  // namespace sift::fetch
