/// @file src/fetch/file_bar_source.cpp
/// @brief Offline BarSource over a directory of per-instrument CSV files.

#include "sift/bar_sources.hpp"
#include "sift/data_loader.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

namespace sift::fetch {

FileBarSource::FileBarSource(std::string directory)
    : directory_(std::move(directory)) {}

FetchOutcome FileBarSource::find_row(std::string_view content,
                                     const Instrument& instrument,
                                     TradingDate date) {
    if (!core::DataLoader::has_bar_header(content)) {
        return FetchFailure{.error  = FetchError::MalformedPayload,
                            .reason = "payload is not bar CSV (missing header)"};
    }

    const std::string key = date.to_string();
    std::size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) end = content.size();
        std::string_view line = content.substr(start, end - start);
        start = end + 1;

        const auto first = line.find_first_not_of(" \t");
        if (first == std::string_view::npos) continue;
        line.remove_prefix(first);
        if (!line.starts_with(key)) continue;
        if (line.size() > key.size() && line[key.size()] != ',' && line[key.size()] != ' ') {
            continue;
        }

        if (auto bar = core::DataLoader::parse_bar_row(line, instrument.code)) {
            return std::move(*bar);
        }
        return FetchFailure{.error  = FetchError::MalformedPayload,
                            .reason = fmt::format("unparsable row for {}", key)};
    }
    return FetchFailure{.error = FetchError::NotFound,
                        .reason = fmt::format("no row for {}", key)};
}

FetchOutcome FileBarSource::fetch(const Instrument& instrument, TradingDate date,
                                  const Credential& /*credential*/) {
    std::optional<std::string> content;
    {
        std::lock_guard lock(mtx_);
        auto it = cache_.find(instrument.code);
        if (it == cache_.end()) {
            const std::string path = fmt::format("{}/{}.csv", directory_, instrument.code);
            std::optional<std::string> loaded;
            std::ifstream file(path);
            if (file.is_open()) {
                std::ostringstream buf;
                buf << file.rdbuf();
                loaded = buf.str();
            }
            it = cache_.emplace(instrument.code, std::move(loaded)).first;
        }
        content = it->second;
    }

    if (!content) {
        return FetchFailure{.error = FetchError::NotFound,
                            .reason = fmt::format("no file for {}", instrument.code)};
    }
    return find_row(*content, instrument, date);
}

}  // namespace sift::fetch
