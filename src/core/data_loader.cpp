/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for daily bars and the instrument universe.

#include "sift/data_loader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

namespace sift::core {

namespace {

/// Strict double parse: the whole token must be consumed and finite.
std::optional<double> parse_double(const std::string& token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(val)) {
            return std::nullopt;
        }
        return val;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Iterate the data lines of a CSV document, skipping the header, blank
/// lines and `#` comments.
template <typename Fn>
void for_each_data_line(std::string_view content, Fn&& fn) {
    std::istringstream stream{std::string(content)};
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        fn(std::string_view(line));
    }
}

}  // namespace

// ─── DataLoader::split_fields ─────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_fields(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (start <= line.size()) {
        const auto comma = line.find(',', start);
        const auto end = comma == std::string_view::npos ? line.size() : comma;
        std::string_view token = line.substr(start, end - start);

        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        fields.emplace_back(first == std::string_view::npos
                                ? std::string_view{}
                                : token.substr(first, last - first + 1));

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return fields;
}

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const Bar& bar) noexcept {
    // All fields must be finite.
    if (!std::isfinite(bar.open)   ||
        !std::isfinite(bar.high)   ||
        !std::isfinite(bar.low)    ||
        !std::isfinite(bar.close)  ||
        !std::isfinite(bar.volume) ||
        !std::isfinite(bar.amount)) {
        return false;
    }

    // OHLC consistency.
    if (bar.high < bar.low)   return false;
    if (bar.open  > bar.high) return false;
    if (bar.open  < bar.low)  return false;
    if (bar.close > bar.high) return false;
    if (bar.close < bar.low)  return false;

    if (bar.volume < 0.0) return false;
    if (bar.amount < 0.0) return false;

    return true;
}

// ─── DataLoader::has_bar_header ───────────────────────────────────────────────

bool DataLoader::has_bar_header(std::string_view content) noexcept {
    static constexpr std::array<std::string_view, 7> kColumns{
        "date", "open", "high", "low", "close", "volume", "amount"};

    try {
        std::size_t start = 0;
        while (start < content.size()) {
            auto end = content.find('\n', start);
            if (end == std::string_view::npos) end = content.size();
            std::string_view line = content.substr(start, end - start);
            start = end + 1;

            const auto first = line.find_first_not_of(" \t\r");
            if (first == std::string_view::npos || line[first] == '#') {
                continue;
            }

            auto fields = split_fields(line);
            if (fields.size() != 6 && fields.size() != 7) {
                return false;
            }
            for (std::size_t i = 0; i < fields.size(); ++i) {
                std::transform(fields[i].begin(), fields[i].end(), fields[i].begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (fields[i] != kColumns[i]) {
                    return false;
                }
            }
            return true;
        }
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

// ─── DataLoader::parse_bar_row ────────────────────────────────────────────────

std::optional<Bar>
DataLoader::parse_bar_row(std::string_view line, const std::string& code) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::vector<std::string> fields;
    try {
        fields = split_fields(line);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (fields.size() != 6 && fields.size() != 7) {
        return std::nullopt;
    }

    const auto date = TradingDate::parse(fields[0]);
    if (!date) {
        return std::nullopt;
    }

    std::array<double, 6> values{};
    for (std::size_t i = 1; i < fields.size(); ++i) {
        const auto v = parse_double(fields[i]);
        if (!v) {
            return std::nullopt;
        }
        values[i - 1] = *v;
    }

    Bar bar{
        .code   = code,
        .date   = *date,
        .open   = values[0],
        .high   = values[1],
        .low    = values[2],
        .close  = values[3],
        .volume = values[4],
        .amount = fields.size() == 7 ? values[5] : values[3] * values[4],
    };

    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_bar_csv ────────────────────────────────────────────────

std::vector<Bar>
DataLoader::parse_bar_csv(std::string_view content, const std::string& code) noexcept {
    std::vector<Bar> bars;
    try {
        for_each_data_line(content, [&](std::string_view line) {
            if (auto bar = parse_bar_row(line, code)) {
                bars.push_back(std::move(*bar));
            }
        });
        std::stable_sort(bars.begin(), bars.end(),
                         [](const Bar& a, const Bar& b) { return a.date < b.date; });
        bars.erase(std::unique(bars.begin(), bars.end(),
                               [](const Bar& a, const Bar& b) { return a.date == b.date; }),
                   bars.end());
    } catch (const std::exception&) {
        return {};
    }
    return bars;
}

// ─── DataLoader::parse_universe_csv ───────────────────────────────────────────

std::vector<Instrument>
DataLoader::parse_universe_csv(std::string_view content) noexcept {
    std::vector<Instrument> universe;
    try {
        std::set<std::string> seen;
        for_each_data_line(content, [&](std::string_view line) {
            const auto fields = split_fields(line);
            if (fields.empty() || fields[0].empty() || fields.size() > 3) {
                return;
            }
            const auto status = parse_listing_status(fields.size() == 3 ? fields[2] : "");
            if (!status) {
                return;
            }
            if (!seen.insert(fields[0]).second) {
                return;
            }
            universe.push_back(Instrument{
                .code   = fields[0],
                .name   = fields.size() >= 2 ? fields[1] : std::string{},
                .status = *status,
            });
        });
    } catch (const std::exception&) {
        return {};
    }
    return universe;
}

// ─── File wrappers ────────────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) noexcept {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<Bar>>
DataLoader::load_bar_csv(const std::string& filepath, const std::string& code) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_bar_csv(*contents, code);
}

std::optional<std::vector<Instrument>>
DataLoader::load_universe(const std::string& filepath) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_universe_csv(*contents);
}

}  // namespace sift::core
