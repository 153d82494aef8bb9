#pragma once

/// @file include/sift/data_loader.hpp
/// @brief CSV loaders for daily bars and the instrument universe.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV text into `Bar` and `Instrument` records. Used by the offline
/// `FileBarSource`, by `HttpBarSource` to decode response bodies, and by the
/// CLI to read the universe file.
///
/// ## Expected Bar CSV Format
/// ```
/// date,open,high,low,close,volume[,amount]
/// 2024-01-02,10.1,10.6,9.9,10.4,1250000,13000000
/// ```
/// The first non-comment line is a header and is skipped. When `amount` is
/// absent it is derived as close × volume.
///
/// ## Expected Universe CSV Format
/// ```
/// code,name[,status]
/// 600000,Pudong Bank,active
/// ```
///
/// ## Guarantees
/// - Never throws
/// - Lenient parsers skip malformed rows; `parse_bar_row` reports them as
///   `nullopt` so callers can classify a payload as malformed

#include "sift/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift::core {

class DataLoader {
public:
    /// Parse a single bar row for instrument `code`.
    ///
    /// # Returns
    /// `nullopt` if the row is malformed, has non-finite values or fails
    /// `validate_bar`.
    [[nodiscard]] static std::optional<Bar>
    parse_bar_row(std::string_view line, const std::string& code) noexcept;

    /// True if the first non-blank, non-comment line of `content` is the bar
    /// CSV header `date,open,high,low,close,volume[,amount]` (case-insensitive).
    [[nodiscard]] static bool has_bar_header(std::string_view content) noexcept;

    /// Parse a bar CSV document (header first), skipping malformed rows.
    /// The result is sorted by date; later duplicates of a date are dropped.
    [[nodiscard]] static std::vector<Bar>
    parse_bar_csv(std::string_view content, const std::string& code) noexcept;

    /// Load a bar CSV file. `nullopt` if the file cannot be opened.
    [[nodiscard]] static std::optional<std::vector<Bar>>
    load_bar_csv(const std::string& filepath, const std::string& code) noexcept;

    /// Parse a universe CSV document. Rows with an empty code or an unknown
    /// status are skipped; duplicate codes keep the first occurrence.
    [[nodiscard]] static std::vector<Instrument>
    parse_universe_csv(std::string_view content) noexcept;

    [[nodiscard]] static std::optional<std::vector<Instrument>>
    load_universe(const std::string& filepath) noexcept;

    /// Validate a single bar.
    ///
    /// A bar is valid if:
    /// - All numeric fields are finite
    /// - low <= open, close <= high
    /// - volume >= 0 and amount >= 0
    [[nodiscard]] static bool validate_bar(const Bar& bar) noexcept;

    /// Split a CSV line on commas, trimming whitespace around each field.
    [[nodiscard]] static std::vector<std::string>
    split_fields(std::string_view line);

private:
    /// Read a whole file. `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::string>
    read_file(const std::string& filepath) noexcept;
};

}  // namespace sift::core
