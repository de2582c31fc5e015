#pragma once

#include <geomatch/core/table.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace geomatch::io {

/// Delimiter of the merged match artifact, whatever the inputs use.
inline constexpr char kMatchDelimiter = '|';
inline constexpr std::string_view kMatchesFileName = "matches.csv";
inline constexpr std::string_view kFetchSuffix = "_coords.csv";

/// What a header name means: an address role or a coordinate axis.
using HeaderRole = std::variant<Role, Axis>;

/// Map a header to its role. Matching is case-insensitive and ignores
/// whitespace, so " Postal Code " is a postal code.
[[nodiscard]] auto infer_header_role(std::string_view header) -> std::optional<HeaderRole>;

/// Pick ',' or '|' for `path`: whichever splits the header line into more
/// fields. Ties go to ','.
[[nodiscard]] auto detect_delimiter(const std::filesystem::path& path)
    -> std::expected<char, std::string>;

/// Read a delimited file into a Table with roles inferred from its headers.
/// A latitude and longitude column pair becomes the coordinate pair.
[[nodiscard]] auto read_table(const std::filesystem::path& path)
    -> std::expected<Table, std::string>;

/// "<output_dir>/<source stem>_coords.csv"
[[nodiscard]] auto fetch_output_path(const Table& table, const std::filesystem::path& output_dir)
    -> std::filesystem::path;

/// Write every text column plus lat/lng in the table's own delimiter.
[[nodiscard]] auto write_fetch_output(const Table& table, const std::filesystem::path& path)
    -> std::expected<void, std::string>;

/// Write every column of a merged table, '|' delimited.
[[nodiscard]] auto write_matches(const Table& table, const std::filesystem::path& path)
    -> std::expected<void, std::string>;

/// Shortest round-trip decimal text; "NaN" for unresolved values.
[[nodiscard]] auto format_coordinate(double value) -> std::string;

}  // namespace geomatch::io
