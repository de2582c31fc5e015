#pragma once

#include <geomatch/core/geo.hpp>
#include <geomatch/core/table.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace geomatch::match {

struct MatchCandidate {
    std::size_t row = 0;
    /// 0 for exact matches, otherwise the haversine distance in miles.
    double distance = 0.0;
};

/// Lower-case ASCII letters and digits, every other byte becomes a space.
[[nodiscard]] auto normalize_for_compare(std::string_view text) -> std::string;

/// Token-sort similarity in [0, 100] on normalized text, rounded to an
/// integer. Either side empty after normalization scores 0.
[[nodiscard]] auto token_sort_similarity(std::string_view a, std::string_view b) -> int;

/// 100 - token_sort_similarity(a, b).
[[nodiscard]] auto text_dissimilarity(std::string_view a, std::string_view b) -> int;

/// Sum over `candidate` values of the squared smallest dissimilarity to any
/// `source` value. Lower is closer.
[[nodiscard]] auto compare_score(std::span<const std::string> source,
                                 std::span<const std::string> candidate) -> long long;

/// Find the best row of `candidates` for a source row.
///
/// Rows flagged in `written_mask` are skipped when `exclusive` is set, and
/// rows with unresolved coordinates are never considered. A row at exactly
/// the source coordinates wins outright; several such rows are told apart by
/// their compare columns against `source_compare`. Otherwise the nearest row
/// matches when its haversine distance is at most `radius` miles.
[[nodiscard]] auto find_best_match(const GeoPoint& source,
                                   std::span<const std::string> source_compare,
                                   const Table& candidates, const std::vector<bool>& written_mask,
                                   bool exclusive, double radius) -> std::optional<MatchCandidate>;

}  // namespace geomatch::match
