#include <geomatch/match/match_engine.hpp>

#include <rapidfuzz/fuzz.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace geomatch::match {

namespace {

auto is_ascii_alnum(unsigned char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

auto to_lower_ascii(unsigned char ch) -> char {
    return static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch - 'A' + 'a' : ch);
}

auto trim_spaces(std::string text) -> std::string {
    auto begin = text.find_first_not_of(' ');
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(' ');
    return text.substr(begin, end - begin + 1);
}

}  // namespace

auto normalize_for_compare(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        out.push_back(is_ascii_alnum(ch) ? to_lower_ascii(ch) : ' ');
    }
    return trim_spaces(std::move(out));
}

auto token_sort_similarity(std::string_view a, std::string_view b) -> int {
    const auto lhs = normalize_for_compare(a);
    const auto rhs = normalize_for_compare(b);
    if (lhs.empty() || rhs.empty()) {
        return 0;
    }
    return static_cast<int>(std::lround(rapidfuzz::fuzz::token_sort_ratio(lhs, rhs)));
}

auto text_dissimilarity(std::string_view a, std::string_view b) -> int {
    return 100 - token_sort_similarity(a, b);
}

auto compare_score(std::span<const std::string> source, std::span<const std::string> candidate)
    -> long long {
    long long score = 0;
    if (source.empty()) {
        return score;
    }
    for (const auto& value : candidate) {
        int best = std::numeric_limits<int>::max();
        for (const auto& reference : source) {
            best = std::min(best, text_dissimilarity(reference, value));
        }
        score += static_cast<long long>(best) * best;
    }
    return score;
}

auto find_best_match(const GeoPoint& source, std::span<const std::string> source_compare,
                     const Table& candidates, const std::vector<bool>& written_mask,
                     bool exclusive, double radius) -> std::optional<MatchCandidate> {
    if (!source.resolved() || !candidates.has_coordinates()) {
        return std::nullopt;
    }

    std::vector<std::size_t> exact;
    std::optional<std::size_t> nearest;
    double nearest_proxy = std::numeric_limits<double>::infinity();

    for (std::size_t row = 0; row < candidates.rows(); ++row) {
        if (exclusive && row < written_mask.size() && written_mask[row]) {
            continue;
        }
        const auto point = candidates.point(row);
        if (!point.resolved()) {
            continue;
        }
        if (point.same_location(source)) {
            exact.push_back(row);
            continue;
        }
        if (!exact.empty()) {
            continue;
        }
        const double proxy = planar_proxy(source, point);
        if (!nearest.has_value() || proxy < nearest_proxy) {
            nearest = row;
            nearest_proxy = proxy;
        }
    }

    if (exact.size() == 1) {
        return MatchCandidate{.row = exact.front(), .distance = 0.0};
    }

    if (exact.size() > 1) {
        std::size_t best_row = exact.front();
        long long best_score = std::numeric_limits<long long>::max();
        for (auto row : exact) {
            const auto values = candidates.compare_row(row);
            const auto score = compare_score(source_compare, values);
            if (score < best_score) {
                best_row = row;
                best_score = score;
            }
        }
        return MatchCandidate{.row = best_row, .distance = 0.0};
    }

    if (!nearest.has_value()) {
        return std::nullopt;
    }
    const double distance = haversine_miles(source, candidates.point(*nearest));
    if (!(distance <= radius)) {
        return std::nullopt;
    }
    return MatchCandidate{.row = *nearest, .distance = distance};
}

}  // namespace geomatch::match
