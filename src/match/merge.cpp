#include <geomatch/match/merge.hpp>

#include <geomatch/match/match_engine.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

namespace geomatch::match {

auto join_mode_name(JoinMode mode) -> std::string_view {
    switch (mode) {
        case JoinMode::Left:
            return "left";
        case JoinMode::Inner:
            return "inner";
        case JoinMode::Outer:
            return "outer";
    }
    return "unknown";
}

auto parse_join_mode(std::string_view text) -> std::optional<JoinMode> {
    std::string lower;
    lower.reserve(text.size());
    for (unsigned char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (lower == "left") {
        return JoinMode::Left;
    }
    if (lower == "inner") {
        return JoinMode::Inner;
    }
    if (lower == "outer") {
        return JoinMode::Outer;
    }
    return std::nullopt;
}

MergeAccumulator::MergeAccumulator(MergeOptions options, std::vector<std::size_t> widths,
                                   Table output)
    : options_(options), widths_(std::move(widths)), output_(std::move(output)) {
    offsets_.reserve(widths_.size());
    std::size_t offset = 0;
    for (auto width : widths_) {
        offsets_.push_back(offset);
        offset += width;
    }
    if (options_.mode == JoinMode::Left) {
        distance_column_ = offset;
    }
}

auto MergeAccumulator::create(std::span<const Table> tables, MergeOptions options)
    -> std::expected<MergeAccumulator, std::string> {
    if (tables.empty()) {
        return std::unexpected("no tables to merge");
    }
    if (!(options.radius >= 0.0)) {
        return std::unexpected("radius must not be negative");
    }

    std::vector<std::size_t> widths;
    std::vector<std::string> headers;
    std::size_t height = 0;
    for (const auto& table : tables) {
        widths.push_back(table.output_columns().size());
        for (auto& header : table.output_headers()) {
            headers.push_back(std::move(header));
        }
        height += table.rows();
    }
    if (headers.empty()) {
        return std::unexpected("no output columns supplied");
    }
    if (options.mode == JoinMode::Left) {
        headers.emplace_back(kDistanceColumn);
    }

    Table output = Table::with_capacity(headers.size(), height);
    for (std::size_t c = 0; c < headers.size(); ++c) {
        output.set_column_name(c, std::move(headers[c]));
    }
    return MergeAccumulator(options, std::move(widths), std::move(output));
}

auto MergeAccumulator::append_row(const Table& table, std::size_t row, std::size_t offset,
                                  std::size_t width) -> std::expected<void, std::string> {
    std::vector<std::string> cells(output_.width());
    auto values = table.output_row(row);
    for (std::size_t c = 0; c < width; ++c) {
        cells[offset + c] = std::move(values[c]);
    }
    if (auto appended = output_.append_row(std::move(cells), table.point(row)); !appended) {
        return appended;
    }
    matched_.push_back(false);
    compare_values_.push_back(table.compare_row(row));
    return {};
}

auto MergeAccumulator::fold(const Table& table) -> std::expected<FoldStats, std::string> {
    if (next_table_ >= widths_.size()) {
        return std::unexpected(fmt::format("only {} tables were laid out", widths_.size()));
    }
    const std::size_t index = next_table_;
    const std::size_t width = widths_[index];
    const std::size_t offset = offsets_[index];
    if (table.output_columns().size() != width) {
        return std::unexpected(fmt::format("table {} has {} output columns, expected {}", index,
                                           table.output_columns().size(), width));
    }
    if (!table.has_coordinates()) {
        return std::unexpected(fmt::format("table {} has no coordinates", index));
    }

    FoldStats stats;
    std::vector<bool> written_mask(table.rows(), false);

    const std::size_t existing = output_.rows();
    for (std::size_t row = 0; row < existing; ++row) {
        auto candidate = find_best_match(output_.point(row), compare_values_[row], table,
                                         written_mask, options_.exclusive, options_.radius);
        if (!candidate.has_value()) {
            continue;
        }

        auto values = table.output_row(candidate->row);
        for (std::size_t c = 0; c < width; ++c) {
            output_.set_cell(offset + c, row, std::move(values[c]));
        }
        if (distance_column_.has_value()) {
            output_.set_cell(*distance_column_, row, fmt::format("{}", candidate->distance));
        }
        output_.set_point(row, output_.point(row).midpoint(table.point(candidate->row)));

        auto extra = table.compare_row(candidate->row);
        compare_values_[row].insert(compare_values_[row].end(),
                                    std::make_move_iterator(extra.begin()),
                                    std::make_move_iterator(extra.end()));

        written_mask[candidate->row] = true;
        matched_[row] = true;
        ++stats.matched;
    }

    const bool keep_leftovers = index == 0 || options_.mode != JoinMode::Left;
    for (std::size_t row = 0; row < table.rows(); ++row) {
        const bool consumed = written_mask[row];
        if (keep_leftovers && (!options_.exclusive || !consumed)) {
            if (auto appended = append_row(table, row, offset, width); !appended) {
                return std::unexpected(appended.error());
            }
            ++stats.appended;
        } else if (!consumed) {
            ++stats.dropped;
        }
    }

    ++next_table_;
    spdlog::debug("folded table {}: {} matched, {} appended, {} dropped", index, stats.matched,
                  stats.appended, stats.dropped);
    return stats;
}

auto MergeAccumulator::finish() -> Table {
    if (options_.mode == JoinMode::Inner) {
        output_.retain_rows(matched_);
    }
    matched_.clear();
    compare_values_.clear();
    return std::exchange(output_, Table{});
}

auto merge(std::span<const Table> tables, const MergeOptions& options)
    -> std::expected<MergeResult, std::string> {
    auto accumulator = MergeAccumulator::create(tables, options);
    if (!accumulator) {
        return std::unexpected(accumulator.error());
    }

    MergeResult result;
    result.folds.reserve(tables.size());
    for (const auto& table : tables) {
        auto stats = accumulator->fold(table);
        if (!stats) {
            return std::unexpected(stats.error());
        }
        result.folds.push_back(*stats);
    }
    result.table = accumulator->finish();
    return result;
}

}  // namespace geomatch::match
