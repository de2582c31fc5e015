#pragma once

#include <geomatch/core/table.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace geomatch::match {

enum class JoinMode : std::uint8_t {
    Left,   // rows reachable from the first table only
    Inner,  // rows that matched at least once
    Outer,  // every row of every table
};

[[nodiscard]] auto join_mode_name(JoinMode mode) -> std::string_view;
[[nodiscard]] auto parse_join_mode(std::string_view text) -> std::optional<JoinMode>;

inline constexpr std::string_view kDistanceColumn = "distance";

struct MergeOptions {
    JoinMode mode = JoinMode::Left;
    bool exclusive = true;
    /// Miles.
    double radius = 0.25;
};

/// What happened to one input table's rows during its fold.
struct FoldStats {
    std::size_t matched = 0;
    std::size_t appended = 0;
    std::size_t dropped = 0;
};

/// Builds the merged table by folding input tables into it one at a time.
///
/// Each table owns a contiguous slice of the output columns, in table order,
/// followed by a distance column under JoinMode::Left. Folding a table first
/// tries to match every existing output row against it, then appends its
/// leftover rows as new output rows when the join mode keeps them.
class MergeAccumulator {
   public:
    /// Lay out the output for `tables`, which are folded in this order.
    [[nodiscard]] static auto create(std::span<const Table> tables, MergeOptions options)
        -> std::expected<MergeAccumulator, std::string>;

    /// Fold the next table. It must have the output column count it had in
    /// create() and carry coordinates.
    auto fold(const Table& table) -> std::expected<FoldStats, std::string>;

    /// Drop rows the join mode excludes and hand over the output. The
    /// accumulator is empty afterwards.
    [[nodiscard]] auto finish() -> Table;

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return output_.rows(); }
    [[nodiscard]] auto matched(std::size_t row) const -> bool { return matched_.at(row); }
    [[nodiscard]] auto folded() const noexcept -> std::size_t { return next_table_; }

   private:
    MergeAccumulator(MergeOptions options, std::vector<std::size_t> widths, Table output);

    auto append_row(const Table& table, std::size_t row, std::size_t offset, std::size_t width)
        -> std::expected<void, std::string>;

    MergeOptions options_;
    std::vector<std::size_t> widths_;
    std::vector<std::size_t> offsets_;
    std::optional<std::size_t> distance_column_;
    std::size_t next_table_ = 0;

    Table output_;
    std::vector<bool> matched_;
    /// Compare values gathered from every input row merged into an output row.
    std::vector<std::vector<std::string>> compare_values_;
};

struct MergeResult {
    Table table;
    std::vector<FoldStats> folds;
};

/// Fold every table of `tables` in order and finish.
[[nodiscard]] auto merge(std::span<const Table> tables, const MergeOptions& options)
    -> std::expected<MergeResult, std::string>;

}  // namespace geomatch::match
