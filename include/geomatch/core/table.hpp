#pragma once

#include <geomatch/core/column.hpp>
#include <geomatch/core/geo.hpp>

#include <robin_hood.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geomatch {

/// Columns with a special meaning when building a fetchable address.
enum class Role : std::uint8_t {
    Id,
    AddressLine1,
    AddressLine2,
    City,
    State,
    PostalCode,
};

inline constexpr std::size_t kRoleCount = 6;

/// Coordinate axes, stored outside the text columns.
enum class Axis : std::uint8_t {
    Latitude,
    Longitude,
};

[[nodiscard]] auto role_name(Role role) -> std::string_view;

struct TextColumn {
    std::string name;
    Column<std::string> values;
};

/// Unresolved role bindings are std::nullopt.
class RoleBindings {
   public:
    [[nodiscard]] auto get(Role role) const noexcept -> std::optional<std::size_t> {
        return slots_[static_cast<std::size_t>(role)];
    }
    void bind(Role role, std::size_t column) noexcept {
        slots_[static_cast<std::size_t>(role)] = column;
    }
    void unbind(Role role) noexcept { slots_[static_cast<std::size_t>(role)].reset(); }

    /// Adjust bindings after the column at `removed` has been dropped.
    void on_column_removed(std::size_t removed) noexcept;

   private:
    std::array<std::optional<std::size_t>, kRoleCount> slots_{};
};

/// An in-memory columnar relation of text columns plus an optional
/// latitude/longitude pair.
///
/// All text columns and both coordinate axes always hold rows() entries.
/// Role bindings, output columns and compare columns only ever reference
/// existing text columns.
class Table {
   public:
    Table() = default;

    /// Empty table with `width` unnamed columns reserved for `height` rows
    /// and an empty coordinate pair.
    [[nodiscard]] static auto with_capacity(std::size_t width, std::size_t height) -> Table;

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto width() const noexcept -> std::size_t { return columns_.size(); }

    /// Append a named text column. Fails when the length disagrees with rows().
    auto add_column(std::string name, Column<std::string> values)
        -> std::expected<std::size_t, std::string>;

    /// Replace the values of an existing column, keeping its name.
    auto replace_column(std::size_t index, Column<std::string> values)
        -> std::expected<void, std::string>;

    /// Index of the first column named `name`.
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;

    [[nodiscard]] auto column(std::size_t index) const -> const TextColumn& {
        return columns_.at(index);
    }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<TextColumn>& {
        return columns_;
    }
    [[nodiscard]] auto headers() const -> std::vector<std::string>;

    [[nodiscard]] auto cell(std::size_t col, std::size_t row) const -> const std::string& {
        return columns_.at(col).values.at(row);
    }
    void set_cell(std::size_t col, std::size_t row, std::string value) {
        columns_.at(col).values.at(row) = std::move(value);
    }

    /// Rename a column in place.
    void set_column_name(std::size_t index, std::string name);

    // Coordinates -------------------------------------------------------

    [[nodiscard]] auto has_coordinates() const noexcept -> bool {
        return lat_.has_value() && lng_.has_value();
    }
    [[nodiscard]] auto has_axis(Axis axis) const noexcept -> bool {
        return axis == Axis::Latitude ? lat_.has_value() : lng_.has_value();
    }
    /// Coordinates of `row`; unresolved when the table has no coordinates.
    [[nodiscard]] auto point(std::size_t row) const -> GeoPoint;
    void set_point(std::size_t row, GeoPoint point);

    /// Install both coordinate axes at once.
    auto set_coordinates(Column<double> lat, Column<double> lng)
        -> std::expected<void, std::string>;

    /// Install one coordinate axis.
    auto set_axis(Axis axis, Column<double> values) -> std::expected<void, std::string>;

    /// Move the text column `name` into a coordinate axis. The column is
    /// removed from the text columns; unparsable cells become NaN.
    auto promote_to_axis(Axis axis, std::string_view name) -> std::expected<void, std::string>;

    // Rows --------------------------------------------------------------

    /// Append a row. `cells` must have width() entries.
    auto append_row(std::vector<std::string> cells, GeoPoint point)
        -> std::expected<void, std::string>;

    /// Keep only the rows whose `keep` flag is set, in one pass over every
    /// text column and both coordinate axes. `keep` must have rows() entries.
    void retain_rows(const std::vector<bool>& keep);

    /// Remove the text column at `index`, fixing up every index that refers
    /// to later columns and dropping references to the removed one.
    void remove_column(std::size_t index);

    // Roles and column selections ---------------------------------------

    [[nodiscard]] auto roles() const noexcept -> const RoleBindings& { return roles_; }
    [[nodiscard]] auto role(Role role) const noexcept -> std::optional<std::size_t> {
        return roles_.get(role);
    }
    auto bind_role(Role role, std::string_view column) -> std::expected<void, std::string>;

    auto add_output_column(std::string_view column) -> std::expected<void, std::string>;
    auto add_compare_column(std::string_view column) -> std::expected<void, std::string>;
    [[nodiscard]] auto output_columns() const noexcept -> const std::vector<std::size_t>& {
        return output_columns_;
    }
    [[nodiscard]] auto compare_columns() const noexcept -> const std::vector<std::size_t>& {
        return compare_columns_;
    }

    void set_prefix(std::string prefix) { prefix_ = std::move(prefix); }
    [[nodiscard]] auto prefix() const noexcept -> const std::string& { return prefix_; }

    /// Output column names, each prefixed with "<prefix>_" when a prefix is set.
    [[nodiscard]] auto output_headers() const -> std::vector<std::string>;
    [[nodiscard]] auto output_row(std::size_t row) const -> std::vector<std::string>;
    [[nodiscard]] auto compare_row(std::size_t row) const -> std::vector<std::string>;

    /// Space-joined "addr1 [addr2] city state [zip]" for `row`, or nullopt
    /// when the table is not fetchable or a required part is blank.
    [[nodiscard]] auto formatted_address(std::size_t row) const -> std::optional<std::string>;

    [[nodiscard]] auto ready_to_fetch() const noexcept -> bool;
    [[nodiscard]] auto ready_to_match() const noexcept -> bool { return has_coordinates(); }

    // Source metadata ---------------------------------------------------

    void set_source(std::string path, char delimiter) {
        source_path_ = std::move(path);
        delimiter_ = delimiter;
    }
    [[nodiscard]] auto source_path() const noexcept -> const std::string& { return source_path_; }
    [[nodiscard]] auto delimiter() const noexcept -> char { return delimiter_; }

   private:
    [[nodiscard]] auto require(std::string_view column) const
        -> std::expected<std::size_t, std::string>;
    void rebuild_index();

    std::vector<TextColumn> columns_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
    std::size_t rows_ = 0;
    bool rows_fixed_ = false;

    std::optional<Column<double>> lat_;
    std::optional<Column<double>> lng_;

    RoleBindings roles_;
    std::vector<std::size_t> output_columns_;
    std::vector<std::size_t> compare_columns_;
    std::string prefix_;

    std::string source_path_;
    char delimiter_ = ',';
};

/// Parse a decimal coordinate cell; NaN when the text is not a finite number.
[[nodiscard]] auto parse_coordinate(std::string_view text) -> double;

}  // namespace geomatch
