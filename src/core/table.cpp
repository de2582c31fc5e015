#include <geomatch/core/table.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace geomatch {

namespace {

auto is_blank(std::string_view text) -> bool {
    return std::ranges::all_of(text, [](unsigned char ch) { return std::isspace(ch) != 0; });
}

/// Rows of `column` whose `keep` flag is set; `kept` is the number of set flags.
template <typename T>
auto filter_rows(Column<T>& column, const std::vector<bool>& keep, std::size_t kept) -> Column<T> {
    Column<T> out;
    out.reserve(kept);
    for (std::size_t row = 0; row < keep.size(); ++row) {
        if (keep[row]) {
            out.push_back(std::move(column[row]));
        }
    }
    return out;
}

/// Shift `indices` after removing column `removed`; references to it are dropped.
void shift_indices(std::vector<std::size_t>& indices, std::size_t removed) {
    std::erase(indices, removed);
    for (auto& index : indices) {
        if (index > removed) {
            --index;
        }
    }
}

}  // namespace

auto role_name(Role role) -> std::string_view {
    switch (role) {
        case Role::Id:
            return "id";
        case Role::AddressLine1:
            return "addr1";
        case Role::AddressLine2:
            return "addr2";
        case Role::City:
            return "city";
        case Role::State:
            return "state";
        case Role::PostalCode:
            return "zipcode";
    }
    return "unknown";
}

void RoleBindings::on_column_removed(std::size_t removed) noexcept {
    for (auto& slot : slots_) {
        if (!slot.has_value()) {
            continue;
        }
        if (*slot == removed) {
            slot.reset();
        } else if (*slot > removed) {
            --*slot;
        }
    }
}

auto parse_coordinate(std::string_view text) -> double {
    std::string owned(text);
    const char* begin = owned.c_str();
    while (*begin != '\0' && std::isspace(static_cast<unsigned char>(*begin)) != 0) {
        ++begin;
    }
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return kUnresolved;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)) != 0) {
        ++end;
    }
    if (*end != '\0' || !std::isfinite(value)) {
        return kUnresolved;
    }
    return value;
}

auto Table::with_capacity(std::size_t width, std::size_t height) -> Table {
    Table table;
    table.columns_.resize(width);
    for (auto& column : table.columns_) {
        column.values.reserve(height);
    }
    Column<double> lat;
    Column<double> lng;
    lat.reserve(height);
    lng.reserve(height);
    table.lat_ = std::move(lat);
    table.lng_ = std::move(lng);
    table.rows_fixed_ = true;
    table.rebuild_index();
    return table;
}

auto Table::add_column(std::string name, Column<std::string> values)
    -> std::expected<std::size_t, std::string> {
    if (rows_fixed_ && values.size() != rows_) {
        return std::unexpected(fmt::format("column '{}' has {} rows, table has {}", name,
                                           values.size(), rows_));
    }
    rows_ = values.size();
    rows_fixed_ = true;
    const std::size_t index = columns_.size();
    index_.try_emplace(name, index);
    columns_.push_back(TextColumn{.name = std::move(name), .values = std::move(values)});
    return index;
}

auto Table::replace_column(std::size_t index, Column<std::string> values)
    -> std::expected<void, std::string> {
    if (index >= columns_.size()) {
        return std::unexpected(fmt::format("column index {} out of range", index));
    }
    if (values.size() != rows_) {
        return std::unexpected(fmt::format("column '{}' has {} rows, table has {}",
                                           columns_[index].name, values.size(), rows_));
    }
    columns_[index].values = std::move(values);
    return {};
}

auto Table::find(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Table::headers() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

void Table::set_column_name(std::size_t index, std::string name) {
    columns_.at(index).name = std::move(name);
    rebuild_index();
}

auto Table::point(std::size_t row) const -> GeoPoint {
    if (!has_coordinates()) {
        return GeoPoint{};
    }
    return GeoPoint{.lat = lat_->at(row), .lng = lng_->at(row)};
}

void Table::set_point(std::size_t row, GeoPoint point) {
    lat_.value().at(row) = point.lat;
    lng_.value().at(row) = point.lng;
}

auto Table::set_coordinates(Column<double> lat, Column<double> lng)
    -> std::expected<void, std::string> {
    if (lat.size() != lng.size()) {
        return std::unexpected("latitude and longitude lengths differ");
    }
    if (rows_fixed_ && lat.size() != rows_) {
        return std::unexpected(
            fmt::format("coordinates have {} rows, table has {}", lat.size(), rows_));
    }
    rows_ = lat.size();
    rows_fixed_ = true;
    lat_ = std::move(lat);
    lng_ = std::move(lng);
    return {};
}

auto Table::set_axis(Axis axis, Column<double> values) -> std::expected<void, std::string> {
    if (rows_fixed_ && values.size() != rows_) {
        return std::unexpected(
            fmt::format("coordinate axis has {} rows, table has {}", values.size(), rows_));
    }
    rows_ = values.size();
    rows_fixed_ = true;
    if (axis == Axis::Latitude) {
        lat_ = std::move(values);
    } else {
        lng_ = std::move(values);
    }
    return {};
}

auto Table::promote_to_axis(Axis axis, std::string_view name) -> std::expected<void, std::string> {
    auto index = require(name);
    if (!index) {
        return std::unexpected(index.error());
    }
    Column<double> values;
    values.reserve(rows_);
    for (const auto& text : columns_[*index].values) {
        values.push_back(parse_coordinate(text));
    }
    remove_column(*index);
    return set_axis(axis, std::move(values));
}

auto Table::append_row(std::vector<std::string> cells, GeoPoint point)
    -> std::expected<void, std::string> {
    if (cells.size() != columns_.size()) {
        return std::unexpected(
            fmt::format("row has {} cells, table has {} columns", cells.size(), columns_.size()));
    }
    for (std::size_t c = 0; c < cells.size(); ++c) {
        columns_[c].values.push_back(std::move(cells[c]));
    }
    if (!lat_.has_value()) {
        lat_ = Column<double>(rows_, kUnresolved);
    }
    if (!lng_.has_value()) {
        lng_ = Column<double>(rows_, kUnresolved);
    }
    lat_->push_back(point.lat);
    lng_->push_back(point.lng);
    ++rows_;
    rows_fixed_ = true;
    return {};
}

void Table::retain_rows(const std::vector<bool>& keep) {
    if (keep.size() != rows_) {
        throw std::invalid_argument(
            fmt::format("retain_rows: {} flags for {} rows", keep.size(), rows_));
    }
    const auto kept = static_cast<std::size_t>(std::ranges::count(keep, true));
    for (auto& column : columns_) {
        column.values = filter_rows(column.values, keep, kept);
    }
    if (lat_.has_value()) {
        lat_ = filter_rows(*lat_, keep, kept);
    }
    if (lng_.has_value()) {
        lng_ = filter_rows(*lng_, keep, kept);
    }
    rows_ = kept;
}

void Table::remove_column(std::size_t index) {
    if (index >= columns_.size()) {
        throw std::out_of_range(fmt::format("remove_column: column {} out of range", index));
    }
    columns_.erase(columns_.begin() + static_cast<std::ptrdiff_t>(index));
    roles_.on_column_removed(index);
    shift_indices(output_columns_, index);
    shift_indices(compare_columns_, index);
    rebuild_index();
}

auto Table::require(std::string_view column) const -> std::expected<std::size_t, std::string> {
    if (auto index = find(column)) {
        return *index;
    }
    return std::unexpected(fmt::format("no column named '{}'", column));
}

void Table::rebuild_index() {
    index_.clear();
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        index_.try_emplace(columns_[i].name, i);
    }
}

auto Table::bind_role(Role role, std::string_view column) -> std::expected<void, std::string> {
    auto index = require(column);
    if (!index) {
        return std::unexpected(index.error());
    }
    roles_.bind(role, *index);
    return {};
}

auto Table::add_output_column(std::string_view column) -> std::expected<void, std::string> {
    auto index = require(column);
    if (!index) {
        return std::unexpected(index.error());
    }
    output_columns_.push_back(*index);
    return {};
}

auto Table::add_compare_column(std::string_view column) -> std::expected<void, std::string> {
    auto index = require(column);
    if (!index) {
        return std::unexpected(index.error());
    }
    compare_columns_.push_back(*index);
    return {};
}

auto Table::output_headers() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(output_columns_.size());
    for (auto index : output_columns_) {
        if (prefix_.empty()) {
            names.push_back(columns_[index].name);
        } else {
            names.push_back(fmt::format("{}_{}", prefix_, columns_[index].name));
        }
    }
    return names;
}

auto Table::output_row(std::size_t row) const -> std::vector<std::string> {
    std::vector<std::string> cells;
    cells.reserve(output_columns_.size());
    for (auto index : output_columns_) {
        cells.push_back(columns_[index].values.at(row));
    }
    return cells;
}

auto Table::compare_row(std::size_t row) const -> std::vector<std::string> {
    std::vector<std::string> cells;
    cells.reserve(compare_columns_.size());
    for (auto index : compare_columns_) {
        cells.push_back(columns_[index].values.at(row));
    }
    return cells;
}

auto Table::ready_to_fetch() const noexcept -> bool {
    return roles_.get(Role::AddressLine1).has_value() && roles_.get(Role::City).has_value() &&
           roles_.get(Role::State).has_value();
}

auto Table::formatted_address(std::size_t row) const -> std::optional<std::string> {
    if (!ready_to_fetch()) {
        return std::nullopt;
    }
    const auto& addr1 = cell(*roles_.get(Role::AddressLine1), row);
    const auto& city = cell(*roles_.get(Role::City), row);
    const auto& state = cell(*roles_.get(Role::State), row);
    if (is_blank(addr1) || is_blank(city) || is_blank(state)) {
        return std::nullopt;
    }

    std::vector<std::string_view> parts{addr1, city, state};
    if (auto zip = roles_.get(Role::PostalCode)) {
        parts.emplace_back(cell(*zip, row));
    }
    if (auto addr2 = roles_.get(Role::AddressLine2)) {
        parts.insert(parts.begin() + 1, cell(*addr2, row));
    }

    std::string address;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            address.push_back(' ');
        }
        address.append(parts[i]);
    }
    return address;
}

}  // namespace geomatch
