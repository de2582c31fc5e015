#include <geomatch/io/csv.hpp>

#include <fmt/core.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace geomatch::io {

namespace {

auto squash_header(std::string_view header) -> std::string {
    std::string out;
    out.reserve(header.size());
    for (unsigned char ch : header) {
        if (std::isspace(ch) != 0) {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

auto reader_params(char delimiter) -> rapidcsv::SeparatorParams {
    // Cells are kept verbatim; quoting per RFC 4180.
    return rapidcsv::SeparatorParams(delimiter, false, rapidcsv::sPlatformHasCR, true);
}

auto writer_params(char delimiter) -> rapidcsv::SeparatorParams {
    return rapidcsv::SeparatorParams(delimiter, false, false, true);
}

auto skip_empty_lines() -> rapidcsv::LineReaderParams {
    return rapidcsv::LineReaderParams(false, '#', true);
}

auto header_field_count(const std::string& header_line, char delimiter) -> std::size_t {
    std::istringstream stream(header_line);
    rapidcsv::Document probe(stream, rapidcsv::LabelParams(0, -1), reader_params(delimiter));
    return probe.GetColumnCount();
}

/// Write `headers` and `columns` through rapidcsv into a sibling temporary
/// file, then rename it over `path`.
auto write_columns(const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& columns,
                   const std::filesystem::path& path, char delimiter)
    -> std::expected<void, std::string> {
    auto tmp_path = path;
    tmp_path += ".tmp";
    try {
        rapidcsv::Document doc(std::string(), rapidcsv::LabelParams(0, -1),
                               writer_params(delimiter));
        for (std::size_t c = 0; c < headers.size(); ++c) {
            doc.SetColumnName(c, headers[c]);
        }
        for (std::size_t c = 0; c < columns.size(); ++c) {
            doc.SetColumn<std::string>(c, columns[c]);
        }
        doc.Save(tmp_path.string());
    } catch (const std::exception& e) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return std::unexpected(fmt::format("failed to write '{}': {}", path.string(), e.what()));
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return std::unexpected(
            fmt::format("failed to write '{}': {}", path.string(), ec.message()));
    }
    return {};
}

}  // namespace

auto infer_header_role(std::string_view header) -> std::optional<HeaderRole> {
    const auto key = squash_header(header);
    if (key == "id") {
        return Role::Id;
    }
    if (key == "addr1" || key == "address" || key == "addr") {
        return Role::AddressLine1;
    }
    if (key == "addr2" || key == "address2") {
        return Role::AddressLine2;
    }
    if (key == "city") {
        return Role::City;
    }
    if (key == "state") {
        return Role::State;
    }
    if (key == "zipcode" || key == "zip" || key == "postalcode") {
        return Role::PostalCode;
    }
    if (key == "lat" || key == "latitude") {
        return Axis::Latitude;
    }
    if (key == "lng" || key == "longitude") {
        return Axis::Longitude;
    }
    return std::nullopt;
}

auto detect_delimiter(const std::filesystem::path& path) -> std::expected<char, std::string> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(fmt::format("failed to open '{}'", path.string()));
    }
    std::string header_line;
    if (!std::getline(input, header_line)) {
        return std::unexpected(fmt::format("'{}' is empty", path.string()));
    }
    try {
        const auto commas = header_field_count(header_line, ',');
        const auto pipes = header_field_count(header_line, '|');
        return pipes > commas ? '|' : ',';
    } catch (const std::exception& e) {
        return std::unexpected(
            fmt::format("failed to read header of '{}': {}", path.string(), e.what()));
    }
}

auto read_table(const std::filesystem::path& path) -> std::expected<Table, std::string> {
    auto delimiter = detect_delimiter(path);
    if (!delimiter) {
        return std::unexpected(delimiter.error());
    }

    Table table;
    std::optional<Column<double>> lat;
    std::optional<Column<double>> lng;
    try {
        rapidcsv::Document doc(path.string(), rapidcsv::LabelParams(0, -1),
                               reader_params(*delimiter), rapidcsv::ConverterParams(),
                               skip_empty_lines());
        const auto names = doc.GetColumnNames();
        const auto rows = doc.GetRowCount();

        std::vector<std::optional<HeaderRole>> roles;
        bool has_lat = false;
        bool has_lng = false;
        for (const auto& name : names) {
            auto role = infer_header_role(name);
            if (role.has_value() && std::holds_alternative<Axis>(*role)) {
                (std::get<Axis>(*role) == Axis::Latitude ? has_lat : has_lng) = true;
            }
            roles.push_back(role);
        }
        // A lone latitude or longitude column stays an ordinary text column.
        const bool extract_axes = has_lat && has_lng;

        for (std::size_t c = 0; c < names.size(); ++c) {
            std::vector<std::string> values =
                rows == 0 ? std::vector<std::string>{} : doc.GetColumn<std::string>(c);
            const auto& role = roles[c];

            if (role.has_value() && std::holds_alternative<Axis>(*role)) {
                if (!extract_axes) {
                    auto added = table.add_column(names[c], Column<std::string>{std::move(values)});
                    if (!added) {
                        return std::unexpected(added.error());
                    }
                    continue;
                }
                Column<double> axis;
                axis.reserve(values.size());
                for (const auto& text : values) {
                    axis.push_back(parse_coordinate(text));
                }
                if (std::get<Axis>(*role) == Axis::Latitude) {
                    lat = std::move(axis);
                } else {
                    lng = std::move(axis);
                }
                continue;
            }

            auto added = table.add_column(names[c], Column<std::string>{std::move(values)});
            if (!added) {
                return std::unexpected(added.error());
            }
            if (role.has_value()) {
                auto bound = table.bind_role(std::get<Role>(*role), names[c]);
                if (!bound) {
                    return std::unexpected(bound.error());
                }
            }
        }
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read '{}': {}", path.string(), e.what()));
    }

    // Axes go in last so a file without text columns still gets its row count.
    if (lat.has_value()) {
        auto ok = table.set_axis(Axis::Latitude, std::move(*lat));
        if (!ok) {
            return std::unexpected(ok.error());
        }
    }
    if (lng.has_value()) {
        auto ok = table.set_axis(Axis::Longitude, std::move(*lng));
        if (!ok) {
            return std::unexpected(ok.error());
        }
    }

    table.set_source(path.string(), *delimiter);
    spdlog::debug("read {} rows x {} columns from {} (delimiter '{}')", table.rows(),
                  table.width(), path.string(), *delimiter);
    return table;
}

auto fetch_output_path(const Table& table, const std::filesystem::path& output_dir)
    -> std::filesystem::path {
    auto stem = std::filesystem::path(table.source_path()).stem().string();
    if (stem.empty()) {
        stem = "table";
    }
    return output_dir / (stem + std::string(kFetchSuffix));
}

auto format_coordinate(double value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    return fmt::format("{}", value);
}

auto write_fetch_output(const Table& table, const std::filesystem::path& path)
    -> std::expected<void, std::string> {
    auto headers = table.headers();
    headers.emplace_back("lat");
    headers.emplace_back("lng");

    std::vector<std::vector<std::string>> columns;
    columns.reserve(headers.size());
    for (const auto& column : table.columns()) {
        columns.emplace_back(column.values.begin(), column.values.end());
    }
    std::vector<std::string> lat;
    std::vector<std::string> lng;
    lat.reserve(table.rows());
    lng.reserve(table.rows());
    for (std::size_t row = 0; row < table.rows(); ++row) {
        const auto point = table.point(row);
        lat.push_back(format_coordinate(point.lat));
        lng.push_back(format_coordinate(point.lng));
    }
    columns.push_back(std::move(lat));
    columns.push_back(std::move(lng));

    return write_columns(headers, columns, path, table.delimiter());
}

auto write_matches(const Table& table, const std::filesystem::path& path)
    -> std::expected<void, std::string> {
    std::vector<std::vector<std::string>> columns;
    columns.reserve(table.width());
    for (const auto& column : table.columns()) {
        columns.emplace_back(column.values.begin(), column.values.end());
    }
    return write_columns(table.headers(), columns, path, kMatchDelimiter);
}

}  // namespace geomatch::io
