#include <geomatch/session/session.hpp>

#include <geomatch/io/csv.hpp>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iterator>
#include <optional>
#include <span>
#include <utility>

namespace geomatch::session {

namespace {

auto lowercase(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

auto parse_role_key(std::string_view key) -> std::optional<Role> {
    for (std::size_t i = 0; i < kRoleCount; ++i) {
        const auto role = static_cast<Role>(i);
        if (role_name(role) == key) {
            return role;
        }
    }
    return std::nullopt;
}

auto parse_axis_key(std::string_view key) -> std::optional<Axis> {
    if (key == "lat") {
        return Axis::Latitude;
    }
    if (key == "lng") {
        return Axis::Longitude;
    }
    return std::nullopt;
}

auto names_of(const Table& table, const std::vector<std::size_t>& indices)
    -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(indices.size());
    for (auto index : indices) {
        names.push_back(table.column(index).name);
    }
    return names;
}

}  // namespace

Session::Session(SessionConfig config) : config_(std::move(config)) {
    if (!config_.http) {
        config_.http = fetch::make_curl_http_get();
    }
}

auto Session::add_file(const std::filesystem::path& path)
    -> std::expected<std::size_t, std::string> {
    auto table = io::read_table(path);
    if (!table) {
        return std::unexpected(table.error());
    }
    spdlog::info("loaded {} ({} rows, {} columns)", path.string(), table->rows(), table->width());
    return add_table(std::move(*table));
}

auto Session::add_table(Table table) -> std::size_t {
    tables_.push_back(std::move(table));
    return tables_.size() - 1;
}

auto Session::table(std::size_t index) const -> std::expected<const Table*, std::string> {
    if (index >= tables_.size()) {
        return std::unexpected(
            fmt::format("no table at index {} ({} loaded)", index, tables_.size()));
    }
    return &tables_[index];
}

auto Session::mutable_table(std::size_t index) -> std::expected<Table*, std::string> {
    if (index >= tables_.size()) {
        return std::unexpected(
            fmt::format("no table at index {} ({} loaded)", index, tables_.size()));
    }
    return &tables_[index];
}

auto Session::columns(std::size_t index) const
    -> std::expected<std::vector<std::string>, std::string> {
    auto found = table(index);
    if (!found) {
        return std::unexpected(found.error());
    }
    return (*found)->headers();
}

auto Session::set_role(std::size_t index, std::string_view role, std::string_view column)
    -> std::expected<void, std::string> {
    auto found = mutable_table(index);
    if (!found) {
        return std::unexpected(found.error());
    }
    Table& target = **found;
    const auto key = lowercase(role);
    if (auto axis = parse_axis_key(key)) {
        return target.promote_to_axis(*axis, column);
    }
    if (auto bound = parse_role_key(key)) {
        return target.bind_role(*bound, column);
    }
    return std::unexpected(fmt::format(
        "unknown role '{}' (expected id, addr1, addr2, city, state, zipcode, lat or lng)", role));
}

auto Session::add_column(std::size_t index, ColumnKind kind, std::string_view column)
    -> std::expected<void, std::string> {
    auto found = mutable_table(index);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (kind == ColumnKind::Output) {
        return (*found)->add_output_column(column);
    }
    return (*found)->add_compare_column(column);
}

auto Session::set_prefix(std::size_t index, std::string prefix)
    -> std::expected<void, std::string> {
    auto found = mutable_table(index);
    if (!found) {
        return std::unexpected(found.error());
    }
    (*found)->set_prefix(std::move(prefix));
    return {};
}

auto Session::set_mode(std::string_view text) -> std::expected<void, std::string> {
    auto mode = match::parse_join_mode(text);
    if (!mode) {
        return std::unexpected(
            fmt::format("unknown method '{}' (expected left, inner or outer)", text));
    }
    config_.merge.mode = *mode;
    return {};
}

auto Session::set_radius(std::string_view text) -> std::expected<void, std::string> {
    double value = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || !std::isfinite(value) || value <= 0.0) {
        return std::unexpected(
            fmt::format("radius must be a positive number of miles, got '{}'", text));
    }
    config_.merge.radius = value;
    return {};
}

auto Session::set_exclusive(std::string_view text) -> std::expected<void, std::string> {
    const auto value = lowercase(text);
    if (value == "true") {
        config_.merge.exclusive = true;
    } else if (value == "false") {
        config_.merge.exclusive = false;
    } else {
        return std::unexpected(fmt::format("exclusive expects true or false, got '{}'", text));
    }
    return {};
}

auto Session::ready_to_fetch() const noexcept -> bool {
    return !tables_.empty() &&
           std::ranges::all_of(tables_, [](const Table& t) { return t.ready_to_fetch(); });
}

auto Session::ready_to_match() const noexcept -> bool {
    return !tables_.empty() &&
           std::ranges::all_of(tables_, [](const Table& t) { return t.ready_to_match(); });
}

auto Session::fetch() -> std::expected<std::vector<FetchSummary>, std::string> {
    if (tables_.empty()) {
        return std::unexpected("no tables loaded");
    }
    for (std::size_t i = 0; i < tables_.size(); ++i) {
        if (!tables_[i].ready_to_fetch()) {
            return std::unexpected(
                fmt::format("table {} needs addr1, city and state set before fetching", i));
        }
    }

    fetch::GeocodeFetcher fetcher(config_.endpoint, config_.api_key, config_.http);
    std::vector<FetchSummary> summaries;
    summaries.reserve(tables_.size());
    for (auto& table : tables_) {
        spdlog::info("fetching {} coordinates for {}", table.rows(), table.source_path());
        auto report = fetcher.fetch(table, config_.fetch);
        if (!report) {
            return std::unexpected(report.error());
        }
        auto path = io::fetch_output_path(table, config_.output_dir);
        spdlog::info("writing output to {}", path.string());
        if (auto written = io::write_fetch_output(table, path); !written) {
            return std::unexpected(written.error());
        }
        summaries.push_back(FetchSummary{.path = std::move(path), .report = *report});
    }
    return summaries;
}

auto Session::match() -> std::expected<MatchSummary, std::string> {
    if (tables_.empty()) {
        return std::unexpected("no tables loaded");
    }
    for (std::size_t i = 0; i < tables_.size(); ++i) {
        if (!tables_[i].ready_to_match()) {
            return std::unexpected(fmt::format(
                "table {} has no coordinates; run fetch or set lat and lng first", i));
        }
    }

    auto merged = match::merge(std::span<const Table>(tables_), config_.merge);
    if (!merged) {
        return std::unexpected(merged.error());
    }

    MatchSummary summary;
    summary.path = config_.output_dir / std::string(io::kMatchesFileName);
    summary.rows = merged->table.rows();
    summary.folds = std::move(merged->folds);
    spdlog::info("merged {} tables into {} rows ({} join, radius {} mi)", tables_.size(),
                 summary.rows, match::join_mode_name(config_.merge.mode), config_.merge.radius);

    spdlog::info("writing output to {}", summary.path.string());
    if (auto written = io::write_matches(merged->table, summary.path); !written) {
        return std::unexpected(written.error());
    }
    return summary;
}

auto Session::describe() const -> std::string {
    std::string out;
    auto inserter = std::back_inserter(out);
    for (std::size_t i = 0; i < tables_.size(); ++i) {
        const auto& table = tables_[i];
        fmt::format_to(inserter, "[{}] {} ({} rows, '{}' delimited)\n", i, table.source_path(),
                       table.rows(), table.delimiter());
        for (std::size_t r = 0; r < kRoleCount; ++r) {
            const auto role = static_cast<Role>(r);
            const auto bound = table.role(role);
            fmt::format_to(inserter, "    {:<8} {}\n", role_name(role),
                           bound.has_value() ? table.column(*bound).name : "-");
        }
        fmt::format_to(inserter, "    {:<8} {}\n", "coords",
                       table.has_coordinates() ? "yes" : "no");
        fmt::format_to(inserter, "    {:<8} {}\n", "output",
                       fmt::join(names_of(table, table.output_columns()), ", "));
        fmt::format_to(inserter, "    {:<8} {}\n", "compare",
                       fmt::join(names_of(table, table.compare_columns()), ", "));
        fmt::format_to(inserter, "    {:<8} {}\n", "prefix", table.prefix());
    }
    fmt::format_to(inserter, "radius: {}\n", config_.merge.radius);
    fmt::format_to(inserter, "method: {}\n", match::join_mode_name(config_.merge.mode));
    fmt::format_to(inserter, "exclusive: {}\n", config_.merge.exclusive);
    return out;
}

}  // namespace geomatch::session
