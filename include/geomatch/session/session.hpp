#pragma once

#include <geomatch/core/table.hpp>
#include <geomatch/fetch/geocoder.hpp>
#include <geomatch/fetch/http.hpp>
#include <geomatch/match/merge.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace geomatch::session {

/// Everything a fetch or a merge needs besides the tables themselves.
struct SessionConfig {
    std::string api_key;
    std::string endpoint = std::string(fetch::kDefaultEndpoint);
    /// Directory receiving the *_coords.csv and matches.csv artifacts.
    std::filesystem::path output_dir = ".";
    fetch::FetchOptions fetch;
    match::MergeOptions merge;
    /// Transport for geocode requests; libcurl when left empty.
    fetch::HttpGet http;
};

enum class ColumnKind : std::uint8_t {
    Output,
    Compare,
};

struct FetchSummary {
    std::filesystem::path path;
    fetch::FetchReport report;
};

struct MatchSummary {
    std::filesystem::path path;
    std::size_t rows = 0;
    std::vector<match::FoldStats> folds;
};

/// The loaded tables plus the settings the command shell edits.
///
/// Every mutating call validates its arguments first and leaves the session
/// unchanged when it reports an error.
class Session {
   public:
    explicit Session(SessionConfig config);

    /// Read a delimited file and append it as the next table.
    auto add_file(const std::filesystem::path& path) -> std::expected<std::size_t, std::string>;
    auto add_table(Table table) -> std::size_t;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return tables_.size(); }
    [[nodiscard]] auto tables() const noexcept -> const std::vector<Table>& { return tables_; }
    [[nodiscard]] auto table(std::size_t index) const -> std::expected<const Table*, std::string>;
    [[nodiscard]] auto config() const noexcept -> const SessionConfig& { return config_; }

    [[nodiscard]] auto columns(std::size_t index) const
        -> std::expected<std::vector<std::string>, std::string>;

    /// Bind `role` (id, addr1, addr2, city, state, zipcode) to `column`, or
    /// turn `column` into the coordinate axis named by lat/lng.
    auto set_role(std::size_t index, std::string_view role, std::string_view column)
        -> std::expected<void, std::string>;
    auto add_column(std::size_t index, ColumnKind kind, std::string_view column)
        -> std::expected<void, std::string>;
    auto set_prefix(std::size_t index, std::string prefix) -> std::expected<void, std::string>;

    auto set_mode(std::string_view text) -> std::expected<void, std::string>;
    auto set_radius(std::string_view text) -> std::expected<void, std::string>;
    auto set_exclusive(std::string_view text) -> std::expected<void, std::string>;

    void on_fetch_progress(std::function<void(std::size_t, std::size_t)> callback) {
        config_.fetch.on_progress = std::move(callback);
    }

    [[nodiscard]] auto ready_to_fetch() const noexcept -> bool;
    [[nodiscard]] auto ready_to_match() const noexcept -> bool;

    /// Geocode every table and write each one's *_coords.csv.
    auto fetch() -> std::expected<std::vector<FetchSummary>, std::string>;

    /// Merge every table and write matches.csv.
    auto match() -> std::expected<MatchSummary, std::string>;

    /// Human-readable dump of every table's settings and the merge options.
    [[nodiscard]] auto describe() const -> std::string;

   private:
    auto mutable_table(std::size_t index) -> std::expected<Table*, std::string>;

    SessionConfig config_;
    std::vector<Table> tables_;
};

}  // namespace geomatch::session
