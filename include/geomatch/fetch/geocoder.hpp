#pragma once

#include <geomatch/core/table.hpp>
#include <geomatch/fetch/http.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace geomatch::fetch {

inline constexpr std::string_view kDefaultEndpoint =
    "https://maps.googleapis.com/maps/api/geocode/json";

/// Text column added by a fetch, holding the provider's canonical address.
inline constexpr std::string_view kNormalizedAddressColumn = "norm_address";

/// Provider status reported when the key's request budget is spent.
inline constexpr std::string_view kQuotaExceededStatus = "OVER_QUERY_LIMIT";

enum class ResolveStatus : std::uint8_t {
    Resolved,
    NoAddress,      // required address parts blank; no request made
    NotFound,       // provider answered without a result
    QuotaExceeded,  // provider throttled us
    Failed,         // transport error or unusable response
    Skipped,        // never submitted (fetch stopped early on quota)
};

[[nodiscard]] auto status_name(ResolveStatus status) -> std::string_view;

struct GeocodeResult {
    ResolveStatus status = ResolveStatus::Failed;
    GeoPoint point;
    std::string formatted_address;
    /// Provider status or transport error, for diagnostics.
    std::string message;
};

struct FetchOptions {
    /// Requests submitted per second.
    double rate_limit = 30.0;
    /// Requests in flight at once.
    std::size_t max_concurrency = 30;
    /// Worker threads; 0 means one per admission slot.
    std::size_t worker_threads = 0;
    /// Stop submitting rows once the provider reports quota exhaustion.
    bool abort_on_quota = false;
    std::chrono::milliseconds progress_interval{200};
    /// Called on the fetching thread with (completed, total).
    std::function<void(std::size_t, std::size_t)> on_progress;
};

struct FetchReport {
    std::size_t total = 0;
    std::size_t resolved = 0;
    std::size_t no_address = 0;
    std::size_t not_found = 0;
    std::size_t quota_exceeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;

    [[nodiscard]] auto unresolved() const noexcept -> std::size_t { return total - resolved; }
};

[[nodiscard]] auto build_geocode_url(std::string_view endpoint, std::string_view address,
                                     std::string_view api_key) -> std::string;

/// Interpret a geocode JSON body. Never throws.
[[nodiscard]] auto parse_geocode_response(std::string_view body) -> GeocodeResult;

/// Resolves every row of a table to coordinates through a geocoding service.
///
/// Rows are submitted at `rate_limit` per second onto a worker pool, with at
/// most `max_concurrency` requests in flight. Each row resolves on its own:
/// a failing row becomes unresolved (NaN coordinates, empty address) and
/// never affects the other rows.
class GeocodeFetcher {
   public:
    GeocodeFetcher(std::string endpoint, std::string api_key, HttpGet http);

    /// Geocode one formatted address with a single request.
    [[nodiscard]] auto resolve(const std::string& address) const -> GeocodeResult;

    /// Geocode every row of `table` and store the coordinates and the
    /// normalized address column in it. The table is untouched on error.
    auto fetch(Table& table, const FetchOptions& options)
        -> std::expected<FetchReport, std::string>;

    /// Rows finished by the current or last fetch.
    [[nodiscard]] auto completed() const noexcept -> std::size_t {
        return completed_.load(std::memory_order_acquire);
    }

   private:
    std::string endpoint_;
    std::string api_key_;
    HttpGet http_;
    std::atomic<std::size_t> completed_{0};
};

}  // namespace geomatch::fetch
