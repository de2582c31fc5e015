#include <geomatch/fetch/geocoder.hpp>

#include <geomatch/fetch/admission_gate.hpp>
#include <geomatch/fetch/ticker.hpp>
#include <geomatch/fetch/worker_pool.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <optional>
#include <utility>
#include <vector>

namespace geomatch::fetch {

namespace {

using json = nlohmann::json;

auto unresolved(ResolveStatus status, std::string message = {}) -> GeocodeResult {
    return GeocodeResult{
        .status = status,
        .point = GeoPoint{},
        .formatted_address = {},
        .message = std::move(message),
    };
}

/// results[0].geometry.location, or nullptr when any step is missing.
auto first_location(const json& doc) -> const json* {
    auto results = doc.find("results");
    if (results == doc.end() || !results->is_array() || results->empty()) {
        return nullptr;
    }
    const auto& first = results->front();
    if (!first.is_object()) {
        return nullptr;
    }
    auto geometry = first.find("geometry");
    if (geometry == first.end() || !geometry->is_object()) {
        return nullptr;
    }
    auto location = geometry->find("location");
    if (location == geometry->end() || !location->is_object()) {
        return nullptr;
    }
    return &*location;
}

void tally(FetchReport& report, ResolveStatus status) {
    switch (status) {
        case ResolveStatus::Resolved:
            ++report.resolved;
            break;
        case ResolveStatus::NoAddress:
            ++report.no_address;
            break;
        case ResolveStatus::NotFound:
            ++report.not_found;
            break;
        case ResolveStatus::QuotaExceeded:
            ++report.quota_exceeded;
            break;
        case ResolveStatus::Failed:
            ++report.failed;
            break;
        case ResolveStatus::Skipped:
            ++report.skipped;
            break;
    }
}

}  // namespace

auto status_name(ResolveStatus status) -> std::string_view {
    switch (status) {
        case ResolveStatus::Resolved:
            return "resolved";
        case ResolveStatus::NoAddress:
            return "no address";
        case ResolveStatus::NotFound:
            return "not found";
        case ResolveStatus::QuotaExceeded:
            return "quota exceeded";
        case ResolveStatus::Failed:
            return "failed";
        case ResolveStatus::Skipped:
            return "skipped";
    }
    return "unknown";
}

auto build_geocode_url(std::string_view endpoint, std::string_view address,
                       std::string_view api_key) -> std::string {
    const char separator = endpoint.find('?') == std::string_view::npos ? '?' : '&';
    return fmt::format("{}{}address={}&key={}", endpoint, separator, url_escape(address),
                       url_escape(api_key));
}

auto parse_geocode_response(std::string_view body) -> GeocodeResult {
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return unresolved(ResolveStatus::Failed, "response is not a JSON object");
    }

    std::string status;
    if (auto it = doc.find("status"); it != doc.end() && it->is_string()) {
        status = it->get<std::string>();
    }

    if (const json* location = first_location(doc)) {
        auto lat = location->find("lat");
        auto lng = location->find("lng");
        if (lat == location->end() || lng == location->end() || !lat->is_number() ||
            !lng->is_number()) {
            return unresolved(ResolveStatus::Failed, "result has no numeric location");
        }
        GeocodeResult result{
            .status = ResolveStatus::Resolved,
            .point = GeoPoint{.lat = lat->get<double>(), .lng = lng->get<double>()},
            .formatted_address = {},
            .message = status,
        };
        const auto& first = doc["results"].front();
        if (auto formatted = first.find("formatted_address");
            formatted != first.end() && formatted->is_string()) {
            result.formatted_address = formatted->get<std::string>();
        }
        return result;
    }

    if (status == kQuotaExceededStatus) {
        return unresolved(ResolveStatus::QuotaExceeded, status);
    }
    if (status.empty() || status == "OK" || status == "ZERO_RESULTS") {
        return unresolved(ResolveStatus::NotFound, status);
    }
    std::string message = status;
    if (auto it = doc.find("error_message"); it != doc.end() && it->is_string()) {
        message = fmt::format("{}: {}", status, it->get<std::string>());
    }
    return unresolved(ResolveStatus::Failed, std::move(message));
}

GeocodeFetcher::GeocodeFetcher(std::string endpoint, std::string api_key, HttpGet http)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)), http_(std::move(http)) {}

auto GeocodeFetcher::resolve(const std::string& address) const -> GeocodeResult {
    auto response = http_(build_geocode_url(endpoint_, address, api_key_));
    if (!response) {
        return unresolved(ResolveStatus::Failed, response.error());
    }
    if (response->status != 200) {
        spdlog::debug("geocode returned HTTP {} for '{}'", response->status, address);
    }
    return parse_geocode_response(response->body);
}

auto GeocodeFetcher::fetch(Table& table, const FetchOptions& options)
    -> std::expected<FetchReport, std::string> {
    if (!table.ready_to_fetch()) {
        return std::unexpected(
            fmt::format("'{}' needs addr1, city and state columns before fetching",
                        table.source_path()));
    }
    if (!std::isfinite(options.rate_limit) || options.rate_limit <= 0.0) {
        return std::unexpected("rate limit must be a positive number");
    }
    if (options.max_concurrency == 0) {
        return std::unexpected("max concurrency must be at least 1");
    }

    const std::size_t total = table.rows();
    std::vector<std::optional<std::string>> addresses;
    addresses.reserve(total);
    for (std::size_t row = 0; row < total; ++row) {
        addresses.push_back(table.formatted_address(row));
    }

    std::vector<GeocodeResult> results(total);
    completed_.store(0, std::memory_order_release);
    std::atomic<bool> quota_seen{false};

    auto last_report = std::chrono::steady_clock::now();
    auto report_progress = [&](bool force) {
        if (!options.on_progress) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        if (force || now - last_report >= options.progress_interval) {
            options.on_progress(completed(), total);
            last_report = now;
        }
    };

    AdmissionGate gate(options.max_concurrency);
    {
        WorkerPool pool(options.worker_threads == 0 ? options.max_concurrency
                                                    : options.worker_threads);
        Ticker ticker(options.rate_limit);

        for (std::size_t row = 0; row < total; ++row) {
            if (!addresses[row].has_value()) {
                results[row] = unresolved(ResolveStatus::NoAddress);
                completed_.fetch_add(1, std::memory_order_acq_rel);
                continue;
            }
            if (options.abort_on_quota && quota_seen.load(std::memory_order_acquire)) {
                results[row] = unresolved(ResolveStatus::Skipped);
                completed_.fetch_add(1, std::memory_order_acq_rel);
                continue;
            }

            ticker.wait();
            pool.submit([this, row, &addresses, &results, &gate, &quota_seen] {
                GeocodeResult result;
                {
                    auto permit = gate.acquire();
                    try {
                        result = resolve(*addresses[row]);
                    } catch (const std::exception& e) {
                        result = unresolved(ResolveStatus::Failed, e.what());
                    }
                }
                if (result.status == ResolveStatus::QuotaExceeded) {
                    quota_seen.store(true, std::memory_order_release);
                }
                if (result.status == ResolveStatus::Failed) {
                    spdlog::debug("row {}: {}", row, result.message);
                }
                results[row] = std::move(result);
                completed_.fetch_add(1, std::memory_order_acq_rel);
            });
            report_progress(false);
        }

        while (!pool.wait_idle_for(options.progress_interval)) {
            report_progress(true);
        }
    }
    report_progress(true);

    FetchReport report;
    report.total = total;
    Column<double> lat;
    Column<double> lng;
    Column<std::string> normalized;
    lat.reserve(total);
    lng.reserve(total);
    normalized.reserve(total);
    for (auto& result : results) {
        tally(report, result.status);
        lat.push_back(result.point.lat);
        lng.push_back(result.point.lng);
        normalized.push_back(std::move(result.formatted_address));
    }

    std::expected<void, std::string> stored;
    if (auto existing = table.find(kNormalizedAddressColumn)) {
        stored = table.replace_column(*existing, std::move(normalized));
    } else {
        auto added = table.add_column(std::string(kNormalizedAddressColumn), std::move(normalized));
        if (!added) {
            stored = std::unexpected(added.error());
        }
    }
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (auto ok = table.set_coordinates(std::move(lat), std::move(lng)); !ok) {
        return std::unexpected(ok.error());
    }

    if (report.failed > 0) {
        spdlog::warn("{} of {} rows failed to geocode", report.failed, total);
    }
    if (report.quota_exceeded > 0 || report.skipped > 0) {
        spdlog::warn("{} rows hit the quota limit, {} rows were not submitted",
                     report.quota_exceeded, report.skipped);
    }
    return report;
}

}  // namespace geomatch::fetch
