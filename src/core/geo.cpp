#include <geomatch/core/geo.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace geomatch {

namespace {

constexpr auto to_radians(double degrees) noexcept -> double {
    return degrees * std::numbers::pi / 180.0;
}

}  // namespace

auto haversine_miles(const GeoPoint& a, const GeoPoint& b) noexcept -> double {
    const double delta_lat = to_radians(b.lat - a.lat);
    const double delta_lng = to_radians(b.lng - a.lng);

    const double sin_lat = std::sin(delta_lat * 0.5);
    const double sin_lng = std::sin(delta_lng * 0.5);
    // Rounding can push h just past 1 for near-antipodal pairs.
    const double h = std::clamp(
        sin_lat * sin_lat +
            std::cos(to_radians(a.lat)) * std::cos(to_radians(b.lat)) * sin_lng * sin_lng,
        0.0, 1.0);
    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return kEarthRadiusMiles * c;
}

auto planar_proxy(const GeoPoint& a, const GeoPoint& b) noexcept -> double {
    const double dlat = b.lat - a.lat;
    const double dlng = b.lng - a.lng;
    return dlat * dlat + dlng * dlng;
}

}  // namespace geomatch
