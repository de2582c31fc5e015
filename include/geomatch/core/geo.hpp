#pragma once

#include <cmath>
#include <limits>

namespace geomatch {

/// Mean Earth radius in miles. Every distance in geomatch is in miles.
inline constexpr double kEarthRadiusMiles = 3958.8;

/// Sentinel coordinate for rows that could not be resolved.
inline constexpr double kUnresolved = std::numeric_limits<double>::quiet_NaN();

struct GeoPoint {
    double lat = kUnresolved;
    double lng = kUnresolved;

    /// False when either axis is NaN or infinite.
    [[nodiscard]] auto resolved() const noexcept -> bool {
        return std::isfinite(lat) && std::isfinite(lng);
    }

    /// Exact coordinate equality; NaN never compares equal.
    [[nodiscard]] auto same_location(const GeoPoint& other) const noexcept -> bool {
        return lat == other.lat && lng == other.lng;
    }

    /// Per-axis arithmetic mean of two points.
    [[nodiscard]] auto midpoint(const GeoPoint& other) const noexcept -> GeoPoint {
        return GeoPoint{.lat = (lat + other.lat) * 0.5, .lng = (lng + other.lng) * 0.5};
    }
};

/// Great-circle distance in miles.
[[nodiscard]] auto haversine_miles(const GeoPoint& a, const GeoPoint& b) noexcept -> double;

/// Squared euclidean distance in degree space.
///
/// Only meaningful for ranking candidates against the same source point; it is
/// not a distance in any physical unit.
[[nodiscard]] auto planar_proxy(const GeoPoint& a, const GeoPoint& b) noexcept -> double;

}  // namespace geomatch
