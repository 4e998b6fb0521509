#include "region_dedup/geo_math.hpp"

#include <cmath>
#include <numbers>

namespace region_dedup::geo {

namespace {
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}  // namespace

double distance_m(const GeoPoint& from, const GeoPoint& to) noexcept {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = degrees_to_radians(to.latitude_deg - from.latitude_deg);
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

bool contains(const GeoCircle& outer, const GeoPoint& center, double radius_m) noexcept {
    return distance_m(outer.center, center) + radius_m <= outer.radius_m;
}

bool contains(const CachedRegion& region, const GeoPoint& center, double radius_m) noexcept {
    return contains(region.circle(), center, radius_m);
}

bool overlaps(const GeoCircle& circle, const GeoPoint& center, double radius_m) noexcept {
    return distance_m(circle.center, center) < circle.radius_m + radius_m;
}

bool overlaps(const CachedRegion& region, const GeoPoint& center, double radius_m) noexcept {
    return overlaps(region.circle(), center, radius_m);
}

}  // namespace region_dedup::geo
