// === Geo Math ================================================================
//
// Stateless great-circle helpers used to decide whether a query disk is
// already covered by a cached disk. All distances are in metres on a sphere
// of radius k_earth_radius_m.

#pragma once

#include "region_dedup/cached_region.hpp"
#include "region_dedup/types.hpp"

namespace region_dedup::geo {

inline constexpr double k_earth_radius_m{6'371'000.0};

/** @brief Haversine distance between two points in metres. */
[[nodiscard]] double distance_m(const GeoPoint& from, const GeoPoint& to) noexcept;

/**
 * @brief True when the whole query disk lies inside @p outer.
 *
 * Holds iff `distance(outer.center, center) + radius_m <= outer.radius_m`.
 * Center-in-circle is not enough: a partially covered query is not a hit.
 */
[[nodiscard]] bool contains(const GeoCircle& outer, const GeoPoint& center, double radius_m) noexcept;
[[nodiscard]] bool contains(const CachedRegion& region, const GeoPoint& center, double radius_m) noexcept;

/**
 * @brief True when the disks intersect or one is inside the other.
 *
 * Uses a strict inequality, so disks that only touch do not overlap.
 */
[[nodiscard]] bool overlaps(const GeoCircle& circle, const GeoPoint& center, double radius_m) noexcept;
[[nodiscard]] bool overlaps(const CachedRegion& region, const GeoPoint& center, double radius_m) noexcept;

}  // namespace region_dedup::geo
