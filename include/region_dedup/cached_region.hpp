// === Cached Region ===========================================================
//
// Describes one satisfied query: the disk that was fetched, the records the
// fetch returned, and when it happened. Regions are immutable once created and
// are shared between the store and the results handed to callers.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "region_dedup/types.hpp"

namespace region_dedup {

/** @brief A circle on the Earth's surface. */
struct GeoCircle final {
    GeoPoint center{};
    double radius_m{};
};

/** @brief Coverage and payload of one completed region fetch. */
struct CachedRegion final {
    std::string id{};                      /**< Request identifier, also the store key. */
    GeoPoint center{};                     /**< Center of the fetched disk. */
    double radius_m{};                     /**< Radius of the fetched disk in metres. */
    std::vector<LocationRecord> records{}; /**< Exactly the items the fetch returned. */
    TimePoint created_at{};                /**< When the fetch result was committed. */

    [[nodiscard]] GeoCircle circle() const noexcept {
        return GeoCircle{center, radius_m};
    }

    /** @brief True once the region is strictly older than @p expire_time. */
    [[nodiscard]] bool is_expired(TimePoint now, Milliseconds expire_time) const noexcept {
        return now - created_at > expire_time;
    }
};

using CachedRegionPtr = std::shared_ptr<const CachedRegion>;
using CachedRegionList = std::vector<CachedRegionPtr>;

}  // namespace region_dedup
