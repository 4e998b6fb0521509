// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight value types used throughout
// the cache (time primitives, geographic points, location-tagged records).

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace region_dedup {

/**
 * @brief Alias for the steady clock used for region ages and reaper cadence.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Millisecond durations used for expiry and retry delays.
 */
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeoPoint final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */

    bool operator==(const GeoPoint&) const = default;
};

/**
 * @brief A single location-tagged feed item returned by a region fetch.
 *
 * The cache treats the payload fields as opaque; only `location` takes part
 * in distance filtering. Two records are the same record when every field
 * matches.
 */
struct LocationRecord final {
    std::string record_id{};      /**< Server-side identifier of the audio post. */
    std::string user_id{};        /**< Author of the post. */
    std::string emotion{};        /**< Emotion tag attached to the post. */
    std::string audio_url{};      /**< Playback URL. */
    std::string location_name{};  /**< Human-readable place name, may be empty. */
    GeoPoint location{};          /**< Where the post was recorded. */

    bool operator==(const LocationRecord&) const = default;
};

/** @brief Content hash so records can be deduplicated in unordered sets. */
struct LocationRecordHash final {
    [[nodiscard]] std::size_t operator()(const LocationRecord& record) const noexcept;
};

}  // namespace region_dedup
