// === Region Fetcher ==========================================================
//
// Seam towards the network client that loads the records around a point.
// Implementations throw FetchError for transient failures the loader may
// retry; any other exception is treated as fatal for the request.

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "region_dedup/types.hpp"

namespace region_dedup {

/** @brief Transient fetch failure (timeout, unreachable host, 5xx). */
class FetchError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class RegionFetcher {
  public:
    virtual ~RegionFetcher() = default;

    /** @brief Load every record within @p radius_m of @p center. */
    virtual std::vector<LocationRecord> fetch(const GeoPoint& center, double radius_m) = 0;
};

using RegionFetcherPtr = std::shared_ptr<RegionFetcher>;

}  // namespace region_dedup
