// === Region Store ============================================================
//
// Thread-safe id -> CachedRegion map shared by query callers, commit callbacks
// and the background reaper. Each operation is atomic on its own; a scan that
// races with concurrent writers sees some consistent state of the map at the
// moment it took the lock, nothing stronger.

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "region_dedup/cached_region.hpp"

namespace region_dedup {

class RegionStore final {
  public:
    using Predicate = std::function<bool(const CachedRegion&)>;

    /** @brief Store @p region under its id; returns true when an entry was replaced. */
    bool insert_or_replace(CachedRegionPtr region);
    /** @brief Remove the entry for @p id; returns true when something was removed. */
    bool remove(const std::string& id);
    /** @brief Remove every region matching @p predicate under a single lock. */
    CachedRegionList remove_if(const Predicate& predicate);
    /** @brief Remove every region older than @p expire_time as of @p now. */
    CachedRegionList remove_expired(TimePoint now, Milliseconds expire_time);

    [[nodiscard]] std::optional<CachedRegionPtr> find(const std::string& id) const;

    /**
     * @brief Copy of the current regions, newest first.
     *
     * Ties on `created_at` are broken by ascending id so searches that take the
     * first match are reproducible.
     */
    [[nodiscard]] CachedRegionList snapshot() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    void clear();

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CachedRegionPtr> map_regions_;
};

}  // namespace region_dedup
