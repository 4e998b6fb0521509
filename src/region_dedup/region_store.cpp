#include "region_dedup/region_store.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace region_dedup {

bool RegionStore::insert_or_replace(CachedRegionPtr region) {
    if (region == nullptr) {
        throw std::invalid_argument("RegionStore cannot hold a null region");
    }
    std::unique_lock lock(mutex_);
    std::string key = region->id;
    const bool inserted = map_regions_.insert_or_assign(std::move(key), std::move(region)).second;
    return !inserted;
}

bool RegionStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    return map_regions_.erase(id) > 0;
}

CachedRegionList RegionStore::remove_if(const Predicate& predicate) {
    CachedRegionList list_removed;
    std::unique_lock lock(mutex_);
    for (auto iterator_region = map_regions_.begin(); iterator_region != map_regions_.end();) {
        if (predicate(*iterator_region->second)) {
            list_removed.push_back(iterator_region->second);
            iterator_region = map_regions_.erase(iterator_region);
        } else {
            ++iterator_region;
        }
    }
    return list_removed;
}

CachedRegionList RegionStore::remove_expired(TimePoint now, Milliseconds expire_time) {
    return remove_if([now, expire_time](const CachedRegion& region) {
        return region.is_expired(now, expire_time);
    });
}

std::optional<CachedRegionPtr> RegionStore::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto iterator_region = map_regions_.find(id);
    if (iterator_region == map_regions_.end()) {
        return std::nullopt;
    }
    return iterator_region->second;
}

CachedRegionList RegionStore::snapshot() const {
    CachedRegionList list_regions;
    {
        std::shared_lock lock(mutex_);
        list_regions.reserve(map_regions_.size());
        for (const auto& [id, region] : map_regions_) {
            list_regions.push_back(region);
        }
    }
    std::sort(list_regions.begin(), list_regions.end(), [](const CachedRegionPtr& lhs, const CachedRegionPtr& rhs) {
        if (lhs->created_at != rhs->created_at) {
            return lhs->created_at > rhs->created_at;
        }
        return lhs->id < rhs->id;
    });
    return list_regions;
}

std::size_t RegionStore::size() const {
    std::shared_lock lock(mutex_);
    return map_regions_.size();
}

bool RegionStore::empty() const {
    std::shared_lock lock(mutex_);
    return map_regions_.empty();
}

void RegionStore::clear() {
    std::unique_lock lock(mutex_);
    map_regions_.clear();
}

}  // namespace region_dedup
