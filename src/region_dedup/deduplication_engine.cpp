#include "region_dedup/deduplication_engine.hpp"

#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "region_dedup/geo_math.hpp"

namespace region_dedup {

namespace {

void validate_center(const GeoPoint& center) {
    if (!std::isfinite(center.latitude_deg) || !std::isfinite(center.longitude_deg)) {
        throw std::invalid_argument("Query center must have finite coordinates");
    }
    if (center.latitude_deg < -90.0 || center.latitude_deg > 90.0) {
        throw std::invalid_argument("Query center latitude must lie within [-90, 90]");
    }
}

void validate_radius(double radius_m) {
    if (!std::isfinite(radius_m) || radius_m < 0.0) {
        throw std::invalid_argument("Query radius must be a finite, non-negative distance");
    }
}

}  // namespace

DeduplicationEngine::DeduplicationEngine(CacheConfig config, CacheMetricsRecorderPtr metrics_recorder)
    : config_(std::move(config)),
      metrics_recorder_(std::move(metrics_recorder)),
      logger_(get_logger()) {
    if (config_.cache_expire_time <= Milliseconds::zero() || config_.cache_expire_time > k_max_config_duration) {
        throw std::invalid_argument("DeduplicationEngine requires a positive cache expire time of at most ten years");
    }
    validate_radius(config_.default_search_radius_m);

    if (config_.enable_performance_monitoring) {
        expiry_reaper_ = std::make_unique<ExpiryReaper>(region_store_, config_.cache_expire_time);
        expiry_reaper_->start();
    }
    logger_->info("Deduplication engine ready: expire_ms={} pruning={} reaper={}",
                  config_.cache_expire_time.count(),
                  to_string(config_.pruning_policy),
                  expiry_reaper_ != nullptr ? "on" : "off");
}

DeduplicationEngine::~DeduplicationEngine() {
    cleanup();
}

const CacheConfig& DeduplicationEngine::config() const noexcept {
    return config_;
}

RequestResult DeduplicationEngine::check_request(const GeoPoint& center) {
    return check_request(center, config_.default_search_radius_m, SteadyClock::now());
}

RequestResult DeduplicationEngine::check_request(const GeoPoint& center, double radius_m) {
    return check_request(center, radius_m, SteadyClock::now());
}

RequestResult DeduplicationEngine::check_request(const GeoPoint& center, double radius_m, TimePoint now) {
    validate_center(center);
    validate_radius(radius_m);

    stats_collector_.record_request();
    logger_->debug("Checking request for center ({}, {}) radius {} m", center.latitude_deg, center.longitude_deg, radius_m);

    for (const CachedRegionPtr& region : region_store_.remove_expired(now, config_.cache_expire_time)) {
        logger_->debug("Removed expired cache region: {}", region->id);
    }

    const CachedRegionList list_regions = region_store_.snapshot();

    if (CachedRegionPtr exact_match = find_exact_match(list_regions, center, radius_m, now); exact_match != nullptr) {
        stats_collector_.record_hit();
        report_hit();
        logger_->debug("Cache hit on region {} with {} records", exact_match->id, exact_match->records.size());
        return CacheHit{exact_match->records, std::move(exact_match)};
    }

    CachedRegionList list_overlapping;
    for (const CachedRegionPtr& region : list_regions) {
        if (!region->is_expired(now, config_.cache_expire_time) && geo::overlaps(*region, center, radius_m)) {
            list_overlapping.push_back(region);
        }
    }

    if (!list_overlapping.empty()) {
        stats_collector_.record_partial_hit();
        report_hit();
        PartialHit partial_hit{};
        partial_hit.merged_records = merge_overlapping_records(list_overlapping, center, radius_m);
        partial_hit.request_id = generate_request_id();
        partial_hit.overlapping_regions = std::move(list_overlapping);
        logger_->debug("Partial cache hit with {} overlapping regions and {} merged records",
                       partial_hit.overlapping_regions.size(),
                       partial_hit.merged_records.size());
        return partial_hit;
    }

    stats_collector_.record_miss();
    report_miss();
    CacheMiss cache_miss{generate_request_id()};
    logger_->debug("Cache miss, issuing request {}", cache_miss.request_id);
    return cache_miss;
}

void DeduplicationEngine::cache_result(const std::string& request_id,
                                       const GeoPoint& center,
                                       double radius_m,
                                       std::vector<LocationRecord> records) {
    cache_result(request_id, center, radius_m, std::move(records), SteadyClock::now());
}

void DeduplicationEngine::cache_result(const std::string& request_id,
                                       const GeoPoint& center,
                                       double radius_m,
                                       std::vector<LocationRecord> records,
                                       TimePoint now) {
    if (request_id.empty()) {
        throw std::invalid_argument("cache_result requires a request id");
    }
    validate_center(center);
    validate_radius(radius_m);

    auto new_region = std::make_shared<const CachedRegion>(CachedRegion{request_id, center, radius_m, std::move(records), now});

    if (config_.pruning_policy == PruningPolicy::Bidirectional) {
        // Identical disks contain each other; the newer one wins those ties.
        for (const CachedRegionPtr& region : region_store_.snapshot()) {
            if (region->id == request_id || region->is_expired(now, config_.cache_expire_time)) {
                continue;
            }
            if (geo::contains(*region, center, radius_m) && !geo::contains(*new_region, region->center, region->radius_m)) {
                logger_->debug("Skipping region {}; already covered by {}", request_id, region->id);
                return;
            }
        }
    }

    if (region_store_.insert_or_replace(new_region)) {
        logger_->warn("Request id {} was already cached; replaced the previous region", request_id);
    }
    logger_->debug("Cached result for request {} with {} records", request_id, new_region->records.size());

    prune_contained_by(*new_region);
}

std::string DeduplicationEngine::generate_request_id() {
    return request_id_generator_.next();
}

bool DeduplicationEngine::is_region_cached(const GeoPoint& center, double radius_m) const {
    return is_region_cached(center, radius_m, SteadyClock::now());
}

bool DeduplicationEngine::is_region_cached(const GeoPoint& center, double radius_m, TimePoint now) const {
    return find_exact_match(region_store_.snapshot(), center, radius_m, now) != nullptr;
}

std::optional<std::vector<LocationRecord>> DeduplicationEngine::cached_data(const GeoPoint& center, double radius_m) const {
    return cached_data(center, radius_m, SteadyClock::now());
}

std::optional<std::vector<LocationRecord>> DeduplicationEngine::cached_data(const GeoPoint& center,
                                                                            double radius_m,
                                                                            TimePoint now) const {
    const CachedRegionPtr exact_match = find_exact_match(region_store_.snapshot(), center, radius_m, now);
    if (exact_match == nullptr) {
        return std::nullopt;
    }
    return exact_match->records;
}

CacheStats DeduplicationEngine::get_cache_stats() const {
    return stats_collector_.snapshot(region_store_.size());
}

void DeduplicationEngine::reset_stats() {
    stats_collector_.reset();
    logger_->debug("Reset cache statistics");
}

void DeduplicationEngine::clear_cache() {
    region_store_.clear();
    logger_->debug("Cleared all cached regions");
}

std::size_t DeduplicationEngine::cache_size() const {
    return region_store_.size();
}

void DeduplicationEngine::cleanup() {
    if (flag_cleaned_up_.exchange(true)) {
        return;
    }
    if (expiry_reaper_ != nullptr) {
        expiry_reaper_->stop();
    }
    region_store_.clear();
    stats_collector_.reset();
    logger_->info("Deduplication engine cleaned up");
}

const ExpiryReaper* DeduplicationEngine::expiry_reaper() const noexcept {
    return expiry_reaper_.get();
}

CachedRegionPtr DeduplicationEngine::find_exact_match(const CachedRegionList& list_regions,
                                                      const GeoPoint& center,
                                                      double radius_m,
                                                      TimePoint now) const {
    for (const CachedRegionPtr& region : list_regions) {
        if (!region->is_expired(now, config_.cache_expire_time) && geo::contains(*region, center, radius_m)) {
            return region;
        }
    }
    return nullptr;
}

std::vector<LocationRecord> DeduplicationEngine::merge_overlapping_records(const CachedRegionList& list_overlapping,
                                                                           const GeoPoint& center,
                                                                           double radius_m) const {
    std::vector<LocationRecord> list_merged;
    std::unordered_set<LocationRecord, LocationRecordHash> set_seen;
    for (const CachedRegionPtr& region : list_overlapping) {
        for (const LocationRecord& record : region->records) {
            if (geo::distance_m(center, record.location) > radius_m) {
                continue;
            }
            if (set_seen.insert(record).second) {
                list_merged.push_back(record);
            }
        }
    }
    return list_merged;
}

void DeduplicationEngine::prune_contained_by(const CachedRegion& new_region) {
    const GeoCircle new_circle = new_region.circle();
    const CachedRegionList list_pruned = region_store_.remove_if([&new_region, &new_circle](const CachedRegion& region) {
        return region.id != new_region.id && geo::contains(new_circle, region.center, region.radius_m);
    });
    for (const CachedRegionPtr& region : list_pruned) {
        logger_->debug("Removing redundant cache region: {}", region->id);
    }
}

void DeduplicationEngine::report_hit() {
    if (config_.enable_performance_monitoring && metrics_recorder_ != nullptr) {
        metrics_recorder_->record_cache_hit();
    }
}

void DeduplicationEngine::report_miss() {
    if (config_.enable_performance_monitoring && metrics_recorder_ != nullptr) {
        metrics_recorder_->record_cache_miss();
    }
}

}  // namespace region_dedup
