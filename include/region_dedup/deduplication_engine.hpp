// === Deduplication Engine ====================================================
//
// Decides whether a query disk is already covered by cached regions and keeps
// the region store lean as fetch results are committed. One engine instance is
// owned by the application and passed by reference to every caller; all
// operations are safe to call concurrently and never block on I/O.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "region_dedup/cache_metrics_recorder.hpp"
#include "region_dedup/cached_region.hpp"
#include "region_dedup/configuration.hpp"
#include "region_dedup/expiry_reaper.hpp"
#include "region_dedup/logging.hpp"
#include "region_dedup/region_store.hpp"
#include "region_dedup/request_id_generator.hpp"
#include "region_dedup/stats_collector.hpp"

namespace region_dedup {

/** @brief A stored region fully contains the query disk. */
struct CacheHit final {
    std::vector<LocationRecord> records{};
    CachedRegionPtr region{};
};

/** @brief Nothing usable is cached; fetch and commit under @p request_id. */
struct CacheMiss final {
    std::string request_id{};
};

/**
 * @brief Stored regions intersect the query disk without covering it.
 *
 * Advisory: `merged_records` holds the cached records inside the query disk,
 * but the caller still fetches under `request_id` and commits the result.
 */
struct PartialHit final {
    std::vector<LocationRecord> merged_records{};
    std::string request_id{};
    CachedRegionList overlapping_regions{};
};

using RequestResult = std::variant<CacheHit, CacheMiss, PartialHit>;

class DeduplicationEngine final {
  public:
    explicit DeduplicationEngine(CacheConfig config, CacheMetricsRecorderPtr metrics_recorder = nullptr);
    ~DeduplicationEngine();

    DeduplicationEngine(const DeduplicationEngine&) = delete;
    DeduplicationEngine& operator=(const DeduplicationEngine&) = delete;

    [[nodiscard]] const CacheConfig& config() const noexcept;

    /** @brief Classify a query using the configured default radius and the current time. */
    [[nodiscard]] RequestResult check_request(const GeoPoint& center);
    [[nodiscard]] RequestResult check_request(const GeoPoint& center, double radius_m);
    /**
     * @brief Classify a query disk against the cache as of @p now.
     *
     * Counts the request, evicts expired regions, then looks for a containing
     * region, then for overlapping regions. Throws std::invalid_argument for
     * a malformed center or radius.
     */
    [[nodiscard]] RequestResult check_request(const GeoPoint& center, double radius_m, TimePoint now);

    void cache_result(const std::string& request_id,
                      const GeoPoint& center,
                      double radius_m,
                      std::vector<LocationRecord> records);
    /**
     * @brief Commit a completed fetch and prune regions it makes redundant.
     *
     * With PruningPolicy::Bidirectional the commit is skipped when a live
     * stored region already contains the new disk.
     */
    void cache_result(const std::string& request_id,
                      const GeoPoint& center,
                      double radius_m,
                      std::vector<LocationRecord> records,
                      TimePoint now);

    [[nodiscard]] std::string generate_request_id();

    /** @brief Exact-match lookup without touching counters or the store. */
    [[nodiscard]] bool is_region_cached(const GeoPoint& center, double radius_m) const;
    [[nodiscard]] bool is_region_cached(const GeoPoint& center, double radius_m, TimePoint now) const;
    [[nodiscard]] std::optional<std::vector<LocationRecord>> cached_data(const GeoPoint& center, double radius_m) const;
    [[nodiscard]] std::optional<std::vector<LocationRecord>> cached_data(const GeoPoint& center, double radius_m, TimePoint now) const;

    [[nodiscard]] CacheStats get_cache_stats() const;
    void reset_stats();
    void clear_cache();
    [[nodiscard]] std::size_t cache_size() const;

    /** @brief Stop the reaper, drop every region and zero the counters. */
    void cleanup();

    /** @brief Background reaper, or nullptr when monitoring is disabled. */
    [[nodiscard]] const ExpiryReaper* expiry_reaper() const noexcept;

  private:
    [[nodiscard]] CachedRegionPtr find_exact_match(const CachedRegionList& list_regions,
                                                   const GeoPoint& center,
                                                   double radius_m,
                                                   TimePoint now) const;
    [[nodiscard]] std::vector<LocationRecord> merge_overlapping_records(const CachedRegionList& list_overlapping,
                                                                        const GeoPoint& center,
                                                                        double radius_m) const;
    void prune_contained_by(const CachedRegion& new_region);
    void report_hit();
    void report_miss();

    CacheConfig config_;
    CacheMetricsRecorderPtr metrics_recorder_;
    RegionStore region_store_;
    StatsCollector stats_collector_;
    RequestIdGenerator request_id_generator_;
    std::unique_ptr<ExpiryReaper> expiry_reaper_;
    std::atomic<bool> flag_cleaned_up_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace region_dedup
