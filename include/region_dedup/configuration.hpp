// === Configuration ===========================================================
//
// Exposes the strongly-typed cache, retry and logging settings consumed by the
// deduplication engine and the region loader. `ConfigurationLoader` translates
// environment variables into these structures so downstream modules never
// touch `std::getenv` directly.

#pragma once

#include <string>
#include <vector>

#include "region_dedup/types.hpp"

namespace region_dedup {

/** @brief How committing a new region removes redundant coverage. */
enum class PruningPolicy {
    NewContainsOld,  /**< Drop stored regions the new region fully contains. */
    Bidirectional    /**< Additionally skip the new region if a live stored region contains it. */
};

/** @brief Longest duration any setting may hold; keeps nanosecond clock arithmetic in range. */
inline constexpr Milliseconds k_max_config_duration{10LL * 365 * 24 * 60 * 60 * 1'000};

/** @brief Upper bound for RetryPolicy::max_retry_count. */
inline constexpr int k_max_retry_attempts{100};

/** @brief Bounded exponential backoff applied to region fetches. */
struct RetryPolicy final {
    int max_retry_count{3};                        /**< Total fetch attempts, first one included; 0 behaves as 1. */
    Milliseconds initial_retry_delay{1'000};       /**< Delay before the second attempt. */
    double retry_multiplier{2.0};                  /**< Growth factor between retries. */
    Milliseconds max_retry_delay{10'000};          /**< Cap applied before jitter. */
    double jitter_factor{0.1};                     /**< Random extra delay, as a fraction [0, 1] of the capped delay. */
};

/**
 * @brief Runtime knobs for the region cache.
 *
 * Populated by ConfigurationLoader or directly by tests; treated as immutable
 * once handed to the engine.
 */
struct CacheConfig final {
    Milliseconds cache_expire_time{5 * 60 * 1'000};               /**< Age after which a region is stale. */
    bool enable_performance_monitoring{true};                      /**< Runs the reaper and feeds the metrics recorder. */
    double default_search_radius_m{1'000.0};                       /**< Query radius when the caller omits one. */
    PruningPolicy pruning_policy{PruningPolicy::NewContainsOld};   /**< Redundancy removal on commit. */
    RetryPolicy retry{};                                           /**< Fetch retry behaviour for RegionLoader. */
    std::string log_directory{"logs"};                             /**< Destination directory for structured logs. */
};

/** @brief Utility responsible for hydrating CacheConfig from environment variables. */
class ConfigurationLoader final {
  public:
    static CacheConfig load();
};

/** @brief Human-readable problems with @p config; empty when valid. */
[[nodiscard]] std::vector<std::string> validate(const CacheConfig& config);

/** @brief One-line summary used in startup logs. */
[[nodiscard]] std::string describe(const CacheConfig& config);

[[nodiscard]] const char* to_string(PruningPolicy policy) noexcept;

}  // namespace region_dedup
