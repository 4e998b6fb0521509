// === Region Loader ===========================================================
//
// Orchestrates one "records near this point" request: consult the
// deduplication engine, fetch through the network seam when the cache cannot
// answer, retry transient failures with bounded exponential backoff, and
// commit the fetched region back into the cache.

#pragma once

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "region_dedup/configuration.hpp"
#include "region_dedup/deduplication_engine.hpp"
#include "region_dedup/logging.hpp"
#include "region_dedup/region_fetcher.hpp"

namespace region_dedup {

/** @brief Where the records of a LoadOutcome came from. */
enum class LoadSource {
    Cache,    /**< Served entirely from a containing cached region. */
    Network   /**< Fetched and committed under `request_id`. */
};

/** @brief Result of RegionLoader::load. */
struct LoadOutcome final {
    std::vector<LocationRecord> records{};
    LoadSource source{LoadSource::Cache};
    std::string request_id{};                       /**< Id of the serving or newly committed region. */
    int attempts{};                                 /**< Fetch attempts made; 0 for cache hits. */
    std::vector<LocationRecord> partial_records{};  /**< Advisory data of a partial hit, shown while fetching. */
};

class RegionLoader final {
  public:
    using SleepFunction = std::function<void(Milliseconds)>;

    /**
     * @param engine Shared cache; must outlive the loader.
     * @param fetcher Network seam used on misses and partial hits.
     * @param retry_policy Attempt budget and backoff applied to FetchError.
     * @param sleep Waits between attempts; defaults to std::this_thread::sleep_for.
     */
    RegionLoader(DeduplicationEngine& engine,
                 RegionFetcherPtr fetcher,
                 RetryPolicy retry_policy,
                 SleepFunction sleep = {});

    /**
     * @brief Load the records within @p radius_m of @p center.
     *
     * @p force_refresh bypasses the cache check but still commits the result.
     * Makes at most max_attempts() fetches and rethrows the last FetchError
     * once they are used up; other exceptions from the fetcher propagate
     * immediately.
     */
    LoadOutcome load(const GeoPoint& center, double radius_m, bool force_refresh = false);

    /** @brief Total fetch attempts per load; never below one. */
    [[nodiscard]] int max_attempts() const noexcept;

    /** @brief Exponential delay before attempt `failed_attempt + 1`, capped, without jitter. */
    [[nodiscard]] Milliseconds capped_retry_delay(int failed_attempt) const;

    /** @brief capped_retry_delay() plus up to `jitter_factor` of it at random. */
    [[nodiscard]] Milliseconds retry_delay(int failed_attempt);

  private:
    std::vector<LocationRecord> fetch_with_retry(const GeoPoint& center, double radius_m, const std::string& request_id, int& attempts);

    DeduplicationEngine& engine_;
    RegionFetcherPtr fetcher_;
    RetryPolicy retry_policy_;
    SleepFunction sleep_;
    std::mt19937_64 random_engine_;
    std::shared_ptr<spdlog::logger> logger_;
};

[[nodiscard]] const char* to_string(LoadSource source) noexcept;

}  // namespace region_dedup
