#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "region_dedup/configuration.hpp"
#include "region_dedup/deduplication_engine.hpp"
#include "region_dedup/geo_math.hpp"
#include "region_dedup/logging.hpp"
#include "region_dedup/region_loader.hpp"
#include "region_dedup/version.hpp"

namespace {

using namespace region_dedup;

constexpr GeoPoint k_city_center{30.0, 120.0};

/** @brief Stands in for the feed API with a fixed set of posts around the city center. */
class DemoFetcher final : public RegionFetcher {
  public:
    DemoFetcher() {
        list_posts_.push_back(LocationRecord{"post-1", "user-a", "calm", "https://example.invalid/a.m4a", "West Lake", {30.0, 120.0}});
        list_posts_.push_back(LocationRecord{"post-2", "user-b", "happy", "https://example.invalid/b.m4a", "Broken Bridge", {30.002, 120.001}});
        list_posts_.push_back(LocationRecord{"post-3", "user-c", "sad", "https://example.invalid/c.m4a", "Leifeng Pagoda", {29.998, 119.999}});
        list_posts_.push_back(LocationRecord{"post-4", "user-a", "excited", "https://example.invalid/d.m4a", "Wulin Square", {30.012, 120.011}});
        list_posts_.push_back(LocationRecord{"post-5", "user-d", "calm", "https://example.invalid/e.m4a", "Xixi Wetland", {31.0, 121.0}});
    }

    std::vector<LocationRecord> fetch(const GeoPoint& center, double radius_m) override {
        ++fetch_count_;
        std::vector<LocationRecord> list_found;
        for (const LocationRecord& post : list_posts_) {
            if (geo::distance_m(center, post.location) <= radius_m) {
                list_found.push_back(post);
            }
        }
        return list_found;
    }

    [[nodiscard]] int fetch_count() const noexcept {
        return fetch_count_;
    }

  private:
    std::vector<LocationRecord> list_posts_;
    int fetch_count_{0};
};

void run_scenario(DeduplicationEngine& engine, RegionLoader& loader, const DemoFetcher& fetcher) {
    auto logger = get_logger();

    struct Query final {
        GeoPoint center;
        double radius_m;
    };
    const std::vector<Query> list_queries{
        {k_city_center, 1'000.0},
        {k_city_center, 500.0},
        {GeoPoint{30.01, 120.01}, 1'000.0},
        {GeoPoint{31.0, 121.0}, 500.0},
        {GeoPoint{30.005, 120.005}, 3'000.0},
        {k_city_center, 800.0},
    };

    for (const Query& query : list_queries) {
        const LoadOutcome outcome = loader.load(query.center, query.radius_m);
        logger->info("Query ({}, {}) r={} m -> {} records from {} (request {})",
                     query.center.latitude_deg,
                     query.center.longitude_deg,
                     query.radius_m,
                     outcome.records.size(),
                     to_string(outcome.source),
                     outcome.request_id);
    }

    const CacheStats stats = engine.get_cache_stats();
    logger->info("Cache stats: total={} hits={} partial={} misses={} hit_rate={:.1f}% regions={} fetches={}",
                 stats.total_requests,
                 stats.cache_hits,
                 stats.partial_hits,
                 stats.cache_misses,
                 stats.hit_rate_percent,
                 stats.cached_regions,
                 fetcher.fetch_count());
}

}  // namespace

int main() {
    using namespace region_dedup;

    try {
        CacheConfig config = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("REGION_DEDUP_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        get_logger()->info("region_dedup demo {} logging to {}", k_version, log_file_path());

        DeduplicationEngine engine{config};
        auto fetcher = std::make_shared<DemoFetcher>();
        RegionLoader loader{engine, fetcher, config.retry};

        run_scenario(engine, loader, *fetcher);
        engine.cleanup();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
