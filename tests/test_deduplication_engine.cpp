#include <atomic>
#include <cmath>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "region_dedup/deduplication_engine.hpp"

using namespace region_dedup;

namespace {
// Initialized when the test run starts, after every translation unit's statics exist.
struct LoggerInitListener : Catch::TestEventListenerBase {
    using TestEventListenerBase::TestEventListenerBase;

    void testRunStarting(const Catch::TestRunInfo& test_run_info) override {
        TestEventListenerBase::testRunStarting(test_run_info);
        region_dedup::test::ensure_logger_initialized();
    }
};

constexpr Milliseconds k_expire_time{60'000};

CacheConfig make_config(PruningPolicy pruning_policy = PruningPolicy::NewContainsOld) {
    CacheConfig config{};
    config.cache_expire_time = k_expire_time;
    config.enable_performance_monitoring = false;
    config.pruning_policy = pruning_policy;
    return config;
}

LocationRecord make_record(const std::string& id, double latitude_deg, double longitude_deg) {
    LocationRecord record{};
    record.record_id = id;
    record.user_id = "user-" + id;
    record.emotion = "calm";
    record.audio_url = "https://example.invalid/" + id + ".m4a";
    record.location = GeoPoint{latitude_deg, longitude_deg};
    return record;
}

class CountingRecorder final : public CacheMetricsRecorder {
  public:
    void record_cache_hit() override {
        hits.fetch_add(1);
    }
    void record_cache_miss() override {
        misses.fetch_add(1);
    }

    std::atomic<int> hits{0};
    std::atomic<int> misses{0};
};
}  // namespace

CATCH_REGISTER_LISTENER(LoggerInitListener)

TEST_CASE("A committed region answers the same query as a cache hit") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    const GeoPoint center{30.0, 120.0};
    const std::vector<LocationRecord> records{make_record("a", 30.0, 120.0), make_record("b", 30.001, 120.001)};

    const RequestResult first = engine.check_request(center, 1'000.0, t0);
    REQUIRE(std::holds_alternative<CacheMiss>(first));
    const std::string request_id = std::get<CacheMiss>(first).request_id;
    REQUIRE_FALSE(request_id.empty());

    engine.cache_result(request_id, center, 1'000.0, records, t0);
    REQUIRE(engine.cache_size() == 1);

    const RequestResult second = engine.check_request(center, 1'000.0, t0 + Milliseconds{10});
    REQUIRE(std::holds_alternative<CacheHit>(second));
    const CacheHit& cache_hit = std::get<CacheHit>(second);
    REQUIRE(cache_hit.records == records);
    REQUIRE(cache_hit.region->id == request_id);
}

TEST_CASE("Regions expire strictly after the configured age") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    const GeoPoint center{30.0, 120.0};
    engine.cache_result("req-expiry", center, 1'000.0, {make_record("a", 30.0, 120.0)}, t0);

    SECTION("still served at exactly the expiry age") {
        REQUIRE(std::holds_alternative<CacheHit>(engine.check_request(center, 500.0, t0 + k_expire_time)));
        REQUIRE(engine.cache_size() == 1);
    }

    SECTION("a miss one millisecond later, with passive eviction") {
        const RequestResult result = engine.check_request(center, 500.0, t0 + k_expire_time + Milliseconds{1});
        REQUIRE(std::holds_alternative<CacheMiss>(result));
        REQUIRE(engine.cache_size() == 0);
    }

    SECTION("inspection skips expired regions without removing them") {
        const TimePoint later = t0 + k_expire_time + Milliseconds{1};
        REQUIRE_FALSE(engine.is_region_cached(center, 500.0, later));
        REQUIRE_FALSE(engine.cached_data(center, 500.0, later).has_value());
        REQUIRE(engine.cache_size() == 1);
    }
}

TEST_CASE("Overlapping regions produce a partial hit with merged in-range records") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();

    const LocationRecord shared_record = make_record("shared", 0.0, 0.008);
    const LocationRecord west_far = make_record("west-far", 0.0, 0.0);
    const LocationRecord west_near = make_record("west-near", 0.0, 0.005);
    const LocationRecord east_near = make_record("east-near", 0.0, 0.015);
    const LocationRecord east_far = make_record("east-far", 0.0, 0.02);

    // Centers about 2224 m apart with 1000 m radii: neither contains the other.
    engine.cache_result("req-west", GeoPoint{0.0, 0.0}, 1'000.0, {west_far, west_near, shared_record}, t0);
    engine.cache_result("req-east", GeoPoint{0.0, 0.02}, 1'000.0, {east_near, east_far, shared_record}, t0 + Milliseconds{1});
    REQUIRE(engine.cache_size() == 2);

    const RequestResult result = engine.check_request(GeoPoint{0.0, 0.01}, 1'000.0, t0 + Milliseconds{2});
    REQUIRE(std::holds_alternative<PartialHit>(result));
    const PartialHit& partial_hit = std::get<PartialHit>(result);

    REQUIRE(partial_hit.overlapping_regions.size() == 2);
    REQUIRE_FALSE(partial_hit.request_id.empty());
    REQUIRE(partial_hit.request_id != "req-west");
    REQUIRE(partial_hit.request_id != "req-east");
    REQUIRE_THAT(partial_hit.merged_records,
                 Catch::Matchers::UnorderedEquals(std::vector<LocationRecord>{west_near, east_near, shared_record}));

    const CacheStats stats = engine.get_cache_stats();
    REQUIRE(stats.partial_hits == 1);
    REQUIRE(stats.total_requests == 1);
}

TEST_CASE("Committing a larger region prunes the regions it contains") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();

    engine.cache_result("req-small-1", GeoPoint{0.0, 0.0}, 100.0, {}, t0);
    engine.cache_result("req-small-2", GeoPoint{0.0, 0.002}, 100.0, {}, t0);
    engine.cache_result("req-far", GeoPoint{1.0, 1.0}, 100.0, {}, t0);
    REQUIRE(engine.cache_size() == 3);

    engine.cache_result("req-large", GeoPoint{0.0, 0.001}, 1'000.0, {make_record("x", 0.0, 0.001)}, t0 + Milliseconds{1});
    REQUIRE(engine.cache_size() == 2);
    REQUIRE(engine.is_region_cached(GeoPoint{0.0, 0.001}, 500.0, t0 + Milliseconds{2}));
    REQUIRE(engine.is_region_cached(GeoPoint{1.0, 1.0}, 50.0, t0 + Milliseconds{2}));
}

TEST_CASE("Pruning direction follows the configured policy") {
    const TimePoint t0 = SteadyClock::now();
    const GeoPoint center{0.0, 0.0};

    SECTION("default policy keeps a new region already covered by an older one") {
        DeduplicationEngine engine{make_config(PruningPolicy::NewContainsOld)};
        engine.cache_result("req-large", center, 1'000.0, {}, t0);
        engine.cache_result("req-small", center, 100.0, {}, t0 + Milliseconds{1});
        REQUIRE(engine.cache_size() == 2);
    }

    SECTION("bidirectional policy skips a new region already covered") {
        DeduplicationEngine engine{make_config(PruningPolicy::Bidirectional)};
        engine.cache_result("req-large", center, 1'000.0, {}, t0);
        engine.cache_result("req-small", center, 100.0, {}, t0 + Milliseconds{1});
        REQUIRE(engine.cache_size() == 1);

        const RequestResult result = engine.check_request(center, 100.0, t0 + Milliseconds{2});
        REQUIRE(std::holds_alternative<CacheHit>(result));
        REQUIRE(std::get<CacheHit>(result).region->id == "req-large");
    }

    SECTION("bidirectional policy lets the newer of two identical disks win") {
        DeduplicationEngine engine{make_config(PruningPolicy::Bidirectional)};
        engine.cache_result("req-old", center, 500.0, {make_record("old", 0.0, 0.0)}, t0);
        engine.cache_result("req-new", center, 500.0, {make_record("new", 0.0, 0.0)}, t0 + Milliseconds{1});
        REQUIRE(engine.cache_size() == 1);
        const auto records = engine.cached_data(center, 500.0, t0 + Milliseconds{2});
        REQUIRE(records.has_value());
        REQUIRE(records->front().record_id == "new");
    }

    SECTION("bidirectional policy ignores expired covering regions") {
        DeduplicationEngine engine{make_config(PruningPolicy::Bidirectional)};
        engine.cache_result("req-large", center, 1'000.0, {}, t0);
        engine.cache_result("req-small", center, 100.0, {}, t0 + k_expire_time + Milliseconds{1});
        REQUIRE(engine.is_region_cached(center, 100.0, t0 + k_expire_time + Milliseconds{2}));
    }
}

TEST_CASE("Counters always add up to the number of requests") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    engine.cache_result("req-base", GeoPoint{0.0, 0.0}, 1'000.0, {}, t0);

    const std::vector<std::pair<GeoPoint, double>> list_queries{
        {GeoPoint{0.0, 0.0}, 500.0},    // hit
        {GeoPoint{0.0, 0.01}, 500.0},   // overlap
        {GeoPoint{5.0, 5.0}, 500.0},    // miss
        {GeoPoint{0.0, 0.0}, 1'000.0},  // hit
        {GeoPoint{0.0, 0.0}, 2'000.0},  // overlap
        {GeoPoint{-5.0, 5.0}, 10.0},    // miss
        {GeoPoint{-5.0, 5.0}, 0.0},     // miss
    };
    for (const auto& [center, radius_m] : list_queries) {
        (void)engine.check_request(center, radius_m, t0 + Milliseconds{1});
    }

    const CacheStats stats = engine.get_cache_stats();
    REQUIRE(stats.total_requests == list_queries.size());
    REQUIRE(stats.cache_hits == 2);
    REQUIRE(stats.partial_hits == 2);
    REQUIRE(stats.cache_misses == 3);
    REQUIRE(stats.cache_hits + stats.cache_misses + stats.partial_hits == stats.total_requests);
    REQUIRE(stats.hit_rate_percent == Approx(4.0 / 7.0 * 100.0));
    REQUIRE(stats.cached_regions == 1);

    engine.reset_stats();
    const CacheStats cleared = engine.get_cache_stats();
    REQUIRE(cleared.total_requests == 0);
    REQUIRE(cleared.hit_rate_percent == 0.0);
    REQUIRE(cleared.cached_regions == 1);
}

TEST_CASE("Example scenario around a single cached region") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    const std::vector<LocationRecord> records{
        make_record("r1", 30.0, 120.0),
        make_record("r2", 30.002, 120.001),
        make_record("r3", 29.998, 119.999),
    };
    engine.cache_result(engine.generate_request_id(), GeoPoint{30.0, 120.0}, 1'000.0, records, t0);

    const RequestResult inner = engine.check_request(GeoPoint{30.0, 120.0}, 500.0, t0 + Milliseconds{1});
    REQUIRE(std::holds_alternative<CacheHit>(inner));
    REQUIRE(std::get<CacheHit>(inner).records.size() == 3);

    const RequestResult shifted = engine.check_request(GeoPoint{30.01, 120.01}, 1'000.0, t0 + Milliseconds{2});
    REQUIRE(std::holds_alternative<PartialHit>(shifted));
    REQUIRE(std::get<PartialHit>(shifted).overlapping_regions.size() == 1);

    const RequestResult distant = engine.check_request(GeoPoint{31.0, 121.0}, 500.0, t0 + Milliseconds{3});
    REQUIRE(std::holds_alternative<CacheMiss>(distant));

    const CacheStats stats = engine.get_cache_stats();
    REQUIRE(stats.cache_hits == 1);
    REQUIRE(stats.partial_hits == 1);
    REQUIRE(stats.cache_misses == 1);
}

TEST_CASE("Degenerate but valid inputs classify normally") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    const GeoPoint center{45.0, 7.0};
    engine.cache_result("req-point", center, 250.0, {make_record("p", 45.0, 7.0)}, t0);

    REQUIRE(std::holds_alternative<CacheHit>(engine.check_request(center, 0.0, t0)));
    REQUIRE(std::holds_alternative<CacheHit>(engine.check_request(center, 0.0, t0)));
    REQUIRE(std::holds_alternative<CacheHit>(engine.check_request(GeoPoint{45.001, 7.0}, 0.0, t0)));

    engine.cache_result("req-zero", GeoPoint{-45.0, -7.0}, 0.0, {}, t0);
    REQUIRE(std::holds_alternative<CacheHit>(engine.check_request(GeoPoint{-45.0, -7.0}, 0.0, t0)));
}

TEST_CASE("Inspection queries never touch counters") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    const GeoPoint center{10.0, 10.0};
    const std::vector<LocationRecord> records{make_record("i", 10.0, 10.0)};
    engine.cache_result("req-inspect", center, 800.0, records, t0);

    REQUIRE(engine.is_region_cached(center, 800.0, t0));
    REQUIRE_FALSE(engine.is_region_cached(center, 801.0, t0));
    REQUIRE(engine.cached_data(center, 100.0, t0) == records);
    REQUIRE_FALSE(engine.cached_data(GeoPoint{11.0, 10.0}, 100.0, t0).has_value());
    REQUIRE(engine.get_cache_stats().total_requests == 0);
}

TEST_CASE("Malformed inputs are rejected") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();

    REQUIRE_THROWS_AS(engine.check_request(GeoPoint{0.0, 0.0}, -1.0, t0), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.check_request(GeoPoint{91.0, 0.0}, 10.0, t0), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.check_request(GeoPoint{std::nan(""), 0.0}, 10.0, t0), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.cache_result("", GeoPoint{0.0, 0.0}, 10.0, {}, t0), std::invalid_argument);
    REQUIRE(engine.get_cache_stats().total_requests == 0);

    CacheConfig bad_config = make_config();
    bad_config.cache_expire_time = Milliseconds{0};
    REQUIRE_THROWS_AS(DeduplicationEngine{bad_config}, std::invalid_argument);
    bad_config.cache_expire_time = k_max_config_duration + Milliseconds{1};
    REQUIRE_THROWS_AS(DeduplicationEngine{bad_config}, std::invalid_argument);
}

TEST_CASE("Metrics recorder sees hits and misses only while monitoring is enabled") {
    const TimePoint t0 = SteadyClock::now();
    const GeoPoint center{0.0, 0.0};

    SECTION("enabled") {
        auto recorder = std::make_shared<CountingRecorder>();
        CacheConfig config = make_config();
        config.enable_performance_monitoring = true;
        DeduplicationEngine engine{config, recorder};
        REQUIRE(engine.expiry_reaper() != nullptr);

        (void)engine.check_request(center, 100.0, t0);
        engine.cache_result("req-metrics", center, 1'000.0, {}, t0);
        (void)engine.check_request(center, 100.0, t0);
        (void)engine.check_request(GeoPoint{0.0, 0.01}, 500.0, t0);

        REQUIRE(recorder->misses.load() == 1);
        REQUIRE(recorder->hits.load() == 2);
    }

    SECTION("disabled") {
        auto recorder = std::make_shared<CountingRecorder>();
        DeduplicationEngine engine{make_config(), recorder};
        REQUIRE(engine.expiry_reaper() == nullptr);

        (void)engine.check_request(center, 100.0, t0);
        REQUIRE(recorder->misses.load() == 0);
        REQUIRE(recorder->hits.load() == 0);
        REQUIRE(engine.get_cache_stats().cache_misses == 1);
    }
}

TEST_CASE("cleanup stops the reaper and returns to an empty ground state") {
    CacheConfig config = make_config();
    config.enable_performance_monitoring = true;
    DeduplicationEngine engine{config};
    const TimePoint t0 = SteadyClock::now();

    engine.cache_result("req-cleanup", GeoPoint{0.0, 0.0}, 1'000.0, {}, t0);
    (void)engine.check_request(GeoPoint{0.0, 0.0}, 10.0, t0);
    REQUIRE(engine.expiry_reaper()->running());

    engine.cleanup();
    REQUIRE_FALSE(engine.expiry_reaper()->running());
    REQUIRE(engine.cache_size() == 0);
    REQUIRE(engine.get_cache_stats().total_requests == 0);

    engine.cleanup();
    REQUIRE(engine.cache_size() == 0);
}

TEST_CASE("clear_cache drops regions but keeps counters") {
    DeduplicationEngine engine{make_config()};
    const TimePoint t0 = SteadyClock::now();
    engine.cache_result("req-a", GeoPoint{0.0, 0.0}, 100.0, {}, t0);
    engine.cache_result("req-b", GeoPoint{1.0, 1.0}, 100.0, {}, t0);
    (void)engine.check_request(GeoPoint{0.0, 0.0}, 50.0, t0);

    engine.clear_cache();
    REQUIRE(engine.cache_size() == 0);
    REQUIRE(engine.get_cache_stats().cache_hits == 1);
}

TEST_CASE("Request ids are unique across threads") {
    DeduplicationEngine engine{make_config()};
    constexpr int k_thread_count{4};
    constexpr int k_ids_per_thread{500};

    std::vector<std::vector<std::string>> list_per_thread(k_thread_count);
    std::vector<std::thread> list_threads;
    for (int thread_index = 0; thread_index < k_thread_count; ++thread_index) {
        list_threads.emplace_back([&engine, &list_per_thread, thread_index]() {
            for (int index = 0; index < k_ids_per_thread; ++index) {
                list_per_thread[thread_index].push_back(engine.generate_request_id());
            }
        });
    }
    for (std::thread& thread : list_threads) {
        thread.join();
    }

    std::set<std::string> set_ids;
    for (const auto& list_ids : list_per_thread) {
        set_ids.insert(list_ids.begin(), list_ids.end());
    }
    REQUIRE(set_ids.size() == static_cast<std::size_t>(k_thread_count * k_ids_per_thread));
    REQUIRE(set_ids.begin()->rfind("req_", 0) == 0);
}

TEST_CASE("Concurrent queries and commits keep the counters consistent") {
    DeduplicationEngine engine{make_config()};
    constexpr int k_thread_count{4};
    constexpr int k_requests_per_thread{200};

    std::vector<std::thread> list_threads;
    for (int thread_index = 0; thread_index < k_thread_count; ++thread_index) {
        list_threads.emplace_back([&engine, thread_index]() {
            for (int index = 0; index < k_requests_per_thread; ++index) {
                const GeoPoint center{static_cast<double>(thread_index), index * 0.001};
                const RequestResult result = engine.check_request(center, 50.0);
                if (const auto* cache_miss = std::get_if<CacheMiss>(&result)) {
                    engine.cache_result(cache_miss->request_id, center, 200.0, {});
                }
            }
        });
    }
    for (std::thread& thread : list_threads) {
        thread.join();
    }

    const CacheStats stats = engine.get_cache_stats();
    REQUIRE(stats.total_requests == static_cast<std::uint64_t>(k_thread_count * k_requests_per_thread));
    REQUIRE(stats.cache_hits + stats.cache_misses + stats.partial_hits == stats.total_requests);
    REQUIRE(engine.cache_size() > 0);
}
