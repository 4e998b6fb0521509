#include "region_dedup/stats_collector.hpp"

namespace region_dedup {

namespace {
constexpr double k_percent_scale{100.0};
}  // namespace

void StatsCollector::record_request() noexcept {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::record_hit() noexcept {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::record_miss() noexcept {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::record_partial_hit() noexcept {
    partial_hits_.fetch_add(1, std::memory_order_relaxed);
}

CacheStats StatsCollector::snapshot(std::size_t cached_regions) const noexcept {
    CacheStats stats{};
    stats.total_requests = total_requests_.load(std::memory_order_relaxed);
    stats.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    stats.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    stats.partial_hits = partial_hits_.load(std::memory_order_relaxed);
    stats.cached_regions = cached_regions;
    if (stats.total_requests > 0) {
        stats.hit_rate_percent = static_cast<double>(stats.cache_hits + stats.partial_hits)
            / static_cast<double>(stats.total_requests) * k_percent_scale;
    }
    return stats;
}

void StatsCollector::reset() noexcept {
    total_requests_.store(0, std::memory_order_relaxed);
    cache_hits_.store(0, std::memory_order_relaxed);
    cache_misses_.store(0, std::memory_order_relaxed);
    partial_hits_.store(0, std::memory_order_relaxed);
}

}  // namespace region_dedup
