// === Stats Collector =========================================================
//
// Process-lifetime request accounting for the deduplication engine. Counters
// are atomic so concurrent callers never lose an increment.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace region_dedup {

/** @brief Point-in-time view of the cache counters. */
struct CacheStats final {
    std::uint64_t total_requests{};
    std::uint64_t cache_hits{};
    std::uint64_t cache_misses{};
    std::uint64_t partial_hits{};
    double hit_rate_percent{};     /**< (hits + partial hits) / total * 100, or 0 with no requests. */
    std::size_t cached_regions{};  /**< Store size when the snapshot was taken. */
};

class StatsCollector final {
  public:
    void record_request() noexcept;
    void record_hit() noexcept;
    void record_miss() noexcept;
    void record_partial_hit() noexcept;

    [[nodiscard]] CacheStats snapshot(std::size_t cached_regions) const noexcept;
    /** @brief Zero all counters. */
    void reset() noexcept;

  private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> partial_hits_{0};
};

}  // namespace region_dedup
