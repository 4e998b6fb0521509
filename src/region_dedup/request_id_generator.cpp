#include "region_dedup/request_id_generator.hpp"

#include <chrono>

#include <fmt/format.h>

namespace region_dedup {

RequestIdGenerator::RequestIdGenerator()
    : random_engine_(std::random_device{}()) {}

std::string RequestIdGenerator::next() {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    const std::uint64_t sequence = sequence_.fetch_add(1, std::memory_order_relaxed);

    std::uint64_t random_suffix = 0;
    {
        std::scoped_lock lock(mutex_random_);
        random_suffix = random_engine_();
    }
    return fmt::format("req_{}_{}_{:016x}", epoch_ms, sequence, random_suffix);
}

}  // namespace region_dedup
