// === Request Id Generator ====================================================
//
// Issues the identifiers that key cached regions. Ids combine wall-clock
// milliseconds, a per-generator sequence number and a random suffix, so two
// ids never collide within a process and collide across processes only with
// negligible probability.

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace region_dedup {

class RequestIdGenerator final {
  public:
    RequestIdGenerator();

    /** @brief Thread-safe; format is `req_<epoch-ms>_<sequence>_<16 hex digits>`. */
    [[nodiscard]] std::string next();

  private:
    std::atomic<std::uint64_t> sequence_{0};
    std::mutex mutex_random_;
    std::mt19937_64 random_engine_;
};

}  // namespace region_dedup
