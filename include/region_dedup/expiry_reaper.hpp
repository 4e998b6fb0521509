// === Expiry Reaper ===========================================================
//
// Background thread that purges stale regions from the store on a fixed
// cadence (a quarter of the expiry time), so idle caches do not keep serving
// memory to data nobody will accept anymore.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "region_dedup/logging.hpp"
#include "region_dedup/region_store.hpp"
#include "region_dedup/types.hpp"

namespace region_dedup {

class ExpiryReaper final {
  public:
    ExpiryReaper(RegionStore& region_store, Milliseconds expire_time);
    ~ExpiryReaper();

    ExpiryReaper(const ExpiryReaper&) = delete;
    ExpiryReaper& operator=(const ExpiryReaper&) = delete;

    /** @brief Launch the sweep thread; no-op when already running or stopped. */
    void start();
    /**
     * @brief Wake the sweep thread, wait for it to exit and forbid restarts.
     *
     * Idempotent. Once it returns no further sweeps run.
     */
    void stop();

    /** @brief Remove every region older than the expiry time as of @p now. */
    std::size_t sweep_once(TimePoint now);

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] Milliseconds sweep_interval() const noexcept;
    /** @brief Number of sweeps performed by the background thread. */
    [[nodiscard]] std::uint64_t sweep_count() const noexcept;

  private:
    void sweep_loop();

    RegionStore& region_store_;
    Milliseconds expire_time_;
    Milliseconds sweep_interval_;
    std::mutex mutex_;
    std::condition_variable cv_stop_;
    bool flag_stop_requested_{false};
    std::atomic<bool> flag_running_{false};
    std::atomic<std::uint64_t> sweep_count_{0};
    std::thread sweep_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace region_dedup
