#include "region_dedup/expiry_reaper.hpp"

#include <algorithm>
#include <stdexcept>

#include "region_dedup/configuration.hpp"

namespace region_dedup {

namespace {
constexpr Milliseconds k_minimum_sweep_interval{1};
constexpr int k_sweeps_per_expiry{4};
}  // namespace

ExpiryReaper::ExpiryReaper(RegionStore& region_store, Milliseconds expire_time)
    : region_store_(region_store),
      expire_time_(expire_time),
      sweep_interval_(std::max(expire_time / k_sweeps_per_expiry, k_minimum_sweep_interval)),
      logger_(get_logger()) {
    if (expire_time_ <= Milliseconds::zero() || expire_time_ > k_max_config_duration) {
        throw std::invalid_argument("ExpiryReaper expire time must be positive and at most ten years");
    }
}

ExpiryReaper::~ExpiryReaper() {
    stop();
}

void ExpiryReaper::start() {
    std::scoped_lock lock(mutex_);
    if (flag_stop_requested_ || flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting expiry reaper with interval {} ms", sweep_interval_.count());
    sweep_thread_ = std::thread(&ExpiryReaper::sweep_loop, this);
}

void ExpiryReaper::stop() {
    {
        std::scoped_lock lock(mutex_);
        flag_stop_requested_ = true;
    }
    cv_stop_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
        logger_->info("Expiry reaper stopped after {} sweeps", sweep_count_.load());
    }
    flag_running_.store(false);
}

std::size_t ExpiryReaper::sweep_once(TimePoint now) {
    const CachedRegionList list_expired = region_store_.remove_expired(now, expire_time_);
    for (const CachedRegionPtr& region : list_expired) {
        logger_->debug("Removed expired cache region: {}", region->id);
    }
    return list_expired.size();
}

bool ExpiryReaper::running() const noexcept {
    return flag_running_.load();
}

Milliseconds ExpiryReaper::sweep_interval() const noexcept {
    return sweep_interval_;
}

std::uint64_t ExpiryReaper::sweep_count() const noexcept {
    return sweep_count_.load();
}

void ExpiryReaper::sweep_loop() {
    std::unique_lock lock(mutex_);
    while (!flag_stop_requested_) {
        if (cv_stop_.wait_for(lock, sweep_interval_, [this]() { return flag_stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            const std::size_t removed_count = sweep_once(SteadyClock::now());
            if (removed_count > 0) {
                logger_->debug("Expiry sweep removed {} regions", removed_count);
            }
        } catch (const std::exception& exc) {
            logger_->error("Expiry sweep error: {}", exc.what());
        }
        sweep_count_.fetch_add(1);
        lock.lock();
    }
}

}  // namespace region_dedup
