#include "region_dedup/region_loader.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace region_dedup {

RegionLoader::RegionLoader(DeduplicationEngine& engine,
                           RegionFetcherPtr fetcher,
                           RetryPolicy retry_policy,
                           SleepFunction sleep)
    : engine_(engine),
      fetcher_(std::move(fetcher)),
      retry_policy_(retry_policy),
      sleep_(std::move(sleep)),
      random_engine_(std::random_device{}()),
      logger_(get_logger()) {
    if (fetcher_ == nullptr) {
        throw std::invalid_argument("RegionLoader requires a fetcher");
    }
    if (retry_policy_.max_retry_count < 0 || retry_policy_.max_retry_count > k_max_retry_attempts) {
        throw std::invalid_argument("RegionLoader retry count must lie within [0, " + std::to_string(k_max_retry_attempts) + "]");
    }
    if (!std::isfinite(retry_policy_.retry_multiplier) || retry_policy_.retry_multiplier <= 0.0) {
        throw std::invalid_argument("RegionLoader retry multiplier must be finite and positive");
    }
    if (!std::isfinite(retry_policy_.jitter_factor) || retry_policy_.jitter_factor < 0.0 || retry_policy_.jitter_factor > 1.0) {
        throw std::invalid_argument("RegionLoader jitter factor must lie within [0, 1]");
    }
    if (retry_policy_.initial_retry_delay < Milliseconds::zero() || retry_policy_.max_retry_delay < Milliseconds::zero()) {
        throw std::invalid_argument("RegionLoader retry delays cannot be negative");
    }
    if (!sleep_) {
        sleep_ = [](Milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

LoadOutcome RegionLoader::load(const GeoPoint& center, double radius_m, bool force_refresh) {
    LoadOutcome outcome{};
    outcome.source = LoadSource::Network;

    if (force_refresh) {
        outcome.request_id = engine_.generate_request_id();
        logger_->debug("Forced refresh for ({}, {}) under {}", center.latitude_deg, center.longitude_deg, outcome.request_id);
    } else {
        RequestResult result = engine_.check_request(center, radius_m);
        if (auto* cache_hit = std::get_if<CacheHit>(&result)) {
            outcome.source = LoadSource::Cache;
            outcome.request_id = cache_hit->region->id;
            outcome.records = std::move(cache_hit->records);
            logger_->debug("Served {} records from cached region {}", outcome.records.size(), outcome.request_id);
            return outcome;
        }
        if (auto* partial_hit = std::get_if<PartialHit>(&result)) {
            outcome.request_id = std::move(partial_hit->request_id);
            outcome.partial_records = std::move(partial_hit->merged_records);
            logger_->debug("Partial hit supplied {} records; fetching under {}", outcome.partial_records.size(), outcome.request_id);
        } else {
            outcome.request_id = std::get<CacheMiss>(result).request_id;
        }
    }

    outcome.records = fetch_with_retry(center, radius_m, outcome.request_id, outcome.attempts);
    engine_.cache_result(outcome.request_id, center, radius_m, outcome.records);
    logger_->info("Loaded {} records for request {} after {} attempt(s)", outcome.records.size(), outcome.request_id, outcome.attempts);
    return outcome;
}

int RegionLoader::max_attempts() const noexcept {
    return std::max(retry_policy_.max_retry_count, 1);
}

Milliseconds RegionLoader::capped_retry_delay(int failed_attempt) const {
    const int exponent = std::max(failed_attempt - 1, 0);
    const double scaled_ms = static_cast<double>(retry_policy_.initial_retry_delay.count())
        * std::pow(retry_policy_.retry_multiplier, exponent);
    const double capped_ms = std::min(scaled_ms, static_cast<double>(retry_policy_.max_retry_delay.count()));
    return Milliseconds{static_cast<Milliseconds::rep>(std::llround(capped_ms))};
}

Milliseconds RegionLoader::retry_delay(int failed_attempt) {
    const Milliseconds capped_delay = capped_retry_delay(failed_attempt);
    if (retry_policy_.jitter_factor <= 0.0 || capped_delay <= Milliseconds::zero()) {
        return capped_delay;
    }
    std::uniform_real_distribution<double> jitter_distribution(0.0, retry_policy_.jitter_factor);
    const double jitter_ms = static_cast<double>(capped_delay.count()) * jitter_distribution(random_engine_);
    return capped_delay + Milliseconds{static_cast<Milliseconds::rep>(jitter_ms)};
}

std::vector<LocationRecord> RegionLoader::fetch_with_retry(const GeoPoint& center,
                                                           double radius_m,
                                                           const std::string& request_id,
                                                           int& attempts) {
    attempts = 0;
    while (true) {
        ++attempts;
        try {
            return fetcher_->fetch(center, radius_m);
        } catch (const FetchError& exc) {
            logger_->warn("Fetch attempt {}/{} for request {} failed: {}", attempts, max_attempts(), request_id, exc.what());
            if (attempts >= max_attempts()) {
                logger_->error("All {} attempts failed for request {}", attempts, request_id);
                throw;
            }
        }
        sleep_(retry_delay(attempts));
    }
}

const char* to_string(LoadSource source) noexcept {
    switch (source) {
        case LoadSource::Cache:
            return "cache";
        case LoadSource::Network:
            return "network";
    }
    return "unknown";
}

}  // namespace region_dedup
