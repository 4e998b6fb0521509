// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings for the
// region cache. `ConfigurationLoader` transforms raw environment variables
// into the strongly-typed `CacheConfig` structure consumed by the engine and
// the region loader.
//
// Responsibilities
// - Enforce defaults and sane bounds for expiry, search radius and retry
//   backoff.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.

#include "region_dedup/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include "region_dedup/logging.hpp"

namespace region_dedup {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr double k_max_search_radius_m{20'037'508.0};  // half the equatorial circumference
constexpr double k_max_retry_multiplier{100.0};

std::string lower_case(std::string_view raw_value) {
    std::string str_value{raw_value};
    std::transform(str_value.begin(), str_value.end(), str_value.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return str_value;
}

double parse_double(const char* raw_value, double fallback, double minimum, bool allow_equal_minimum, double maximum) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!std::isfinite(parsed_value)) {
            get_logger()->warn("Non-finite value {} rejected; using fallback {}", raw_value, fallback);
            return fallback;
        }
        const bool below_minimum = allow_equal_minimum ? parsed_value < minimum : parsed_value <= minimum;
        if (below_minimum || parsed_value > maximum) {
            get_logger()->warn("Value {} out of range; using fallback {}", parsed_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

long long parse_integer(const char* raw_value, long long fallback, long long minimum, long long maximum) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const long long parsed_value = std::stoll(raw_value);
        if (parsed_value < minimum || parsed_value > maximum) {
            get_logger()->warn("Value {} outside [{}, {}]; using fallback {}", parsed_value, minimum, maximum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

Milliseconds parse_milliseconds(const char* raw_value, Milliseconds fallback, long long minimum) {
    return Milliseconds{parse_integer(raw_value, fallback.count(), minimum, k_max_config_duration.count())};
}

bool parse_bool(const char* raw_value, bool fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string str_value = lower_case(raw_value);
    if (str_value == "1" || str_value == "true" || str_value == "yes" || str_value == "on") {
        return true;
    }
    if (str_value == "0" || str_value == "false" || str_value == "no" || str_value == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse boolean '{}' from environment; using fallback {}", raw_value, fallback);
    return fallback;
}

PruningPolicy parse_pruning_policy(const char* raw_value, PruningPolicy fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string str_value = lower_case(raw_value);
    if (str_value == "new_contains_old") {
        return PruningPolicy::NewContainsOld;
    }
    if (str_value == "bidirectional") {
        return PruningPolicy::Bidirectional;
    }
    get_logger()->warn("Unknown pruning policy '{}'; using {}", raw_value, to_string(fallback));
    return fallback;
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("REGION_DEDUP_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

CacheConfig ConfigurationLoader::load() {
    CacheConfig config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading cache configuration from environment");

    config.cache_expire_time = parse_milliseconds(std::getenv("REGION_DEDUP_CACHE_EXPIRE_MS"), config.cache_expire_time, 1);
    config.enable_performance_monitoring = parse_bool(std::getenv("REGION_DEDUP_MONITORING"), config.enable_performance_monitoring);
    config.default_search_radius_m = parse_double(std::getenv("REGION_DEDUP_DEFAULT_RADIUS_M"), config.default_search_radius_m, 0.0, true, k_max_search_radius_m);
    config.pruning_policy = parse_pruning_policy(std::getenv("REGION_DEDUP_PRUNING"), config.pruning_policy);

    config.retry.max_retry_count = static_cast<int>(parse_integer(std::getenv("REGION_DEDUP_MAX_RETRIES"), config.retry.max_retry_count, 0, k_max_retry_attempts));
    config.retry.initial_retry_delay = parse_milliseconds(std::getenv("REGION_DEDUP_INITIAL_RETRY_MS"), config.retry.initial_retry_delay, 0);
    config.retry.retry_multiplier = parse_double(std::getenv("REGION_DEDUP_RETRY_MULTIPLIER"), config.retry.retry_multiplier, 0.0, false, k_max_retry_multiplier);
    config.retry.max_retry_delay = parse_milliseconds(std::getenv("REGION_DEDUP_MAX_RETRY_MS"), config.retry.max_retry_delay, 0);
    config.retry.jitter_factor = parse_double(std::getenv("REGION_DEDUP_RETRY_JITTER"), config.retry.jitter_factor, 0.0, true, 1.0);

    for (const std::string& problem : validate(config)) {
        logger->warn("Configuration problem: {}", problem);
    }
    logger->info("Configuration loaded: {}", describe(config));
    return config;
}

std::vector<std::string> validate(const CacheConfig& config) {
    std::vector<std::string> list_errors;
    if (config.cache_expire_time <= Milliseconds::zero() || config.cache_expire_time > k_max_config_duration) {
        list_errors.emplace_back("cache expire time must be positive and at most ten years");
    }
    if (!std::isfinite(config.default_search_radius_m) || config.default_search_radius_m < 0.0) {
        list_errors.emplace_back("default search radius must be finite and non-negative");
    }
    if (config.retry.max_retry_count < 0 || config.retry.max_retry_count > k_max_retry_attempts) {
        list_errors.emplace_back(fmt::format("max retry count must lie within [0, {}]", k_max_retry_attempts));
    }
    if (config.retry.initial_retry_delay < Milliseconds::zero()) {
        list_errors.emplace_back("initial retry delay cannot be negative");
    }
    if (!std::isfinite(config.retry.retry_multiplier) || config.retry.retry_multiplier <= 0.0) {
        list_errors.emplace_back("retry multiplier must be finite and positive");
    }
    if (config.retry.max_retry_delay < config.retry.initial_retry_delay || config.retry.max_retry_delay > k_max_config_duration) {
        list_errors.emplace_back("max retry delay must lie between the initial retry delay and ten years");
    }
    if (!std::isfinite(config.retry.jitter_factor) || config.retry.jitter_factor < 0.0 || config.retry.jitter_factor > 1.0) {
        list_errors.emplace_back("retry jitter factor must lie within [0, 1]");
    }
    return list_errors;
}

std::string describe(const CacheConfig& config) {
    return fmt::format(
        "expire_ms={} monitoring={} default_radius_m={} pruning={} max_attempts={} initial_retry_ms={} retry_multiplier={} max_retry_ms={} retry_jitter={} log_dir={}",
        config.cache_expire_time.count(),
        config.enable_performance_monitoring ? "on" : "off",
        config.default_search_radius_m,
        to_string(config.pruning_policy),
        config.retry.max_retry_count,
        config.retry.initial_retry_delay.count(),
        config.retry.retry_multiplier,
        config.retry.max_retry_delay.count(),
        config.retry.jitter_factor,
        config.log_directory
    );
}

const char* to_string(PruningPolicy policy) noexcept {
    switch (policy) {
        case PruningPolicy::NewContainsOld:
            return "new_contains_old";
        case PruningPolicy::Bidirectional:
            return "bidirectional";
    }
    return "unknown";
}

}  // namespace region_dedup
