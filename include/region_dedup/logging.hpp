#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace region_dedup {

/**
 * @brief Create the shared `region_dedup` logger once; later calls return it.
 *
 * Logs go to a colored console sink and to a rotating JSON file
 * (`<log_directory>/region_dedup.log`). Warnings and above are flushed
 * immediately.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws std::runtime_error before initialize_logger(). */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Path of the active log file, empty before initialize_logger(). */
[[nodiscard]] std::string log_file_path();

/** @brief Case-insensitive level name ("trace" .. "off", plus "warn" and "err"); nullopt if unknown. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string str_level);

/** @brief Apply a named level; unknown names keep the current level and return false. */
bool set_log_level(const std::string& str_level);

}  // namespace region_dedup
