#include "region_dedup/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace region_dedup {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
std::filesystem::path path_active_log_file;

constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "region_dedup";
constexpr char k_log_file_name[] = "region_dedup.log";

// Reaper and engine log from different threads, so the file records the thread id.
// %* is the message payload escaped as a JSON string body.
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","logger":"%n","thread":%t,"msg":"%*"})";
constexpr char k_console_pattern[] = "[%H:%M:%S.%e] [%^%l%$] %v";

/** @brief Pattern flag writing the payload with JSON string escaping. */
class JsonEscapedMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        constexpr char k_hex_digits[] = "0123456789abcdef";
        const char* const payload_begin = msg.payload.data();
        const char* const payload_end = payload_begin + msg.payload.size();
        for (const char* cursor = payload_begin; cursor != payload_end; ++cursor) {
            const auto character = static_cast<unsigned char>(*cursor);
            switch (character) {
                case '"':
                    append(dest, "\\\"");
                    break;
                case '\\':
                    append(dest, "\\\\");
                    break;
                case '\n':
                    append(dest, "\\n");
                    break;
                case '\r':
                    append(dest, "\\r");
                    break;
                case '\t':
                    append(dest, "\\t");
                    break;
                default:
                    if (character < 0x20) {
                        const char escaped[] = {'\\', 'u', '0', '0', k_hex_digits[character >> 4], k_hex_digits[character & 0x0F]};
                        dest.append(escaped, escaped + sizeof(escaped));
                    } else {
                        dest.push_back(*cursor);
                    }
                    break;
            }
        }
    }

    [[nodiscard]] std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<JsonEscapedMessageFlag>();
    }

  private:
    static void append(spdlog::memory_buf_t& dest, std::string_view text) {
        dest.append(text.data(), text.data() + text.size());
    }
};

std::filesystem::path prepare_log_directory(const std::string& log_directory) {
    const std::filesystem::path path_log_dir{log_directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message());
    }
    return path_log_dir;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_file = prepare_log_directory(log_directory) / k_log_file_name;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(k_console_pattern);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path_log_file.string(),
                k_max_file_size_bytes,
                k_max_files
            );
            auto file_formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
            file_formatter->add_flag<JsonEscapedMessageFlag>('*').set_pattern(k_file_pattern);
            file_sink->set_formatter(std::move(file_formatter));

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            logger->set_level(spdlog::level::info);
            logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(logger);

            path_active_log_file = path_log_file;
            shared_logger = std::move(logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

std::string log_file_path() {
    return path_active_log_file.string();
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string str_level) {
    std::transform(str_level.begin(), str_level.end(), str_level.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    const auto level = spdlog::level::from_str(str_level);
    // from_str maps unknown names to off; "warn" and "err" are accepted as aliases.
    if (level == spdlog::level::off && str_level != "off") {
        return std::nullopt;
    }
    return level;
}

bool set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return false;
    }
    const auto level = parse_log_level(str_level);
    if (!level.has_value()) {
        shared_logger->warn("Unknown log level {}; keeping {}", str_level, spdlog::level::to_string_view(shared_logger->level()));
        return false;
    }
    shared_logger->set_level(*level);
    return true;
}

}  // namespace region_dedup
