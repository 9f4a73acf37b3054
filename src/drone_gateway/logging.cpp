#include "drone_gateway/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace drone_gateway {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "drone_gateway";
constexpr char k_log_file_name[] = "drone_gateway.log";
constexpr char k_console_pattern[] = "[%l] %v";
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","logger":"%n","thread":%t,"msg":%v})";

std::shared_ptr<spdlog::sinks::sink> make_console_sink() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(k_console_pattern);
    return console_sink;
}

std::shared_ptr<spdlog::sinks::sink> make_file_sink(const std::filesystem::path& path_log_dir) {
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": "
                                 + error_directory.message());
    }
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / k_log_file_name).string(),
        k_max_file_size_bytes,
        k_max_files
    );
    file_sink->set_pattern(k_file_pattern);
    return file_sink;
}

}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            spdlog::sinks_init_list sinks{make_console_sink(), make_file_sink(std::filesystem::path{log_directory})};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
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

bool set_log_level(const std::string& str_level) {
    auto logger = get_logger();
    const spdlog::level::level_enum level = spdlog::level::from_str(str_level);
    // from_str maps unrecognised names to off rather than throwing.
    if (level == spdlog::level::off && str_level != "off") {
        logger->set_level(spdlog::level::info);
        logger->warn(R"({{"component":"logging","event":"unknown_level","requested":"{}","applied":"info"}})", str_level);
        return false;
    }
    logger->set_level(level);
    return true;
}

}  // namespace drone_gateway
