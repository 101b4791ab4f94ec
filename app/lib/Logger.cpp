#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
const char* const kLoggerNames[] = {"core_logger", "db_logger", "transfer_logger"};
}


std::string Logger::get_default_log_dir()
{
    if (const char* state_home = std::getenv("XDG_STATE_HOME")) {
        if (*state_home != '\0') {
            return (std::filesystem::path(state_home) / "ordne" / "logs").string();
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".local" / "state" / "ordne" / "logs").string();
    }
    return (std::filesystem::temp_directory_path() / "ordne-logs").string();
}


void Logger::setup_loggers(const std::string& log_dir, spdlog::level::level_enum level)
{
    const std::string dir = log_dir.empty() ? get_default_log_dir() : log_dir;
    std::filesystem::create_directories(dir);

    const std::string log_file = (std::filesystem::path(dir) / "ordne.log").string();

    // stdout carries command output, so console logging goes to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};

    for (const char* name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


spdlog::level::level_enum Logger::parse_level(const std::string& value,
                                              spdlog::level::level_enum fallback)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered.empty()) {
        return fallback;
    }
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        return fallback;
    }
    return level;
}
