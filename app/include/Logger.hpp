#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    // Registers core_logger, db_logger and transfer_logger. An empty
    // log_dir falls back to the per-user state directory.
    static void setup_loggers(const std::string& log_dir = "",
                              spdlog::level::level_enum level = spdlog::level::info);

    // Returns nullptr until setup_loggers has run.
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static spdlog::level::level_enum parse_level(const std::string& value,
                                                 spdlog::level::level_enum fallback);

private:
    static std::string get_default_log_dir();
};

#endif
