#include "Settings.hpp"
#include "Types.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
constexpr const char* kAppName = "ordne";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

// Falls back (with a warning) on malformed or out-of-range values.
std::int64_t parse_int_or(const std::string& key,
                          const std::string& value,
                          std::int64_t fallback,
                          std::int64_t min_value)
{
    if (value.empty()) {
        return fallback;
    }
    auto parsed = Utils::parse_int64(value);
    if (!parsed || *parsed < min_value) {
        settings_log(spdlog::level::warn, "Invalid value '{}' for {}, using {}", value, key, fallback);
        return fallback;
    }
    return *parsed;
}

bool parse_bool_or(const std::string& key, const std::string& value, bool fallback)
{
    const std::string lowered = Utils::to_lower_copy(value);
    if (lowered.empty()) {
        return fallback;
    }
    if (lowered == "true" || lowered == "yes" || lowered == "1" || lowered == "auto") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0" || lowered == "never") {
        return false;
    }
    settings_log(spdlog::level::warn, "Invalid value '{}' for {}, using {}", value, key, fallback);
    return fallback;
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    database_path = (config_dir / "ordne.db").string();
    log_dir = (config_dir / "logs").string();
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("ORDNE_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / kAppName / "config.ini").string();
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg != '\0') {
            return (std::filesystem::path(xdg) / kAppName / "config.ini").string();
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".config" / kAppName / "config.ini").string();
    }
    return "config.ini";
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    retry_count = static_cast<int>(
        parse_int_or("Engine.RetryCount", config.getValue("Engine", "RetryCount"), 3, 0));
    batch_size = static_cast<std::size_t>(
        parse_int_or("Engine.BatchSize", config.getValue("Engine", "BatchSize"), 50, 1));

    const std::string policy_value = config.getValue("Engine", "FailurePolicy", "abort");
    if (auto mode = parse_failure_mode(policy_value)) {
        failure_mode = *mode;
    } else {
        settings_log(spdlog::level::warn, "Unknown failure policy '{}', using abort", policy_value);
        failure_mode = FailureMode::AbortOnFailure;
    }

    transfer_timeout = std::chrono::seconds(parse_int_or(
        "Engine.TransferTimeoutSeconds", config.getValue("Engine", "TransferTimeoutSeconds"), 3600, 1));
    stale_run_after = std::chrono::seconds(parse_int_or(
        "Engine.StaleRunSeconds", config.getValue("Engine", "StaleRunSeconds"), 7200, 1));
    if (stale_run_after <= transfer_timeout) {
        // A run busy in one transfer must not look abandoned
        settings_log(spdlog::level::warn, "StaleRunSeconds ({}) must exceed TransferTimeoutSeconds ({}), using {}",
                     stale_run_after.count(), transfer_timeout.count(), transfer_timeout.count() * 2);
        stale_run_after = transfer_timeout * 2;
    }
    io_limit_kibps = static_cast<std::uint64_t>(
        parse_int_or("Engine.IoLimitKiBps", config.getValue("Engine", "IoLimitKiBps"), 0, 0));

    rsync_path = config.getValue("Transfer", "RsyncPath", "rsync");
    rclone_path = config.getValue("Transfer", "RclonePath", "rclone");
    prefer_rsync = parse_bool_or("Transfer.UseRsync", config.getValue("Transfer", "UseRsync"), true);

    database_path = config.getValue("Storage", "DatabasePath", (config_dir / "ordne.db").string());
    log_dir = config.getValue("Logging", "LogDir", (config_dir / "logs").string());
    log_level = config.getValue("Logging", "Level", "info");

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from '{}' (retries: {}, batch size: {}, policy: {}, database: '{}')",
                     config_path, retry_count, batch_size, to_string(failure_mode), database_path);
    }

    return true;
}


bool Settings::save()
{
    config.setValue("Engine", "RetryCount", std::to_string(retry_count));
    config.setValue("Engine", "BatchSize", std::to_string(batch_size));
    config.setValue("Engine", "FailurePolicy", to_string(failure_mode));
    config.setValue("Engine", "TransferTimeoutSeconds", std::to_string(transfer_timeout.count()));
    config.setValue("Engine", "StaleRunSeconds", std::to_string(stale_run_after.count()));
    config.setValue("Engine", "IoLimitKiBps", std::to_string(io_limit_kibps));

    config.setValue("Transfer", "RsyncPath", rsync_path);
    config.setValue("Transfer", "RclonePath", rclone_path);
    config.setValue("Transfer", "UseRsync", prefer_rsync ? "auto" : "never");

    config.setValue("Storage", "DatabasePath", database_path);
    config.setValue("Logging", "LogDir", log_dir);
    config.setValue("Logging", "Level", log_level);

    return config.save(config_path);
}


int Settings::get_retry_count() const { return retry_count; }
void Settings::set_retry_count(int value) { retry_count = value < 0 ? 0 : value; }

std::size_t Settings::get_batch_size() const { return batch_size; }
void Settings::set_batch_size(std::size_t value) { batch_size = value == 0 ? 1 : value; }

FailureMode Settings::get_failure_mode() const { return failure_mode; }
void Settings::set_failure_mode(FailureMode value) { failure_mode = value; }

std::chrono::seconds Settings::get_transfer_timeout() const { return transfer_timeout; }
void Settings::set_transfer_timeout(std::chrono::seconds value) { transfer_timeout = value; }

std::chrono::seconds Settings::get_stale_run_after() const { return stale_run_after; }
void Settings::set_stale_run_after(std::chrono::seconds value) { stale_run_after = value; }

std::uint64_t Settings::get_io_limit_kibps() const { return io_limit_kibps; }
void Settings::set_io_limit_kibps(std::uint64_t value) { io_limit_kibps = value; }

std::string Settings::get_rsync_path() const { return rsync_path; }
void Settings::set_rsync_path(const std::string& value) { rsync_path = value; }

std::string Settings::get_rclone_path() const { return rclone_path; }
void Settings::set_rclone_path(const std::string& value) { rclone_path = value; }

bool Settings::get_prefer_rsync() const { return prefer_rsync; }
void Settings::set_prefer_rsync(bool value) { prefer_rsync = value; }

std::string Settings::get_database_path() const { return database_path; }
void Settings::set_database_path(const std::string& value) { database_path = value; }

std::string Settings::get_log_dir() const { return log_dir; }
void Settings::set_log_dir(const std::string& value) { log_dir = value; }

std::string Settings::get_log_level() const { return log_level; }
void Settings::set_log_level(const std::string& value) { log_level = value; }
