#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    std::string define_config_path();
    std::string get_config_dir();
    std::string get_config_path() const;

    int get_retry_count() const;
    void set_retry_count(int value);

    std::size_t get_batch_size() const;
    void set_batch_size(std::size_t value);

    FailureMode get_failure_mode() const;
    void set_failure_mode(FailureMode value);

    std::chrono::seconds get_transfer_timeout() const;
    void set_transfer_timeout(std::chrono::seconds value);

    std::chrono::seconds get_stale_run_after() const;
    void set_stale_run_after(std::chrono::seconds value);

    std::uint64_t get_io_limit_kibps() const;
    void set_io_limit_kibps(std::uint64_t value);

    std::string get_rsync_path() const;
    void set_rsync_path(const std::string& value);
    std::string get_rclone_path() const;
    void set_rclone_path(const std::string& value);
    bool get_prefer_rsync() const;
    void set_prefer_rsync(bool value);

    std::string get_database_path() const;
    void set_database_path(const std::string& value);

    std::string get_log_dir() const;
    void set_log_dir(const std::string& value);
    std::string get_log_level() const;
    void set_log_level(const std::string& value);

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    int retry_count{3};
    std::size_t batch_size{50};
    FailureMode failure_mode{FailureMode::AbortOnFailure};
    std::chrono::seconds transfer_timeout{3600};
    std::chrono::seconds stale_run_after{7200};
    std::uint64_t io_limit_kibps{0};
    std::string rsync_path{"rsync"};
    std::string rclone_path{"rclone"};
    bool prefer_rsync{true};
    std::string database_path;
    std::string log_dir;
    std::string log_level{"info"};
};

#endif
