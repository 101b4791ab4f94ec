#include <catch2/catch_test_macros.hpp>

#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

TEST_CASE("Settings fall back to defaults without a config file") {
    TempDir base_dir;
    EnvVarGuard config_guard("ORDNE_CONFIG_DIR", base_dir.path().string());
    Settings settings;

    CHECK_FALSE(settings.load());
    CHECK(settings.get_config_path() == (base_dir.path() / "ordne" / "config.ini").string());
    CHECK(settings.get_retry_count() == 3);
    CHECK(settings.get_batch_size() == 50);
    CHECK(settings.get_failure_mode() == FailureMode::AbortOnFailure);
    CHECK(settings.get_transfer_timeout() == std::chrono::seconds(3600));
    CHECK(settings.get_stale_run_after() == std::chrono::seconds(7200));
    CHECK(settings.get_io_limit_kibps() == 0);
    CHECK(settings.get_database_path() == (base_dir.path() / "ordne" / "ordne.db").string());
}

TEST_CASE("Settings read engine options and reject invalid values") {
    TempDir base_dir;
    EnvVarGuard config_guard("ORDNE_CONFIG_DIR", base_dir.path().string());
    write_file(base_dir.path() / "ordne" / "config.ini",
               "[Engine]\n"
               "RetryCount = 5\n"
               "BatchSize = 0\n"
               "FailurePolicy = skip\n"
               "TransferTimeoutSeconds = ten\n"
               "IoLimitKiBps = 2048\n"
               "\n"
               "[Transfer]\n"
               "UseRsync = never\n"
               "RclonePath = /opt/rclone/bin/rclone\n"
               "\n"
               "[Storage]\n"
               "DatabasePath = /var/lib/ordne/index.db\n");
    Settings settings;

    REQUIRE(settings.load());
    CHECK(settings.get_retry_count() == 5);
    CHECK(settings.get_batch_size() == 50);
    CHECK(settings.get_failure_mode() == FailureMode::SkipOnFailure);
    CHECK(settings.get_transfer_timeout() == std::chrono::seconds(3600));
    CHECK(settings.get_io_limit_kibps() == 2048);
    CHECK_FALSE(settings.get_prefer_rsync());
    CHECK(settings.get_rclone_path() == "/opt/rclone/bin/rclone");
    CHECK(settings.get_database_path() == "/var/lib/ordne/index.db");
}

TEST_CASE("Settings survive a save and reload") {
    TempDir base_dir;
    EnvVarGuard config_guard("ORDNE_CONFIG_DIR", base_dir.path().string());
    {
        Settings settings;
        settings.set_retry_count(-4);
        settings.set_batch_size(7);
        settings.set_failure_mode(FailureMode::RetryThenPrompt);
        settings.set_transfer_timeout(std::chrono::seconds(60));
        settings.set_stale_run_after(std::chrono::seconds(120));
        REQUIRE(settings.save());
    }

    Settings reloaded;
    REQUIRE(reloaded.load());
    CHECK(reloaded.get_retry_count() == 0);
    CHECK(reloaded.get_batch_size() == 7);
    CHECK(reloaded.get_failure_mode() == FailureMode::RetryThenPrompt);
    CHECK(reloaded.get_stale_run_after() == std::chrono::seconds(120));
}

TEST_CASE("Settings keep the stale run window above the transfer timeout") {
    TempDir base_dir;
    EnvVarGuard config_guard("ORDNE_CONFIG_DIR", base_dir.path().string());
    write_file(base_dir.path() / "ordne" / "config.ini",
               "[Engine]\n"
               "TransferTimeoutSeconds = 900\n"
               "StaleRunSeconds = 600\n");
    Settings settings;

    REQUIRE(settings.load());
    CHECK(settings.get_transfer_timeout() == std::chrono::seconds(900));
    CHECK(settings.get_stale_run_after() == std::chrono::seconds(1800));
}
