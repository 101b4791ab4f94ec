#include <catch2/catch_test_macros.hpp>

#include "IniConfig.hpp"
#include "TestHelpers.hpp"

TEST_CASE("IniConfig skips comments and unwraps quoted values") {
    TempDir dir;
    const auto path = dir.path() / "config.ini";
    write_file(path,
               "; leading comment\n"
               "# another comment\n"
               "[Engine]\n"
               "RetryCount = 4 ; inline comment\n"
               "Label = \"value; with # marks\"\n"
               "not a key value line\n"
               "[Broken\n"
               "Tail = kept\n");

    IniConfig config;
    REQUIRE(config.load(path.string()));
    CHECK(config.getValue("Engine", "RetryCount") == "4");
    CHECK(config.getValue("Engine", "Label") == "value; with # marks");
    CHECK(config.getValue("Engine", "Tail") == "kept");
    CHECK(config.getValue("Engine", "Missing", "fallback") == "fallback");
    CHECK_FALSE(config.hasValue("Other", "RetryCount"));
}

TEST_CASE("IniConfig quotes values that would read back differently") {
    TempDir dir;
    const auto path = dir.path() / "config.ini";

    IniConfig config;
    config.setValue("Transfer", "RclonePath", "/opt/my;tools/rclone");
    config.setValue("Transfer", "RsyncPath", "rsync");
    REQUIRE(config.save(path.string()));

    IniConfig reloaded;
    REQUIRE(reloaded.load(path.string()));
    CHECK(reloaded.getValue("Transfer", "RclonePath") == "/opt/my;tools/rclone");
    CHECK(reloaded.getValue("Transfer", "RsyncPath") == "rsync");
}

TEST_CASE("IniConfig reports unreadable files") {
    TempDir dir;
    IniConfig config;
    CHECK_FALSE(config.load((dir.path() / "absent.ini").string()));
}
