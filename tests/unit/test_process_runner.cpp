#include <catch2/catch_test_macros.hpp>

#include "EngineException.hpp"
#include "ProcessRunner.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace {

std::vector<std::string> shell(const std::string& script)
{
    return {"/bin/sh", "-c", script};
}

} // namespace

TEST_CASE("ProcessRunner captures output and the exit code") {
    QtAppContext qt_context;
    ProcessRunner runner;

    const auto result = runner.run(shell("printf hello; printf oops >&2; exit 3"), std::chrono::seconds(30));

    CHECK_FALSE(result.timed_out);
    CHECK_FALSE(result.spawn_failed);
    CHECK(result.exit_code == 3);
    CHECK(result.stdout_text == "hello");
    CHECK(result.stderr_text == "oops");
    CHECK_FALSE(result.succeeded());
}

TEST_CASE("ProcessRunner streams stdout to a sink") {
    QtAppContext qt_context;
    ProcessRunner runner;
    std::string streamed;

    const auto result = runner.run(shell("printf 'line one\\nline two\\n'"), std::chrono::seconds(30),
                                   [&streamed](const char* data, std::size_t size) { streamed.append(data, size); });

    CHECK(result.succeeded());
    CHECK(streamed == "line one\nline two\n");
    CHECK(result.stdout_text.empty());
}

TEST_CASE("ProcessRunner kills a child that outlives its timeout") {
    QtAppContext qt_context;
    ProcessRunner runner;
    const auto started = std::chrono::steady_clock::now();

    const auto result = runner.run(shell("sleep 30"), std::chrono::seconds(1));

    CHECK(result.timed_out);
    CHECK_FALSE(result.succeeded());
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
}

TEST_CASE("ProcessRunner ticks while the child runs") {
    QtAppContext qt_context;
    ProcessRunner runner;
    int ticks = 0;

    const auto result = runner.run(shell("sleep 2"), std::chrono::seconds(30), {}, [&ticks] { ++ticks; });

    CHECK(result.succeeded());
    CHECK(ticks >= 2);
}

TEST_CASE("A throwing tick stops the child and propagates") {
    QtAppContext qt_context;
    ProcessRunner runner;
    const auto started = std::chrono::steady_clock::now();

    CHECK_THROWS_AS(runner.run(shell("sleep 30"), std::chrono::seconds(60), {},
                               [] { THROW_ENGINE_ERROR(ErrorCodes::Code::RUN_LEASE_LOST, "taken over"); }),
                    ErrorCodes::EngineException);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
}

TEST_CASE("ProcessRunner reports programs that cannot start") {
    QtAppContext qt_context;
    ProcessRunner runner;

    const auto missing = runner.run({"/nonexistent/ordne-tool", "--version"}, std::chrono::seconds(5));
    CHECK(missing.spawn_failed);
    CHECK_FALSE(missing.stderr_text.empty());

    const auto empty = runner.run({}, std::chrono::seconds(5));
    CHECK(empty.spawn_failed);
}

TEST_CASE("is_available finds tools on PATH and checks explicit paths") {
    TempDir dir;
    const auto plain = dir.path() / "not-a-tool";
    write_file(plain, "#!/bin/sh\n");
    std::filesystem::permissions(plain, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    CHECK(ProcessRunner::is_available("sh"));
    CHECK(ProcessRunner::is_available("/bin/sh"));
    CHECK_FALSE(ProcessRunner::is_available("ordne-no-such-tool"));
    CHECK_FALSE(ProcessRunner::is_available("/nonexistent/ordne-tool"));
    CHECK_FALSE(ProcessRunner::is_available(plain.string()));
    CHECK_FALSE(ProcessRunner::is_available(""));
}
