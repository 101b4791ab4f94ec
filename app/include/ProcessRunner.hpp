#ifndef PROCESSRUNNER_HPP
#define PROCESSRUNNER_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code{-1};
    bool timed_out{false};
    bool spawn_failed{false};
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return !timed_out && !spawn_failed && exit_code == 0; }
};

/**
 * @brief Runs an external tool (rsync, rclone) with a bounded wait.
 *
 * The child is killed when the timeout elapses. When a stdout sink is
 * given, output is streamed to it instead of being buffered. The tick
 * callback runs between output slices while the child is alive; an
 * exception thrown from it kills the child and propagates.
 */
class ProcessRunner {
public:
    using OutputSink = std::function<void(const char* data, std::size_t size)>;
    using Tick = std::function<void()>;

    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::seconds timeout,
                      const OutputSink& stdout_sink = {},
                      const Tick& tick = {}) const;

    // True when program is an executable path or found on PATH.
    static bool is_available(const std::string& program);
};

#endif
