#include "ProcessRunner.hpp"
#include "Logger.hpp"

#include <QByteArray>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

#include <algorithm>
#include <sstream>

namespace {

constexpr std::size_t kMaxStderrBytes = 64 * 1024;
constexpr int kWaitSliceMs = 250;

QString to_qstring(const std::string& value)
{
    return QString::fromStdString(value);
}

std::string join_args(const std::vector<std::string>& argv)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << argv[i];
    }
    return oss.str();
}

}


ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::seconds timeout,
                                 const OutputSink& stdout_sink,
                                 const Tick& tick) const
{
    ProcessResult result;
    auto logger = Logger::get_logger("transfer_logger");

    if (argv.empty()) {
        result.spawn_failed = true;
        result.stderr_text = "empty command line";
        return result;
    }

    QStringList args;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        args << to_qstring(argv[i]);
    }

    if (logger) {
        logger->debug("Running: {}", join_args(argv));
    }

    // The destructor kills a child that is still running when tick or the sink throws
    QProcess process;
    process.start(to_qstring(argv.front()), args);
    if (!process.waitForStarted()) {
        result.spawn_failed = true;
        result.stderr_text = process.errorString().toStdString();
        if (logger) {
            logger->warn("Cannot start '{}': {}", argv.front(), result.stderr_text);
        }
        return result;
    }

    auto drain = [&]() {
        const QByteArray out = process.readAllStandardOutput();
        if (!out.isEmpty()) {
            if (stdout_sink) {
                stdout_sink(out.constData(), static_cast<std::size_t>(out.size()));
            } else {
                result.stdout_text.append(out.constData(), static_cast<std::size_t>(out.size()));
            }
        }
        const QByteArray err = process.readAllStandardError();
        if (!err.isEmpty() && result.stderr_text.size() < kMaxStderrBytes) {
            result.stderr_text.append(err.constData(), static_cast<std::size_t>(err.size()));
        }
    };

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (process.state() != QProcess::NotRunning) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            process.kill();
            process.waitForFinished();
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int slice = static_cast<int>(std::min<long long>(remaining, kWaitSliceMs));
        if (!process.waitForReadyRead(slice)) {
            // Output closed or quiet: wait on the exit instead
            process.waitForFinished(slice);
        }
        drain();
        if (tick) {
            tick();
        }
    }
    drain();

    if (!result.timed_out) {
        if (process.exitStatus() == QProcess::NormalExit) {
            result.exit_code = process.exitCode();
        } else {
            result.exit_code = -1;
            result.stderr_text += process.errorString().toStdString();
        }
    }

    if (logger) {
        if (result.timed_out) {
            logger->warn("'{}' killed after {}s timeout", argv.front(), timeout.count());
        } else if (result.exit_code != 0) {
            logger->warn("'{}' exited with {}: {}", argv.front(), result.exit_code, result.stderr_text);
        }
    }
    return result;
}


bool ProcessRunner::is_available(const std::string& program)
{
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        const QFileInfo info(to_qstring(program));
        return info.isFile() && info.isExecutable();
    }
    return !QStandardPaths::findExecutable(to_qstring(program)).isEmpty();
}
