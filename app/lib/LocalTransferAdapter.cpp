#include "LocalTransferAdapter.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

constexpr std::size_t kChunkSize = 1024 * 1024;
constexpr const char* kPartialSuffix = ".ordne-partial";
constexpr const char* kRsyncPartialDir = ".ordne-partial";

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor()
    {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Returns false and keeps errno when close fails.
    bool close()
    {
        const int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

private:
    int fd_;
};

TransferResult failed(std::string message, bool timed_out = false)
{
    TransferResult result;
    result.outcome = TransferOutcome::Failed;
    result.timed_out = timed_out;
    result.message = std::move(message);
    return result;
}

bool sync_path(const std::string& path, int flags)
{
    FileDescriptor fd(::open(path.c_str(), flags | O_CLOEXEC));
    if (!fd.valid()) {
        return false;
    }
    return ::fsync(fd.get()) == 0;
}

bool write_all(int fd, const char* data, std::size_t size)
{
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

void throttle(std::uint64_t bytes_written,
              std::uint64_t io_limit_kibps,
              std::chrono::steady_clock::time_point started)
{
    if (io_limit_kibps == 0) {
        return;
    }
    const double expected_seconds =
        static_cast<double>(bytes_written) / static_cast<double>(io_limit_kibps * 1024);
    const auto expected = started + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                        std::chrono::duration<double>(expected_seconds));
    const auto now = std::chrono::steady_clock::now();
    if (expected > now) {
        std::this_thread::sleep_until(expected);
    }
}

}


LocalTransferAdapter::LocalTransferAdapter(std::string mount_path,
                                           std::string rsync_path,
                                           bool use_rsync)
    : mount_path_(std::move(mount_path)),
      rsync_path_(std::move(rsync_path)),
      use_rsync_(use_rsync && ProcessRunner::is_available(rsync_path_)),
      logger_(Logger::get_logger("transfer_logger"))
{
}


std::string LocalTransferAdapter::partial_path_for(const std::string& destination)
{
    return destination + kPartialSuffix;
}


std::string LocalTransferAdapter::rsync_partial_path_for(const std::string& destination)
{
    const fs::path dest = Utils::utf8_to_path(destination);
    return Utils::path_to_utf8(dest.parent_path() / kRsyncPartialDir / dest.filename());
}


void LocalTransferAdapter::discard_partial(const std::string& destination)
{
    std::error_code ec;
    for (const auto& partial : {partial_path_for(destination), rsync_partial_path_for(destination)}) {
        const fs::path path = Utils::utf8_to_path(partial);
        if (fs::remove(path, ec) && logger_) {
            logger_->info("Discarded partial transfer '{}'", partial);
        }
        if (ec && logger_) {
            logger_->warn("Cannot discard partial transfer '{}': {}", partial, ec.message());
        }
    }

    const fs::path rsync_dir = Utils::utf8_to_path(rsync_partial_path_for(destination)).parent_path();
    if (fs::is_directory(rsync_dir, ec) && fs::is_empty(rsync_dir, ec)) {
        fs::remove(rsync_dir, ec);
    }
}


TransferResult LocalTransferAdapter::local_copy(const std::string& source,
                                                const std::string& destination,
                                                const TransferOptions& options)
{
    if (logger_) {
        logger_->info("Copying '{}' -> '{}' ({})", source, destination, use_rsync_ ? "rsync" : "stream");
    }
    return use_rsync_ ? rsync_copy(source, destination, options)
                      : stream_copy(source, destination, options);
}


TransferResult LocalTransferAdapter::transfer(const std::string& source,
                                              const std::string& destination,
                                              const TransferOptions& options)
{
    return local_copy(source, destination, options);
}


TransferResult LocalTransferAdapter::restore(const std::string& destination,
                                             const std::string& source,
                                             const TransferOptions& options)
{
    return local_copy(destination, source, options);
}


TransferResult LocalTransferAdapter::rsync_copy(const std::string& source,
                                                const std::string& destination,
                                                const TransferOptions& options)
{
    std::vector<std::string> args{rsync_path_, "--archive"};
    if (options.checksum) {
        args.emplace_back("--checksum");
    }
    if (options.partial) {
        args.emplace_back("--partial");
        args.emplace_back(std::string("--partial-dir=") + kRsyncPartialDir);
    }
    if (options.sparse) {
        args.emplace_back("--sparse");
    }
    if (options.preserve_attributes) {
        args.emplace_back("--xattrs");
    }
    if (options.io_limit_kibps > 0) {
        args.emplace_back("--bwlimit=" + std::to_string(options.io_limit_kibps));
    }
    args.emplace_back("--timeout=" + std::to_string(options.timeout.count()));
    args.push_back(source);
    args.push_back(destination);

    const auto result = runner_.run(args, options.timeout, {}, [this] { beat(); });
    if (!result.succeeded()) {
        return failed(result.timed_out ? "rsync timed out"
                                       : "rsync exited with " + std::to_string(result.exit_code) +
                                             ": " + result.stderr_text,
                      result.timed_out);
    }

    if (!sync_path(destination, O_RDONLY)) {
        return failed("fsync failed on " + destination + ": " + std::strerror(errno));
    }

    TransferResult transfer_result;
    transfer_result.outcome = options.checksum ? TransferOutcome::CompletedVerified
                                               : TransferOutcome::Completed;
    std::error_code ec;
    transfer_result.bytes_transferred = fs::file_size(Utils::utf8_to_path(destination), ec);
    return transfer_result;
}


TransferResult LocalTransferAdapter::stream_copy(const std::string& source,
                                                 const std::string& destination,
                                                 const TransferOptions& options)
{
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + options.timeout;
    const fs::path source_path = Utils::utf8_to_path(source);
    const std::string partial = partial_path_for(destination);

    std::error_code ec;
    const auto source_size = fs::file_size(source_path, ec);
    if (ec) {
        return failed("Cannot stat " + source + ": " + ec.message());
    }

    std::uint64_t offset = 0;
    if (options.partial && fs::exists(Utils::utf8_to_path(partial), ec)) {
        const auto partial_size = fs::file_size(Utils::utf8_to_path(partial), ec);
        if (!ec && partial_size <= source_size) {
            offset = partial_size;
        }
    }

    FileDescriptor in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in.valid()) {
        return failed("Cannot open " + source + ": " + std::strerror(errno));
    }
    const int out_flags = O_WRONLY | O_CREAT | O_CLOEXEC | (offset > 0 ? O_APPEND : O_TRUNC);
    FileDescriptor out(::open(partial.c_str(), out_flags, 0600));
    if (!out.valid()) {
        return failed("Cannot open " + partial + ": " + std::strerror(errno));
    }
    if (offset > 0 && ::lseek(in.get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return failed("Cannot seek " + source + ": " + std::strerror(errno));
    }
    if (offset > 0 && logger_) {
        logger_->info("Resuming '{}' at offset {}", destination, offset);
    }

    std::vector<char> buffer(kChunkSize);
    std::uint64_t written_this_run = 0;
    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return failed("Copy of " + source + " timed out after " +
                              std::to_string(options.timeout.count()) + "s",
                          true);
        }
        const ssize_t got = ::read(in.get(), buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return failed("Read error on " + source + ": " + std::strerror(errno));
        }
        if (got == 0) {
            break;
        }
        if (!write_all(out.get(), buffer.data(), static_cast<std::size_t>(got))) {
            return failed("Write error on " + partial + ": " + std::strerror(errno));
        }
        written_this_run += static_cast<std::uint64_t>(got);
        throttle(written_this_run, options.io_limit_kibps, started);
        beat();
    }

    if (::fsync(out.get()) != 0) {
        return failed("fsync failed on " + partial + ": " + std::strerror(errno));
    }
    if (!out.close()) {
        return failed("Close failed on " + partial + ": " + std::strerror(errno));
    }

    const fs::path partial_path = Utils::utf8_to_path(partial);
    const fs::path destination_path = Utils::utf8_to_path(destination);
    if (options.preserve_attributes) {
        fs::permissions(partial_path, fs::status(source_path).permissions(), ec);
        if (!ec) {
            fs::last_write_time(partial_path, fs::last_write_time(source_path), ec);
        }
        if (ec && logger_) {
            logger_->warn("Could not preserve attributes on '{}': {}", destination, ec.message());
        }
    }

    fs::rename(partial_path, destination_path, ec);
    if (ec) {
        return failed("Rename to " + destination + " failed: " + ec.message());
    }
    if (!sync_path(Utils::path_to_utf8(destination_path.parent_path()), O_RDONLY | O_DIRECTORY) &&
        logger_) {
        logger_->warn("fsync of directory for '{}' failed: {}", destination, std::strerror(errno));
    }

    TransferResult result;
    result.outcome = TransferOutcome::Completed;
    result.bytes_transferred = source_size;
    return result;
}


TransferResult LocalTransferAdapter::link(const std::string& source,
                                          const std::string& destination,
                                          bool symbolic)
{
    std::error_code ec;
    if (symbolic) {
        fs::create_symlink(Utils::utf8_to_path(source), Utils::utf8_to_path(destination), ec);
    } else {
        fs::create_hard_link(Utils::utf8_to_path(source), Utils::utf8_to_path(destination), ec);
    }
    if (ec) {
        return failed(std::string(symbolic ? "symlink" : "hardlink") + " " + destination +
                      " failed: " + ec.message());
    }
    TransferResult result;
    result.outcome = TransferOutcome::Completed;
    return result;
}


bool LocalTransferAdapter::exists(const std::string& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(Utils::utf8_to_path(path), ec));
}


void LocalTransferAdapter::remove(const std::string& path)
{
    std::error_code ec;
    fs::remove(Utils::utf8_to_path(path), ec);
    if (ec) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED, "Cannot remove " + path + ": " + ec.message());
    }
    if (logger_) {
        logger_->info("Removed '{}'", path);
    }
}


void LocalTransferAdapter::prepare_destination(const std::string& path)
{
    const fs::path parent = Utils::utf8_to_path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED,
                           "Cannot create " + Utils::path_to_utf8(parent) + ": " + ec.message());
    }
}


std::string LocalTransferAdapter::compute_hash(const std::string& path, HashAlgorithm algorithm)
{
    return ContentHasher::compute_hash(path, algorithm, [this] { beat(); });
}


std::optional<SpaceInfo> LocalTransferAdapter::space()
{
    if (mount_path_.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    const auto info = fs::space(Utils::utf8_to_path(mount_path_), ec);
    if (ec) {
        if (logger_) {
            logger_->warn("Cannot read free space of '{}': {}", mount_path_, ec.message());
        }
        return std::nullopt;
    }
    return SpaceInfo{info.capacity, info.free, info.available};
}
