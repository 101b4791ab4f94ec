#ifndef TRANSFERADAPTER_HPP
#define TRANSFERADAPTER_HPP

#include "ContentHasher.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

struct TransferOptions {
    bool checksum{true};
    bool partial{true};
    bool sparse{true};
    bool preserve_attributes{true};
    std::chrono::seconds timeout{3600};
    std::uint64_t io_limit_kibps{0};  ///< 0 = unlimited
};

enum class TransferOutcome {
    Failed,
    Completed,          ///< Bytes written, not verified by the tool.
    CompletedVerified   ///< The tool reported its own checksum match.
};

struct TransferResult {
    TransferOutcome outcome{TransferOutcome::Failed};
    std::uint64_t bytes_transferred{0};
    bool timed_out{false};
    std::string message;

    bool completed() const { return outcome != TransferOutcome::Failed; }
};

/**
 * @brief Storage backend capability used by the executor and rollback.
 *
 * `source` arguments are always local paths; `destination` paths are in
 * the adapter's own namespace (a local path or a path inside a remote).
 * Callers verify every result with compute_hash themselves.
 *
 * A heartbeat, when set, is invoked periodically during transfers and
 * hashes; an exception it throws aborts the operation.
 */
class ITransferAdapter {
public:
    using Heartbeat = std::function<void()>;

    virtual ~ITransferAdapter() = default;

    virtual void set_heartbeat(Heartbeat heartbeat) { heartbeat_ = std::move(heartbeat); }

    virtual BackendKind backend() const = 0;

    // Local file -> backend
    virtual TransferResult transfer(const std::string& source,
                                    const std::string& destination,
                                    const TransferOptions& options) = 0;

    // Backend -> local file
    virtual TransferResult restore(const std::string& destination,
                                   const std::string& source,
                                   const TransferOptions& options) = 0;

    virtual TransferResult link(const std::string& source,
                                const std::string& destination,
                                bool symbolic) = 0;

    virtual bool exists(const std::string& path) = 0;
    virtual void remove(const std::string& path) = 0;
    virtual void prepare_destination(const std::string& path) = 0;
    virtual std::string compute_hash(const std::string& path, HashAlgorithm algorithm) = 0;
    virtual std::optional<SpaceInfo> space() = 0;

    // Drops resume state left by an interrupted transfer to destination.
    virtual void discard_partial(const std::string& destination) { (void)destination; }

protected:
    void beat() const
    {
        if (heartbeat_) {
            heartbeat_();
        }
    }

    Heartbeat heartbeat_;
};

using TransferFactory = std::function<std::unique_ptr<ITransferAdapter>(const DriveRecord&)>;

struct TransferToolConfig {
    std::string rsync_path{"rsync"};
    std::string rclone_path{"rclone"};
    bool prefer_rsync{true};
    std::chrono::seconds query_timeout{600};   ///< rclone lsjson/deletefile/about
    std::chrono::seconds hash_timeout{3600};   ///< rclone cat when hashing a remote object
};

// Local drives get LocalTransferAdapter, rclone drives RemoteTransferAdapter.
TransferFactory make_transfer_factory(const TransferToolConfig& config);

#endif
