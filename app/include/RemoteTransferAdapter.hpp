#ifndef REMOTETRANSFERADAPTER_HPP
#define REMOTETRANSFERADAPTER_HPP

#include "ProcessRunner.hpp"
#include "TransferAdapter.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

// Transfers to and from an rclone remote. Destination paths are relative to the remote root.
class RemoteTransferAdapter : public ITransferAdapter {
public:
    RemoteTransferAdapter(std::string remote,
                          std::string rclone_path,
                          std::chrono::seconds query_timeout = std::chrono::seconds(600),
                          std::chrono::seconds hash_timeout = std::chrono::seconds(3600));

    TransferResult remote_copy(const std::string& source,
                               const std::string& destination,
                               const std::string& remote,
                               const TransferOptions& options);

    BackendKind backend() const override { return BackendKind::Rclone; }
    TransferResult transfer(const std::string& source,
                            const std::string& destination,
                            const TransferOptions& options) override;
    TransferResult restore(const std::string& destination,
                           const std::string& source,
                           const TransferOptions& options) override;
    TransferResult link(const std::string& source,
                        const std::string& destination,
                        bool symbolic) override;
    bool exists(const std::string& path) override;
    void remove(const std::string& path) override;
    void prepare_destination(const std::string& path) override;
    std::string compute_hash(const std::string& path, HashAlgorithm algorithm) override;
    std::optional<SpaceInfo> space() override;

    // "gdrive" + "a/b.txt" -> "gdrive:a/b.txt"
    static std::string object_spec(const std::string& remote, const std::string& path);
    // Parses `rclone about --json` output.
    static std::optional<SpaceInfo> parse_about_json(const std::string& json);

private:
    std::vector<std::string> copy_args(const std::string& from,
                                       const std::string& to,
                                       const TransferOptions& options) const;

    ProcessResult run(const std::vector<std::string>& argv, std::chrono::seconds timeout) const;

    std::string remote_;
    std::string rclone_path_;
    std::chrono::seconds query_timeout_;
    std::chrono::seconds hash_timeout_;
    ProcessRunner runner_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
