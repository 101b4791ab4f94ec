#ifndef LOCALTRANSFERADAPTER_HPP
#define LOCALTRANSFERADAPTER_HPP

#include "ProcessRunner.hpp"
#include "TransferAdapter.hpp"

#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Copies between locally mounted paths.
 *
 * Uses rsync (--archive --checksum --partial-dir --sparse) when enabled and
 * installed, otherwise an in-process chunked copy into a partial file that
 * is renamed into place once complete.
 */
class LocalTransferAdapter : public ITransferAdapter {
public:
    LocalTransferAdapter(std::string mount_path,
                         std::string rsync_path,
                         bool use_rsync);

    TransferResult local_copy(const std::string& source,
                              const std::string& destination,
                              const TransferOptions& options);

    BackendKind backend() const override { return BackendKind::Local; }
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
    void discard_partial(const std::string& destination) override;

    // Resume file of the in-process copy
    static std::string partial_path_for(const std::string& destination);
    // Where rsync keeps an interrupted transfer (--partial-dir is relative to the destination directory)
    static std::string rsync_partial_path_for(const std::string& destination);

private:
    TransferResult rsync_copy(const std::string& source,
                              const std::string& destination,
                              const TransferOptions& options);
    TransferResult stream_copy(const std::string& source,
                               const std::string& destination,
                               const TransferOptions& options);

    std::string mount_path_;
    std::string rsync_path_;
    bool use_rsync_;
    ProcessRunner runner_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
