#include "TransferAdapter.hpp"
#include "LocalTransferAdapter.hpp"
#include "RemoteTransferAdapter.hpp"
#include "EngineException.hpp"


TransferFactory make_transfer_factory(const TransferToolConfig& config)
{
    return [config](const DriveRecord& drive) -> std::unique_ptr<ITransferAdapter> {
        switch (drive.backend) {
            case BackendKind::Local:
                return std::make_unique<LocalTransferAdapter>(
                    drive.mount_path, config.rsync_path, config.prefer_rsync);
            case BackendKind::Rclone:
                if (drive.rclone_remote.empty()) {
                    THROW_ENGINE_ERROR(ErrorCodes::Code::INVALID_PLAN,
                                       "Drive '" + drive.label + "' has no rclone remote");
                }
                return std::make_unique<RemoteTransferAdapter>(drive.rclone_remote, config.rclone_path,
                                                               config.query_timeout, config.hash_timeout);
        }
        THROW_ENGINE_ERROR(ErrorCodes::Code::INVALID_PLAN, "Unknown backend for drive " + drive.label);
    };
}
