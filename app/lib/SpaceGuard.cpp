#include "SpaceGuard.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <utility>

namespace {

TestHooks::FreeSpaceOverride& free_space_override_slot()
{
    static TestHooks::FreeSpaceOverride override_fn;
    return override_fn;
}

}

namespace TestHooks {

void set_free_space_override(FreeSpaceOverride override_fn)
{
    free_space_override_slot() = std::move(override_fn);
}

void reset_free_space_override()
{
    free_space_override_slot() = FreeSpaceOverride{};
}

} // namespace TestHooks


SpaceGuard::SpaceGuard(TransferFactory factory)
    : factory_(std::move(factory))
{
}


std::optional<SpaceInfo> SpaceGuard::measure(const DriveRecord& drive) const
{
    if (const auto& override_fn = free_space_override_slot()) {
        return override_fn(drive);
    }
    if (!factory_) {
        return std::nullopt;
    }
    auto adapter = factory_(drive);
    return adapter ? adapter->space() : std::nullopt;
}


std::uint64_t SpaceGuard::max_safe_write_bytes(const DriveRecord& drive) const
{
    if (auto info = measure(drive)) {
        return max_safe_write_bytes(*info);
    }
    return 0;
}


BatchAdmission SpaceGuard::admit_batch(const DriveRecord& drive, std::uint64_t batch_bytes) const
{
    BatchAdmission admission;
    admission.drive_id = drive.id;
    admission.batch_bytes = batch_bytes;

    const auto info = measure(drive);
    auto logger = Logger::get_logger("core_logger");
    if (!info) {
        // Unmeasurable remotes (no `about` support) are admitted; local drives are not.
        admission.admitted = drive.backend == BackendKind::Rclone;
        if (logger) {
            logger->warn("Free space of drive '{}' unknown; batch of {} {}", drive.label,
                         Utils::format_bytes(batch_bytes), admission.admitted ? "admitted" : "held");
        }
        return admission;
    }

    admission.measured = true;
    admission.free_bytes = info->available_bytes;
    admission.max_safe_bytes = max_safe_write_bytes(*info);
    admission.admitted = admits(batch_bytes, info->available_bytes);

    if (logger) {
        logger->info("Space check on '{}': batch {} vs free {} (limit {}) -> {}",
                     drive.label, Utils::format_bytes(batch_bytes),
                     Utils::format_bytes(admission.free_bytes),
                     Utils::format_bytes(admission.max_safe_bytes),
                     admission.admitted ? "admitted" : "paused");
    }
    return admission;
}


bool SpaceGuard::exceeds_capacity(const DriveRecord& drive, std::uint64_t step_bytes) const
{
    std::uint64_t capacity = 0;
    if (auto info = measure(drive)) {
        capacity = info->total_bytes;
    }
    if (capacity == 0 && drive.total_bytes > 0) {
        capacity = static_cast<std::uint64_t>(drive.total_bytes);
    }
    return capacity > 0 && step_bytes > capacity;
}


std::size_t SpaceGuard::partition_batch(const std::vector<std::uint64_t>& sizes, std::uint64_t max_bytes)
{
    if (sizes.empty()) {
        return 0;
    }
    std::uint64_t total = 0;
    std::size_t count = 0;
    for (const auto size : sizes) {
        if (count > 0 && total + size > max_bytes) {
            break;
        }
        total += size;
        ++count;
    }
    return count;
}
