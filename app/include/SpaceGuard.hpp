#ifndef SPACEGUARD_HPP
#define SPACEGUARD_HPP

#include "TransferAdapter.hpp"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

struct BatchAdmission {
    std::int64_t drive_id{0};
    std::uint64_t batch_bytes{0};
    std::uint64_t free_bytes{0};
    std::uint64_t max_safe_bytes{0};
    bool measured{false};
    bool admitted{false};
};

/**
 * @brief Headroom check applied before every batch.
 *
 * A batch of B bytes is admitted iff B <= free / 2, where free is the
 * space available to the writer on the destination drive.
 */
class SpaceGuard {
public:
    explicit SpaceGuard(TransferFactory factory);

    std::optional<SpaceInfo> measure(const DriveRecord& drive) const;

    // 0 when the drive cannot be measured.
    std::uint64_t max_safe_write_bytes(const DriveRecord& drive) const;

    BatchAdmission admit_batch(const DriveRecord& drive, std::uint64_t batch_bytes) const;

    // True when a single file can never fit on the device.
    bool exceeds_capacity(const DriveRecord& drive, std::uint64_t step_bytes) const;

    static std::uint64_t max_safe_write_bytes(const SpaceInfo& info) { return info.available_bytes / 2; }
    static bool admits(std::uint64_t batch_bytes, std::uint64_t free_bytes) { return batch_bytes <= free_bytes / 2; }

    // Length of the longest prefix of sizes whose sum fits max_bytes (at least 1 when non-empty).
    static std::size_t partition_batch(const std::vector<std::uint64_t>& sizes, std::uint64_t max_bytes);

private:
    TransferFactory factory_;
};

#endif
