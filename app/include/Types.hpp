#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class PlanStatus { Draft, Approved, InProgress, Completed, Aborted };

enum class StepStatus { Pending, InProgress, Completed, Failed, RolledBack };

enum class StepAction { Move, Copy, Delete, Hardlink, Symlink };

enum class BackendKind { Local, Rclone };

enum class DriveRole { Source, Target, Backup, Offload };

enum class FilePriority { Critical, Normal, Low, Trash };

enum class FileStatus { Indexed, Classified, Planned, Migrating, Verified, SourceRemoved };

enum class AgentMode { Automatic, HumanApproved };

enum class FailureMode { AbortOnFailure, SkipOnFailure, RetryThenPrompt };

/**
 * @brief Failure handling chosen once per execution run.
 *
 * When retries is unset the configured retry count applies.
 */
struct FailurePolicy {
    FailureMode mode{FailureMode::AbortOnFailure};
    std::optional<int> retries;

    static FailurePolicy abort_on_failure() { return {FailureMode::AbortOnFailure, std::nullopt}; }
    static FailurePolicy skip_on_failure() { return {FailureMode::SkipOnFailure, std::nullopt}; }
    static FailurePolicy retry_then_prompt() { return {FailureMode::RetryThenPrompt, std::nullopt}; }
    // Retry n times, then stop the run
    static FailurePolicy auto_retry(int n) { return {FailureMode::AbortOnFailure, n}; }
};

struct SpaceInfo {
    std::uint64_t total_bytes{0};
    std::uint64_t free_bytes{0};
    std::uint64_t available_bytes{0};
};

struct DriveRecord {
    std::int64_t id{0};
    std::string label;
    DriveRole role{DriveRole::Source};
    BackendKind backend{BackendKind::Local};
    std::string mount_path;
    std::string rclone_remote;
    std::int64_t total_bytes{0};
    bool is_online{true};
    bool is_readonly{false};
};

struct FileRecord {
    std::int64_t id{0};
    std::int64_t drive_id{0};
    std::string path;     ///< Relative to the drive root.
    std::string abs_path;
    std::int64_t size_bytes{0};
    std::string hash;     ///< Known content digest, empty when not hashed yet.
    std::string category;
    FilePriority priority{FilePriority::Normal};
    std::optional<std::int64_t> duplicate_group;
    bool is_original{false};
    FileStatus status{FileStatus::Indexed};
    std::string migrated_to;
    std::optional<std::int64_t> migrated_to_drive;
    std::string migrated_at;
    std::string verified_hash;
};

struct MigrationPlan {
    std::int64_t id{0};
    std::string created_at;
    std::string description;
    std::optional<std::int64_t> source_drive_id;
    std::optional<std::int64_t> target_drive_id;
    PlanStatus status{PlanStatus::Draft};
    std::int64_t total_files{0};
    std::int64_t total_bytes{0};
    std::int64_t completed_files{0};
    std::int64_t completed_bytes{0};
    std::optional<std::int64_t> max_batch_size_bytes;
    std::string started_at;
    std::string completed_at;
    std::string active_run;
    std::int64_t run_heartbeat{0};
};

struct MigrationStep {
    std::int64_t id{0};
    std::int64_t plan_id{0};
    std::int64_t file_id{0};
    StepAction action{StepAction::Copy};
    std::string source_path;
    std::int64_t source_drive_id{0};
    std::string dest_path;  ///< Empty for Delete.
    std::optional<std::int64_t> dest_drive_id;
    StepStatus status{StepStatus::Pending};
    std::string pre_hash;
    std::string post_hash;
    std::string executed_at;
    std::string error;
    int error_code{0};
    int attempts{0};
    std::int64_t size_bytes{0};
    int step_order{0};
};

struct AuditEntry {
    std::int64_t id{0};
    std::string timestamp;
    std::string action;
    std::optional<std::int64_t> file_id;
    std::optional<std::int64_t> plan_id;
    std::optional<std::int64_t> drive_id;
    std::string details;  ///< JSON object
    AgentMode agent_mode{AgentMode::Automatic};
};

inline const char* to_string(PlanStatus status) {
    switch (status) {
        case PlanStatus::Draft: return "draft";
        case PlanStatus::Approved: return "approved";
        case PlanStatus::InProgress: return "in_progress";
        case PlanStatus::Completed: return "completed";
        case PlanStatus::Aborted: return "aborted";
    }
    return "unknown";
}

inline const char* to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Pending: return "pending";
        case StepStatus::InProgress: return "in_progress";
        case StepStatus::Completed: return "completed";
        case StepStatus::Failed: return "failed";
        case StepStatus::RolledBack: return "rolled_back";
    }
    return "unknown";
}

inline const char* to_string(StepAction action) {
    switch (action) {
        case StepAction::Move: return "move";
        case StepAction::Copy: return "copy";
        case StepAction::Delete: return "delete";
        case StepAction::Hardlink: return "hardlink";
        case StepAction::Symlink: return "symlink";
    }
    return "unknown";
}

inline const char* to_string(BackendKind backend) {
    switch (backend) {
        case BackendKind::Local: return "local";
        case BackendKind::Rclone: return "rclone";
    }
    return "unknown";
}

inline const char* to_string(DriveRole role) {
    switch (role) {
        case DriveRole::Source: return "source";
        case DriveRole::Target: return "target";
        case DriveRole::Backup: return "backup";
        case DriveRole::Offload: return "offload";
    }
    return "unknown";
}

inline const char* to_string(FilePriority priority) {
    switch (priority) {
        case FilePriority::Critical: return "critical";
        case FilePriority::Normal: return "normal";
        case FilePriority::Low: return "low";
        case FilePriority::Trash: return "trash";
    }
    return "unknown";
}

inline const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Indexed: return "indexed";
        case FileStatus::Classified: return "classified";
        case FileStatus::Planned: return "planned";
        case FileStatus::Migrating: return "migrating";
        case FileStatus::Verified: return "verified";
        case FileStatus::SourceRemoved: return "source_removed";
    }
    return "unknown";
}

inline const char* to_string(AgentMode mode) {
    return mode == AgentMode::HumanApproved ? "human_approved" : "automatic";
}

inline const char* to_string(FailureMode mode) {
    switch (mode) {
        case FailureMode::AbortOnFailure: return "abort";
        case FailureMode::SkipOnFailure: return "skip";
        case FailureMode::RetryThenPrompt: return "prompt";
    }
    return "unknown";
}

std::optional<PlanStatus> parse_plan_status(const std::string& value);
std::optional<StepStatus> parse_step_status(const std::string& value);
std::optional<StepAction> parse_step_action(const std::string& value);
std::optional<BackendKind> parse_backend_kind(const std::string& value);
std::optional<DriveRole> parse_drive_role(const std::string& value);
std::optional<FilePriority> parse_file_priority(const std::string& value);
std::optional<FileStatus> parse_file_status(const std::string& value);
std::optional<AgentMode> parse_agent_mode(const std::string& value);
std::optional<FailureMode> parse_failure_mode(const std::string& value);

inline bool is_transfer_action(StepAction action) {
    return action == StepAction::Move || action == StepAction::Copy;
}

inline bool is_link_action(StepAction action) {
    return action == StepAction::Hardlink || action == StepAction::Symlink;
}

inline bool is_terminal(PlanStatus status) {
    return status == PlanStatus::Completed || status == PlanStatus::Aborted;
}

#endif
