#include "Types.hpp"
#include "Utils.hpp"

#include <initializer_list>
#include <utility>

namespace {

template <typename Enum>
std::optional<Enum> parse_enum(const std::string& value,
                               std::initializer_list<Enum> candidates)
{
    const std::string lowered = Utils::to_lower_copy(value);
    for (Enum candidate : candidates) {
        if (lowered == to_string(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}


std::optional<PlanStatus> parse_plan_status(const std::string& value)
{
    return parse_enum(value, {PlanStatus::Draft, PlanStatus::Approved, PlanStatus::InProgress,
                              PlanStatus::Completed, PlanStatus::Aborted});
}

std::optional<StepStatus> parse_step_status(const std::string& value)
{
    return parse_enum(value, {StepStatus::Pending, StepStatus::InProgress, StepStatus::Completed,
                              StepStatus::Failed, StepStatus::RolledBack});
}

std::optional<StepAction> parse_step_action(const std::string& value)
{
    return parse_enum(value, {StepAction::Move, StepAction::Copy, StepAction::Delete,
                              StepAction::Hardlink, StepAction::Symlink});
}

std::optional<BackendKind> parse_backend_kind(const std::string& value)
{
    return parse_enum(value, {BackendKind::Local, BackendKind::Rclone});
}

std::optional<DriveRole> parse_drive_role(const std::string& value)
{
    return parse_enum(value, {DriveRole::Source, DriveRole::Target, DriveRole::Backup,
                              DriveRole::Offload});
}

std::optional<FilePriority> parse_file_priority(const std::string& value)
{
    return parse_enum(value, {FilePriority::Critical, FilePriority::Normal, FilePriority::Low,
                              FilePriority::Trash});
}

std::optional<FileStatus> parse_file_status(const std::string& value)
{
    return parse_enum(value, {FileStatus::Indexed, FileStatus::Classified, FileStatus::Planned,
                              FileStatus::Migrating, FileStatus::Verified,
                              FileStatus::SourceRemoved});
}

std::optional<AgentMode> parse_agent_mode(const std::string& value)
{
    return parse_enum(value, {AgentMode::Automatic, AgentMode::HumanApproved});
}

std::optional<FailureMode> parse_failure_mode(const std::string& value)
{
    return parse_enum(value, {FailureMode::AbortOnFailure, FailureMode::SkipOnFailure,
                              FailureMode::RetryThenPrompt});
}
