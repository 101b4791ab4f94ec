#include "Planner.hpp"
#include "AuditLog.hpp"
#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "RunLease.hpp"
#include "SpaceGuard.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <map>
#include <set>
#include <unordered_set>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

std::string join_remote(const std::string& lhs, const std::string& rhs)
{
    if (lhs.empty()) {
        return rhs;
    }
    if (rhs.empty()) {
        return lhs;
    }
    std::string left = lhs;
    while (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    std::size_t start = 0;
    while (start < rhs.size() && rhs[start] == '/') {
        ++start;
    }
    return left + "/" + rhs.substr(start);
}

fs::path relative_part(const std::string& path)
{
    fs::path rel = Utils::utf8_to_path(path);
    return rel.is_absolute() ? rel.relative_path() : rel;
}

}


Selection Selection::files(std::vector<std::int64_t> ids)
{
    Selection selection;
    selection.kind = Kind::ExplicitFiles;
    selection.file_ids = std::move(ids);
    return selection;
}

Selection Selection::by_category(std::string category,
                                 std::optional<std::int64_t> drive_id,
                                 std::optional<FilePriority> priority)
{
    Selection selection;
    selection.kind = Kind::Category;
    selection.category = std::move(category);
    selection.drive_id = drive_id;
    selection.priority = priority;
    return selection;
}

Selection Selection::group(std::int64_t group_id)
{
    Selection selection;
    selection.kind = Kind::DuplicateGroup;
    selection.duplicate_group = group_id;
    return selection;
}


Planner::Planner(DatabaseManager& db,
                 AuditLog& audit,
                 SpaceGuard& space_guard,
                 TransferFactory transfer_factory,
                 std::shared_ptr<spdlog::logger> core_logger)
    : db(db),
      audit(audit),
      space_guard(space_guard),
      transfer_factory(std::move(transfer_factory)),
      core_logger(std::move(core_logger))
{
}


std::vector<FileRecord> Planner::resolve_selection(const Selection& selection, StepAction action) const
{
    std::vector<FileRecord> files;
    switch (selection.kind) {
        case Selection::Kind::ExplicitFiles: {
            std::unordered_set<std::int64_t> seen;
            for (const auto id : selection.file_ids) {
                if (!seen.insert(id).second) {
                    continue;
                }
                auto file = db.get_file(id);
                if (!file) {
                    THROW_ENGINE_ERROR(Code::INVALID_PLAN, fmt::format("file {} not found", id));
                }
                if (file->status == FileStatus::SourceRemoved) {
                    THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                                       fmt::format("file {} was already removed from its source", id));
                }
                files.push_back(std::move(*file));
            }
            break;
        }
        case Selection::Kind::Category: {
            DatabaseManager::FileQuery query;
            query.category = selection.category;
            query.drive_id = selection.drive_id;
            query.priority = selection.priority;
            files = db.find_files(query);
            break;
        }
        case Selection::Kind::DuplicateGroup: {
            for (auto& member : db.list_duplicate_group(selection.duplicate_group)) {
                if (member.status == FileStatus::SourceRemoved) {
                    continue;
                }
                // A dedup plan removes the copies and keeps the originals
                if (action == StepAction::Delete && member.is_original) {
                    continue;
                }
                files.push_back(std::move(member));
            }
            break;
        }
    }

    if (files.empty()) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN, "selection matched no files");
    }
    return files;
}


DriveRecord Planner::require_drive(std::int64_t drive_id) const
{
    auto drive = db.get_drive(drive_id);
    if (!drive) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN, fmt::format("drive {} is not registered", drive_id));
    }
    return *drive;
}


DriveRecord Planner::validate_destination(const PlannerOptions& options, StepAction action) const
{
    if (!options.target_drive_id) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                           fmt::format("{} requires a target drive", to_string(action)));
    }
    DriveRecord target = require_drive(*options.target_drive_id);
    if (!target.is_online) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                           fmt::format("target drive '{}' is offline", target.label));
    }
    if (target.is_readonly) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                           fmt::format("target drive '{}' is read-only", target.label));
    }
    if (is_link_action(action) && target.backend != BackendKind::Local) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                           fmt::format("{} needs a local target drive", to_string(action)));
    }
    return target;
}


std::string Planner::source_path_for(const FileRecord& file) const
{
    if (!file.abs_path.empty()) {
        return file.abs_path;
    }
    const DriveRecord drive = require_drive(file.drive_id);
    return Utils::path_to_utf8(Utils::utf8_to_path(drive.mount_path) / relative_part(file.path));
}


std::string Planner::destination_for(const FileRecord& file,
                                     const DriveRecord& target,
                                     const PlannerOptions& options) const
{
    if (target.backend == BackendKind::Rclone) {
        return join_remote(options.dest_subdir, file.path);
    }
    fs::path dest = Utils::utf8_to_path(target.mount_path);
    if (!options.dest_subdir.empty()) {
        dest /= relative_part(options.dest_subdir);
    }
    dest /= relative_part(file.path);
    return Utils::path_to_utf8(dest.lexically_normal());
}


std::string Planner::capture_pre_hash(FileRecord& file, HashAlgorithm algorithm)
{
    if (!file.hash.empty()) {
        return file.hash;
    }

    const DriveRecord drive = require_drive(file.drive_id);
    if (!drive.is_online) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                           fmt::format("file {} has no known hash and drive '{}' is offline",
                                       file.id, drive.label));
    }
    auto adapter = transfer_factory(drive);
    const std::string path = drive.backend == BackendKind::Local ? source_path_for(file) : file.path;
    try {
        file.hash = adapter->compute_hash(path, algorithm);
    } catch (const ErrorCodes::EngineException& ex) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                           fmt::format("cannot hash file {} at plan time: {}", file.id, ex.what()));
    }
    db.set_file_hash(file.id, file.hash);
    if (core_logger) {
        core_logger->info("Captured {} digest for file {} at plan time",
                          ContentHasher::algorithm_name(algorithm), file.id);
    }
    return file.hash;
}


void Planner::validate_delete_targets(std::vector<FileRecord>& files)
{
    std::set<std::int64_t> deleting;
    for (const auto& file : files) {
        deleting.insert(file.id);
    }

    std::map<std::int64_t, std::vector<FileRecord>> groups;
    for (auto& file : files) {
        if (!file.duplicate_group) {
            THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                               fmt::format("file {} ({}) is not in a duplicate group; deleting it "
                                           "would destroy the last copy", file.id, file.path));
        }
        auto group_it = groups.find(*file.duplicate_group);
        if (group_it == groups.end()) {
            group_it = groups.emplace(*file.duplicate_group,
                                      db.list_duplicate_group(*file.duplicate_group)).first;
        }
        const auto& members = group_it->second;

        HashAlgorithm algorithm = HashAlgorithm::Sha256;
        for (const auto& member : members) {
            if (member.is_original && !member.hash.empty()) {
                algorithm = ContentHasher::algorithm_for_digest(member.hash);
                break;
            }
        }
        const std::string target_hash = capture_pre_hash(file, algorithm);

        const bool has_survivor = std::any_of(members.begin(), members.end(),
            [&](const FileRecord& member) {
                return member.id != file.id
                    && member.is_original
                    && member.status != FileStatus::SourceRemoved
                    && deleting.count(member.id) == 0
                    && ContentHasher::digests_equal(member.hash, target_hash);
            });
        if (!has_survivor) {
            THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                               fmt::format("file {} ({}) has no surviving hash-equal original in "
                                           "duplicate group {}", file.id, file.path,
                                           *file.duplicate_group));
        }
    }
}


std::int64_t Planner::create_plan(const Selection& selection,
                                  StepAction action,
                                  const PlannerOptions& options)
{
    auto files = resolve_selection(selection, action);

    std::optional<DriveRecord> target;
    if (action == StepAction::Delete) {
        validate_delete_targets(files);
    } else {
        target = validate_destination(options, action);
    }

    std::vector<MigrationStep> steps;
    steps.reserve(files.size());
    std::set<std::string> destinations;
    std::set<std::int64_t> source_drives;
    std::int64_t total_bytes = 0;
    std::uint64_t largest_file = 0;

    for (auto& file : files) {
        const DriveRecord source_drive = require_drive(file.drive_id);
        source_drives.insert(source_drive.id);

        MigrationStep step;
        step.file_id = file.id;
        step.action = action;
        step.source_drive_id = source_drive.id;
        step.size_bytes = file.size_bytes;
        step.source_path = source_drive.backend == BackendKind::Local ? source_path_for(file) : file.path;

        if (action != StepAction::Delete) {
            if (source_drive.backend != BackendKind::Local) {
                THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                                   fmt::format("file {} lives on remote drive '{}'; only local "
                                               "sources can be transferred", file.id, source_drive.label));
            }
            if (action == StepAction::Hardlink && source_drive.id != target->id) {
                THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                                   fmt::format("hardlink of file {} must stay on drive '{}'",
                                               file.id, source_drive.label));
            }
            step.dest_drive_id = target->id;
            step.dest_path = destination_for(file, *target, options);
            if (step.dest_path == step.source_path) {
                THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                                   fmt::format("file {} would be written onto itself", file.id));
            }
            if (!destinations.insert(step.dest_path).second) {
                THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                                   fmt::format("two files map to destination {}", step.dest_path));
            }
            if (target->backend == BackendKind::Local) {
                std::error_code ec;
                if (fs::exists(fs::symlink_status(Utils::utf8_to_path(step.dest_path), ec))) {
                    THROW_ENGINE_ERROR(Code::INVALID_PLAN,
                                       fmt::format("destination {} already exists", step.dest_path));
                }
            }
            step.pre_hash = capture_pre_hash(file, HashAlgorithm::Sha256);
        } else {
            step.pre_hash = file.hash;
        }

        total_bytes += file.size_bytes;
        largest_file = std::max<std::uint64_t>(largest_file, static_cast<std::uint64_t>(file.size_bytes));
        steps.push_back(std::move(step));
    }

    if (target && is_transfer_action(action) && space_guard.exceeds_capacity(*target, largest_file)) {
        THROW_ENGINE_ERROR(Code::INSUFFICIENT_SPACE,
                           fmt::format("a {} file cannot fit on drive '{}'",
                                       Utils::format_bytes(largest_file), target->label));
    }

    // Transfers first, then deletions; relative order within each class is kept
    std::stable_sort(steps.begin(), steps.end(), [](const MigrationStep& a, const MigrationStep& b) {
        return a.action != StepAction::Delete && b.action == StepAction::Delete;
    });
    for (std::size_t i = 0; i < steps.size(); ++i) {
        steps[i].step_order = static_cast<int>(i);
    }

    MigrationPlan plan;
    plan.created_at = Utils::current_timestamp_iso();
    plan.description = options.description.empty()
        ? fmt::format("{} {} file(s)", to_string(action), steps.size())
        : options.description;
    if (source_drives.size() == 1) {
        plan.source_drive_id = *source_drives.begin();
    }
    if (target) {
        plan.target_drive_id = target->id;
    }
    plan.total_files = static_cast<std::int64_t>(steps.size());
    plan.total_bytes = total_bytes;
    plan.max_batch_size_bytes = options.max_batch_size_bytes;

    Json::Value details(Json::objectValue);
    details["action"] = to_string(action);
    details["total_files"] = Json::Int64(plan.total_files);
    details["total_bytes"] = Json::Int64(plan.total_bytes);
    details["description"] = plan.description;
    if (plan.target_drive_id) {
        details["target_drive_id"] = Json::Int64(*plan.target_drive_id);
    }
    const auto entry = AuditLog::make_entry("plan_created", options.agent_mode, details,
                                            std::nullopt, std::nullopt, plan.target_drive_id);

    const std::int64_t plan_id = db.create_plan_with_steps(plan, steps, entry);
    if (core_logger) {
        core_logger->info("Plan {} created: {} {} file(s), {}", plan_id, to_string(action),
                          steps.size(), Utils::format_bytes(static_cast<std::uint64_t>(total_bytes)));
    }
    return plan_id;
}


void Planner::approve_plan(std::int64_t plan_id, AgentMode agent_mode)
{
    auto plan = db.get_plan(plan_id);
    if (!plan) {
        THROW_ENGINE_ERROR(Code::PLAN_NOT_FOUND, fmt::format("plan {}", plan_id));
    }
    if (plan->status != PlanStatus::Draft ||
        !db.transition_plan_status(plan_id, PlanStatus::Draft, PlanStatus::Approved)) {
        THROW_ENGINE_ERROR(Code::INVALID_STATUS_TRANSITION,
                           fmt::format("plan {} is {}, only draft plans can be approved",
                                       plan_id, to_string(plan->status)));
    }

    Json::Value details(Json::objectValue);
    details["total_files"] = Json::Int64(plan->total_files);
    details["total_bytes"] = Json::Int64(plan->total_bytes);
    audit.record("plan_approved", agent_mode, details, plan_id);

    if (core_logger) {
        core_logger->info("Plan {} approved ({})", plan_id, to_string(agent_mode));
    }
}


void Planner::abort_plan(std::int64_t plan_id, const std::string& reason, AgentMode agent_mode)
{
    auto plan = db.get_plan(plan_id);
    if (!plan) {
        THROW_ENGINE_ERROR(Code::PLAN_NOT_FOUND, fmt::format("plan {}", plan_id));
    }
    if (is_terminal(plan->status)) {
        THROW_ENGINE_ERROR(Code::INVALID_STATUS_TRANSITION,
                           fmt::format("plan {} is already {}", plan_id, to_string(plan->status)));
    }

    {
        // A live run keeps the plan; only a lease abandoned past any timeout is broken
        RunLease lease(db, plan_id, Utils::make_run_token(), std::numeric_limits<std::int32_t>::max());
        if (!db.transition_plan_status(plan_id, plan->status, PlanStatus::Aborted)) {
            THROW_ENGINE_ERROR(Code::INVALID_STATUS_TRANSITION,
                               fmt::format("plan {} changed status concurrently", plan_id));
        }
    }

    for (const auto& step : db.list_steps(plan_id)) {
        if (step.status != StepStatus::Completed && step.status != StepStatus::RolledBack) {
            discard_partial_transfer(step);
        }
        if (step.status == StepStatus::Pending || step.status == StepStatus::Failed) {
            auto file = db.get_file(step.file_id);
            if (file && file->status == FileStatus::Planned) {
                db.update_file_status(step.file_id, FileStatus::Indexed);
            }
        }
    }

    Json::Value details(Json::objectValue);
    details["reason"] = reason;
    details["previous_status"] = to_string(plan->status);
    audit.record("plan_aborted", agent_mode, details, plan_id);

    if (core_logger) {
        core_logger->warn("Plan {} aborted: {}", plan_id, reason);
    }
}


void Planner::discard_partial_transfer(const MigrationStep& step) const
{
    if (!is_transfer_action(step.action) || !step.dest_drive_id || step.dest_path.empty()) {
        return;
    }
    auto drive = db.get_drive(*step.dest_drive_id);
    if (!drive) {
        return;
    }
    try {
        auto adapter = transfer_factory(*drive);
        if (adapter) {
            adapter->discard_partial(step.dest_path);
        }
    } catch (const ErrorCodes::EngineException& ex) {
        if (ex.fatal()) {
            throw;
        }
        if (core_logger) {
            core_logger->warn("Abort of plan {}: cannot discard partial transfer of {}: {}", step.plan_id,
                              step.dest_path, ex.what());
        }
    }
}
