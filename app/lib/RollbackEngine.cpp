#include "RollbackEngine.hpp"
#include "AuditLog.hpp"
#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "RunLease.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

RollbackStepResult make_result(const MigrationStep& step)
{
    RollbackStepResult result;
    result.step_id = step.id;
    result.step_order = step.step_order;
    result.action = step.action;
    result.status = step.status;
    return result;
}

}


RollbackEngine::RollbackEngine(DatabaseManager& db,
                               AuditLog& audit,
                               TransferFactory transfer_factory,
                               std::shared_ptr<spdlog::logger> core_logger)
    : db(db),
      audit(audit),
      transfer_factory(std::move(transfer_factory)),
      core_logger(std::move(core_logger))
{
}


MigrationPlan RollbackEngine::require_plan(std::int64_t plan_id) const
{
    auto plan = db.get_plan(plan_id);
    if (!plan) {
        THROW_ENGINE_ERROR(Code::PLAN_NOT_FOUND, fmt::format("plan {}", plan_id));
    }
    return *plan;
}


std::unique_ptr<ITransferAdapter> RollbackEngine::adapter_for(std::int64_t drive_id) const
{
    auto drive = db.get_drive(drive_id);
    if (!drive) {
        THROW_ENGINE_ERROR(Code::DRIVE_NOT_FOUND, fmt::format("drive {}", drive_id));
    }
    if (!drive->is_online) {
        THROW_ENGINE_ERROR(Code::DRIVE_OFFLINE, drive->label);
    }
    auto adapter = transfer_factory(*drive);
    if (!adapter) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED, fmt::format("no transfer backend for drive {}", drive_id));
    }
    return adapter;
}


bool RollbackEngine::can_rollback(std::int64_t plan_id) const
{
    require_plan(plan_id);
    const auto steps = db.list_steps(plan_id);
    return std::none_of(steps.begin(), steps.end(), [](const MigrationStep& step) {
        return step.action == StepAction::Delete && step.status == StepStatus::Completed;
    });
}


void RollbackEngine::verify_destination(ITransferAdapter& adapter, const MigrationStep& step) const
{
    if (!adapter.exists(step.dest_path)) {
        THROW_ENGINE_ERROR_MSG(Code::DESTINATION_MISMATCH,
                               fmt::format("destination {} no longer exists", step.dest_path),
                               step.dest_path);
    }
    const auto current = adapter.compute_hash(step.dest_path, ContentHasher::algorithm_for_digest(step.pre_hash));
    if (!ContentHasher::digests_equal(current, step.pre_hash)) {
        THROW_ENGINE_ERROR_MSG(Code::DESTINATION_MISMATCH,
                               fmt::format("destination {} was modified after migration", step.dest_path),
                               step.dest_path);
    }
}


void RollbackEngine::reverse_copy(const MigrationStep& step)
{
    auto dest = adapter_for(*step.dest_drive_id);
    verify_destination(*dest, step);
    dest->remove(step.dest_path);
    db.clear_file_migration(step.file_id, FileStatus::Indexed);
}


void RollbackEngine::reverse_move(const MigrationStep& step, const RollbackOptions& options)
{
    auto dest = adapter_for(*step.dest_drive_id);
    verify_destination(*dest, step);

    auto source = adapter_for(step.source_drive_id);
    const auto algorithm = ContentHasher::algorithm_for_digest(step.pre_hash);
    if (source->exists(step.source_path)) {
        // An interrupted move may have left the original behind
        if (!ContentHasher::digests_equal(source->compute_hash(step.source_path, algorithm), step.pre_hash)) {
            THROW_ENGINE_ERROR_MSG(Code::DESTINATION_EXISTS,
                                   fmt::format("{} is occupied by different content", step.source_path),
                                   step.source_path);
        }
    } else {
        source->prepare_destination(step.source_path);
        TransferOptions transfer;
        transfer.timeout = options.transfer_timeout;
        const auto result = dest->restore(step.dest_path, step.source_path, transfer);
        if (!result.completed()) {
            THROW_ENGINE_ERROR_MSG(Code::TRANSFER_FAILED,
                                   fmt::format("restoring {} failed: {}", step.source_path, result.message),
                                   step.source_path);
        }
        const auto restored = source->compute_hash(step.source_path, algorithm);
        if (!ContentHasher::digests_equal(restored, step.pre_hash)) {
            try {
                source->remove(step.source_path);
            } catch (const ErrorCodes::EngineException& ex) {
                if (core_logger) {
                    core_logger->error("Could not remove unverified restore {}: {}", step.source_path, ex.what());
                }
            }
            THROW_ENGINE_ERROR_MSG(Code::DESTINATION_MISMATCH,
                                   fmt::format("restored {} does not verify", step.source_path),
                                   step.source_path);
        }
    }

    dest->remove(step.dest_path);
    db.clear_file_migration(step.file_id, FileStatus::Indexed);
}


void RollbackEngine::reverse_link(const MigrationStep& step)
{
    auto dest = adapter_for(*step.dest_drive_id);
    if (!dest->exists(step.dest_path)) {
        THROW_ENGINE_ERROR_MSG(Code::DESTINATION_MISMATCH,
                               fmt::format("link {} no longer exists", step.dest_path),
                               step.dest_path);
    }
    if (step.action == StepAction::Symlink) {
        std::error_code ec;
        const auto target = fs::read_symlink(Utils::utf8_to_path(step.dest_path), ec);
        if (ec || target != Utils::utf8_to_path(step.source_path)) {
            THROW_ENGINE_ERROR_MSG(Code::DESTINATION_MISMATCH,
                                   fmt::format("{} no longer links to {}", step.dest_path, step.source_path),
                                   step.dest_path);
        }
    } else {
        verify_destination(*dest, step);
    }
    dest->remove(step.dest_path);
    db.clear_file_migration(step.file_id, FileStatus::Indexed);
}


bool RollbackEngine::reverse(MigrationStep& step, const RollbackOptions& options, RollbackReport& report)
{
    RollbackStepResult result = make_result(step);
    Json::Value details(Json::objectValue);
    details["reason"] = options.reason;

    try {
        switch (step.action) {
            case StepAction::Delete:
                THROW_ENGINE_ERROR_MSG(Code::IRREVERSIBLE,
                                       fmt::format("deleted {} cannot be restored by rollback", step.source_path),
                                       step.source_path);
            case StepAction::Copy:
                reverse_copy(step);
                break;
            case StepAction::Move:
                reverse_move(step, options);
                break;
            case StepAction::Hardlink:
            case StepAction::Symlink:
                reverse_link(step);
                break;
        }
    } catch (const ErrorCodes::EngineException& ex) {
        if (ex.fatal()) {
            throw;
        }
        result.error_code = ex.get_error_code();
        result.error = ex.what();
        report.steps.push_back(result);
        report.success = false;
        report.failed_step_id = step.id;
        report.error_code = ex.get_error_code();
        report.message = ex.what();

        details["error_code"] = ex.get_error_code_int();
        details["error"] = ex.what();
        audit.record_step("step_rollback_failed", step, options.agent_mode, details);
        if (core_logger) {
            core_logger->error("Rollback of step {} ({} {}) failed: {}", step.id, to_string(step.action),
                               step.source_path, ex.what());
        }
        return false;
    }

    step.status = StepStatus::RolledBack;
    step.executed_at = Utils::current_timestamp_iso();
    db.update_step(step);
    result.status = step.status;
    report.steps.push_back(result);
    report.rolled_back_steps += 1;
    report.rolled_back_bytes += step.size_bytes;

    audit.record_step("step_rolled_back", step, options.agent_mode, details);
    if (core_logger) {
        core_logger->info("Step {} rolled back ({} {})", step.id, to_string(step.action), step.source_path);
    }
    return true;
}


void RollbackEngine::record_refusal(const RollbackReport& report, const RollbackOptions& options)
{
    Json::Value details(Json::objectValue);
    details["reason"] = options.reason;
    details["error_code"] = static_cast<int>(report.error_code);
    details["error"] = report.message;
    if (report.requested_step) {
        details["step_id"] = Json::Int64(*report.requested_step);
    }
    audit.record("rollback_refused", options.agent_mode, details, report.plan_id);
    if (core_logger) {
        core_logger->warn("Rollback of plan {} refused: {}", report.plan_id, report.message);
    }
}


RollbackReport RollbackEngine::rollback_plan(std::int64_t plan_id, const RollbackOptions& options)
{
    const auto plan = require_plan(plan_id);
    RunLease lease(db, plan_id, Utils::make_run_token(), options.stale_run_after.count());

    RollbackReport report;
    report.plan_id = plan_id;

    if (!can_rollback(plan_id)) {
        report.error_code = Code::IRREVERSIBLE;
        report.message = fmt::format("plan {} deleted files; its steps cannot be reversed", plan_id);
        record_refusal(report, options);
        return report;
    }

    auto steps = db.list_steps(plan_id);
    std::vector<MigrationStep> targets;
    std::copy_if(steps.begin(), steps.end(), std::back_inserter(targets), [](const MigrationStep& step) {
        return step.status == StepStatus::Completed;
    });
    std::sort(targets.begin(), targets.end(), [](const MigrationStep& a, const MigrationStep& b) {
        return a.step_order > b.step_order;
    });

    Json::Value start(Json::objectValue);
    start["reason"] = options.reason;
    start["steps"] = Json::UInt64(targets.size());
    start["plan_status"] = to_string(plan.status);
    audit.record("rollback_started", options.agent_mode, start, plan_id);

    report.success = true;
    for (auto& step : targets) {
        if (!reverse(step, options, report)) {
            break;
        }
        lease.refresh();
    }

    std::int64_t files = 0;
    std::int64_t bytes = 0;
    for (const auto& step : db.list_steps(plan_id)) {
        if (step.status == StepStatus::Completed) {
            ++files;
            bytes += step.size_bytes;
        }
    }
    db.update_plan_progress(plan_id, files, bytes);

    Json::Value done(Json::objectValue);
    done["reason"] = options.reason;
    done["rolled_back_steps"] = Json::Int64(report.rolled_back_steps);
    done["success"] = report.success;
    if (report.failed_step_id) {
        done["failed_step_id"] = Json::Int64(*report.failed_step_id);
    }
    audit.record("rollback_completed", options.agent_mode, done, plan_id);
    if (core_logger) {
        core_logger->info("Rollback of plan {}: {} step(s) reversed{}", plan_id, report.rolled_back_steps,
                          report.success ? "" : ", stopped at a failure");
    }
    return report;
}


RollbackReport RollbackEngine::rollback_step(std::int64_t plan_id,
                                             std::int64_t step_id,
                                             const RollbackOptions& options)
{
    const auto plan = require_plan(plan_id);
    auto step = db.get_step(step_id);
    if (!step || step->plan_id != plan_id) {
        THROW_ENGINE_ERROR(Code::STEP_NOT_FOUND, fmt::format("step {} of plan {}", step_id, plan_id));
    }
    if (step->status != StepStatus::Completed) {
        THROW_ENGINE_ERROR_MSG(Code::INVALID_STATUS_TRANSITION,
                               fmt::format("step {} is {}, only completed steps can be rolled back",
                                           step_id, to_string(step->status)),
                               fmt::format("plan {}", plan.id));
    }
    RunLease lease(db, plan_id, Utils::make_run_token(), options.stale_run_after.count());

    RollbackReport report;
    report.plan_id = plan_id;
    report.requested_step = step_id;
    report.success = reverse(*step, options, report);

    if (report.success) {
        auto refreshed = db.get_plan(plan_id);
        if (refreshed) {
            db.update_plan_progress(plan_id,
                                    std::max<std::int64_t>(0, refreshed->completed_files - 1),
                                    std::max<std::int64_t>(0, refreshed->completed_bytes - step->size_bytes));
        }
    } else if (report.error_code == Code::IRREVERSIBLE) {
        record_refusal(report, options);
    }
    return report;
}
