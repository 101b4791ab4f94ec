#include "MigrationExecutor.hpp"
#include "AuditLog.hpp"
#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"
#include "RunLease.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <map>
#include <set>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

std::string local_path_of(const FileRecord& file, const DriveRecord& drive)
{
    if (drive.backend == BackendKind::Rclone) {
        return file.path;
    }
    if (!file.abs_path.empty()) {
        return file.abs_path;
    }
    fs::path rel = Utils::utf8_to_path(file.path);
    if (rel.is_absolute()) {
        rel = rel.relative_path();
    }
    return Utils::path_to_utf8(Utils::utf8_to_path(drive.mount_path) / rel);
}

bool occupies_space(StepAction action)
{
    return is_transfer_action(action);
}

StepReport make_report(const MigrationStep& step)
{
    StepReport report;
    report.step_id = step.id;
    report.step_order = step.step_order;
    report.file_id = step.file_id;
    report.action = step.action;
    report.status = step.status;
    report.source_path = step.source_path;
    report.dest_path = step.dest_path;
    report.bytes = step.size_bytes;
    report.attempts = step.attempts;
    report.error_code = ErrorCodes::code_from_int(step.error_code);
    report.error = step.error;
    return report;
}

bool eligible_for_run(const MigrationStep& step)
{
    if (step.status == StepStatus::Pending) {
        return true;
    }
    return step.status == StepStatus::Failed &&
           ErrorCodes::is_retryable(ErrorCodes::code_from_int(step.error_code));
}

}


const char* to_string(RunOutcome outcome)
{
    switch (outcome) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::Partial: return "partial";
        case RunOutcome::Paused: return "paused";
        case RunOutcome::DriveOffline: return "drive_offline";
        case RunOutcome::Stopped: return "stopped";
        case RunOutcome::NeedsDecision: return "needs_decision";
        case RunOutcome::Declined: return "declined";
        case RunOutcome::Cancelled: return "cancelled";
        case RunOutcome::Halted: return "halted";
        case RunOutcome::DryRun: return "dry_run";
    }
    return "unknown";
}


const char* to_string(ExecutionMode mode)
{
    return mode == ExecutionMode::DryRun ? "dry_run" : "execute";
}


struct MigrationExecutor::RunContext {
    MigrationPlan plan;
    const ExecuteOptions& options;
    ExecutionReport& report;
    RunLease& lease;
    TransferOptions transfer;
    int max_attempts{1};
    bool finished{false};

    RunContext(MigrationPlan plan_in,
               const ExecuteOptions& options_in,
               ExecutionReport& report_in,
               RunLease& lease_in)
        : plan(std::move(plan_in)), options(options_in), report(report_in), lease(lease_in) {}

    bool stop_requested() const
    {
        return options.stop_flag != nullptr && options.stop_flag->load();
    }
};


MigrationExecutor::MigrationExecutor(DatabaseManager& db,
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


DriveRecord MigrationExecutor::drive_for(std::int64_t drive_id) const
{
    auto drive = db.get_drive(drive_id);
    if (!drive) {
        THROW_ENGINE_ERROR(Code::DRIVE_NOT_FOUND, fmt::format("drive {}", drive_id));
    }
    return *drive;
}


std::unique_ptr<ITransferAdapter> MigrationExecutor::adapter_for(RunContext& ctx, const DriveRecord& drive) const
{
    auto adapter = transfer_factory(drive);
    if (!adapter) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED, fmt::format("no transfer backend for drive {}", drive.id));
    }
    adapter->set_heartbeat([&lease = ctx.lease] { lease.keep_alive(); });
    return adapter;
}


std::unique_ptr<ITransferAdapter> MigrationExecutor::adapter_for(RunContext& ctx, std::int64_t drive_id) const
{
    return adapter_for(ctx, drive_for(drive_id));
}


TransferOptions MigrationExecutor::transfer_options(const ExecuteOptions& options) const
{
    TransferOptions transfer;
    transfer.checksum = true;
    transfer.partial = true;
    transfer.sparse = true;
    transfer.preserve_attributes = true;
    transfer.timeout = options.transfer_timeout;
    transfer.io_limit_kibps = options.io_limit_kibps;
    return transfer;
}


std::vector<MigrationStep> MigrationExecutor::collect_work(std::int64_t plan_id) const
{
    std::vector<MigrationStep> work;
    for (auto& step : db.list_steps(plan_id)) {
        if (eligible_for_run(step)) {
            work.push_back(std::move(step));
        }
    }
    return work;
}


std::vector<std::vector<MigrationStep>> MigrationExecutor::make_batches(const std::vector<MigrationStep>& work,
                                                                        const MigrationPlan& plan,
                                                                        std::size_t batch_size) const
{
    const std::size_t step_cap = std::max<std::size_t>(1, batch_size);
    const std::uint64_t byte_cap = plan.max_batch_size_bytes && *plan.max_batch_size_bytes > 0
        ? static_cast<std::uint64_t>(*plan.max_batch_size_bytes)
        : std::numeric_limits<std::uint64_t>::max();

    std::vector<std::vector<MigrationStep>> batches;
    std::size_t index = 0;
    while (index < work.size()) {
        std::vector<std::uint64_t> sizes;
        const std::size_t window = std::min(step_cap, work.size() - index);
        for (std::size_t i = 0; i < window; ++i) {
            const auto& step = work[index + i];
            sizes.push_back(occupies_space(step.action) ? static_cast<std::uint64_t>(step.size_bytes) : 0);
        }
        const std::size_t take = SpaceGuard::partition_batch(sizes, byte_cap);
        batches.emplace_back(work.begin() + static_cast<std::ptrdiff_t>(index),
                             work.begin() + static_cast<std::ptrdiff_t>(index + take));
        index += take;
    }
    return batches;
}


bool MigrationExecutor::drives_online(const std::vector<MigrationStep>& batch, std::string& offline_label) const
{
    std::set<std::int64_t> drive_ids;
    for (const auto& step : batch) {
        drive_ids.insert(step.source_drive_id);
        if (step.dest_drive_id) {
            drive_ids.insert(*step.dest_drive_id);
        }
    }
    for (const auto drive_id : drive_ids) {
        auto drive = db.get_drive(drive_id);
        if (!drive) {
            offline_label = fmt::format("#{}", drive_id);
            return false;
        }
        bool online = drive->is_online;
        if (online && drive->backend == BackendKind::Local && !drive->mount_path.empty()) {
            std::error_code ec;
            online = fs::is_directory(Utils::utf8_to_path(drive->mount_path), ec);
        }
        if (!online) {
            offline_label = drive->label;
            return false;
        }
    }
    return true;
}


std::vector<BatchAdmission> MigrationExecutor::admit(const std::vector<MigrationStep>& batch) const
{
    std::map<std::int64_t, std::uint64_t> bytes_per_drive;
    for (const auto& step : batch) {
        if (step.dest_drive_id && occupies_space(step.action)) {
            bytes_per_drive[*step.dest_drive_id] += static_cast<std::uint64_t>(step.size_bytes);
        }
    }

    std::vector<BatchAdmission> admissions;
    for (const auto& [drive_id, bytes] : bytes_per_drive) {
        admissions.push_back(space_guard.admit_batch(drive_for(drive_id), bytes));
    }
    return admissions;
}


ExecutionReport MigrationExecutor::execute_plan(std::int64_t plan_id, const ExecuteOptions& options)
{
    auto plan = db.get_plan(plan_id);
    if (!plan) {
        THROW_ENGINE_ERROR(Code::PLAN_NOT_FOUND, fmt::format("plan {}", plan_id));
    }
    if (options.mode == ExecutionMode::DryRun) {
        return dry_run(*plan, options);
    }
    if (plan->status == PlanStatus::Draft) {
        THROW_ENGINE_ERROR(Code::PLAN_NOT_APPROVED, fmt::format("plan {} is still a draft", plan_id));
    }
    if (plan->status == PlanStatus::Aborted) {
        THROW_ENGINE_ERROR(Code::INVALID_STATUS_TRANSITION, fmt::format("plan {} was aborted", plan_id));
    }

    ExecutionReport report;
    report.plan_id = plan_id;
    report.mode = ExecutionMode::Execute;
    report.plan_status = plan->status;
    report.total_bytes = plan->total_bytes;
    if (plan->status == PlanStatus::Completed) {
        report.outcome = RunOutcome::Completed;
        report.completed_steps = plan->total_files;
        report.completed_bytes = plan->completed_bytes;
        report.message = "plan already completed";
        return report;
    }

    const std::string token = Utils::make_run_token();
    RunLease lease(db, plan_id, token, options.stale_run_after.count());

    RunContext ctx(*plan, options, report, lease);
    ctx.transfer = transfer_options(options);
    ctx.max_attempts = 1 + std::max(0, options.failure_policy.retries.value_or(options.retry_count));

    try {
        run_batches(ctx);
    } catch (const ErrorCodes::EngineException& ex) {
        if (!ex.fatal()) {
            throw;
        }
        report.outcome = RunOutcome::Halted;
        report.message = ex.what();
        if (core_logger) {
            core_logger->critical("Run {} of plan {} halted: {}", token, plan_id, ex.what());
        }
        return report;
    }

    // Final counts come from the store, not from the run's own bookkeeping
    for (const auto& step : db.list_steps(plan_id)) {
        if (step.status == StepStatus::Completed) {
            ++report.completed_steps;
            report.completed_bytes += step.size_bytes;
        } else if (step.status == StepStatus::Failed) {
            ++report.failed_steps;
        } else if (step.status == StepStatus::Pending) {
            ++report.pending_steps;
        }
    }
    if (auto refreshed = db.get_plan(plan_id)) {
        report.plan_status = refreshed->status;
    }
    if (core_logger) {
        core_logger->info("Run {} of plan {} finished: {} ({} completed, {} failed, {} pending)",
                          token, plan_id, to_string(report.outcome), report.completed_steps,
                          report.failed_steps, report.pending_steps);
    }
    return report;
}


void MigrationExecutor::run_batches(RunContext& ctx)
{
    auto& report = ctx.report;
    const auto plan_id = ctx.plan.id;

    const int orphaned = db.reset_orphaned_steps(plan_id);
    if (orphaned > 0) {
        Json::Value details(Json::objectValue);
        details["reset_steps"] = orphaned;
        audit.record("orphaned_steps_reset", ctx.options.agent_mode, details, plan_id);
    }
    finalize_interrupted_moves(ctx);

    Json::Value start(Json::objectValue);
    start["run"] = ctx.lease.id();
    start["batch_size"] = Json::UInt64(ctx.options.batch_size);
    start["failure_policy"] = to_string(ctx.options.failure_policy.mode);
    start["max_attempts"] = ctx.max_attempts;
    if (ctx.plan.status == PlanStatus::Approved) {
        if (!db.transition_plan_status(plan_id, PlanStatus::Approved, PlanStatus::InProgress)) {
            THROW_ENGINE_ERROR(Code::INVALID_STATUS_TRANSITION,
                               fmt::format("plan {} left the approved state", plan_id));
        }
        ctx.plan.status = PlanStatus::InProgress;
        audit.record("plan_execution_started", ctx.options.agent_mode, start, plan_id);
    } else {
        audit.record("plan_execution_resumed", ctx.options.agent_mode, start, plan_id);
    }
    report.plan_status = ctx.plan.status;

    refresh_plan_totals(ctx);
    const auto work = collect_work(plan_id);
    const auto batches = make_batches(work, ctx.plan, ctx.options.batch_size);
    report.outcome = RunOutcome::Completed;

    for (std::size_t index = 0; index < batches.size() && !ctx.finished; ++index) {
        const auto& batch = batches[index];
        BatchReport batch_report;
        batch_report.index = index;
        for (const auto& step : batch) {
            batch_report.step_ids.push_back(step.id);
            if (occupies_space(step.action)) {
                batch_report.bytes += static_cast<std::uint64_t>(step.size_bytes);
            }
        }

        if (ctx.stop_requested()) {
            report.outcome = RunOutcome::Cancelled;
            audit.record("run_cancelled", ctx.options.agent_mode, Json::Value(Json::objectValue), plan_id);
            report.batches.push_back(std::move(batch_report));
            break;
        }

        std::string offline_label;
        if (!drives_online(batch, offline_label)) {
            report.outcome = RunOutcome::DriveOffline;
            report.message = fmt::format("drive '{}' is offline", offline_label);
            Json::Value details(Json::objectValue);
            details["batch"] = Json::UInt64(index);
            details["drive"] = offline_label;
            audit.record("batch_blocked_drive_offline", ctx.options.agent_mode, details, plan_id);
            if (core_logger) {
                core_logger->warn("Plan {} batch {} blocked: drive '{}' offline", plan_id, index, offline_label);
            }
            report.batches.push_back(std::move(batch_report));
            break;
        }

        batch_report.admissions = admit(batch);
        batch_report.admitted = std::all_of(batch_report.admissions.begin(), batch_report.admissions.end(),
                                            [](const BatchAdmission& a) { return a.admitted; });
        if (!batch_report.admitted) {
            report.outcome = RunOutcome::Paused;
            Json::Value details(Json::objectValue);
            details["batch"] = Json::UInt64(index);
            details["batch_bytes"] = Json::UInt64(batch_report.bytes);
            for (const auto& admission : batch_report.admissions) {
                if (!admission.admitted) {
                    details["drive_id"] = Json::Int64(admission.drive_id);
                    details["free_bytes"] = Json::UInt64(admission.free_bytes);
                    details["max_safe_bytes"] = Json::UInt64(admission.max_safe_bytes);
                    report.message = fmt::format("batch of {} exceeds half of the {} free on drive {}",
                                                 Utils::format_bytes(admission.batch_bytes),
                                                 Utils::format_bytes(admission.free_bytes),
                                                 admission.drive_id);
                    break;
                }
            }
            audit.record("plan_paused_insufficient_space", ctx.options.agent_mode, details, plan_id);
            report.batches.push_back(std::move(batch_report));
            break;
        }

        if (ctx.options.confirm_batch) {
            BatchProposal proposal;
            proposal.plan_id = plan_id;
            proposal.batch_index = index;
            proposal.steps = batch;
            proposal.bytes = batch_report.bytes;
            proposal.admissions = batch_report.admissions;
            if (!ctx.options.confirm_batch(proposal)) {
                report.outcome = RunOutcome::Declined;
                Json::Value details(Json::objectValue);
                details["batch"] = Json::UInt64(index);
                audit.record("batch_declined", AgentMode::HumanApproved, details, plan_id);
                report.batches.push_back(std::move(batch_report));
                break;
            }
        }
        report.batches.push_back(std::move(batch_report));

        for (auto step : batch) {
            if (ctx.stop_requested()) {
                report.outcome = RunOutcome::Cancelled;
                audit.record("run_cancelled", ctx.options.agent_mode, Json::Value(Json::objectValue), plan_id);
                ctx.finished = true;
                break;
            }

            StepReport step_report = run_step(ctx, step);
            ctx.lease.refresh();

            if (ctx.options.on_progress) {
                ProgressEvent event;
                event.plan_id = plan_id;
                event.step_id = step.id;
                event.step_order = step.step_order;
                event.action = step.action;
                event.status = step.status;
                event.bytes = step.size_bytes;
                event.completed_files = ctx.plan.completed_files;
                event.total_files = ctx.plan.total_files;
                event.completed_bytes = ctx.plan.completed_bytes;
                event.total_bytes = ctx.plan.total_bytes;
                event.error_code = step_report.error_code;
                ctx.options.on_progress(event);
            }

            const bool failed = step.status == StepStatus::Failed;
            report.steps.push_back(std::move(step_report));
            if (!failed) {
                continue;
            }

            switch (ctx.options.failure_policy.mode) {
                case FailureMode::SkipOnFailure:
                    report.outcome = RunOutcome::Partial;
                    break;
                case FailureMode::AbortOnFailure:
                    report.outcome = RunOutcome::Stopped;
                    report.failed_step_id = step.id;
                    report.message = step.error;
                    ctx.finished = true;
                    break;
                case FailureMode::RetryThenPrompt:
                    report.outcome = RunOutcome::NeedsDecision;
                    report.failed_step_id = step.id;
                    report.message = step.error;
                    ctx.finished = true;
                    break;
            }
            if (ctx.finished) {
                break;
            }
        }
    }

    const auto steps = db.list_steps(plan_id);
    const bool all_completed = std::all_of(steps.begin(), steps.end(), [](const MigrationStep& s) {
        return s.status == StepStatus::Completed;
    });
    // A moved file whose source is still in place keeps the plan resumable
    const std::size_t awaiting_removal = sources_awaiting_removal(steps);
    if (all_completed && awaiting_removal == 0 &&
        db.transition_plan_status(plan_id, PlanStatus::InProgress, PlanStatus::Completed)) {
        ctx.plan.status = PlanStatus::Completed;
        report.outcome = RunOutcome::Completed;
        Json::Value details(Json::objectValue);
        details["completed_files"] = Json::Int64(ctx.plan.completed_files);
        details["completed_bytes"] = Json::Int64(ctx.plan.completed_bytes);
        audit.record("plan_execution_completed", ctx.options.agent_mode, details, plan_id);
        if (core_logger) {
            core_logger->info("Plan {} completed ({} files, {})", plan_id, ctx.plan.completed_files,
                              Utils::format_bytes(static_cast<std::uint64_t>(ctx.plan.completed_bytes)));
        }
    } else if (report.outcome == RunOutcome::Completed) {
        // Work ran out with Failed or rolled-back steps left behind
        report.outcome = RunOutcome::Partial;
        if (awaiting_removal > 0) {
            report.message = fmt::format("{} moved source(s) still present; run the plan again to remove them",
                                         awaiting_removal);
        }
    }
}


std::size_t MigrationExecutor::sources_awaiting_removal(const std::vector<MigrationStep>& steps) const
{
    std::size_t count = 0;
    for (const auto& step : steps) {
        if (step.action != StepAction::Move || step.status != StepStatus::Completed) {
            continue;
        }
        auto file = db.get_file(step.file_id);
        if (file && file->status != FileStatus::SourceRemoved) {
            ++count;
        }
    }
    return count;
}


void MigrationExecutor::refresh_plan_totals(RunContext& ctx)
{
    std::int64_t files = 0;
    std::int64_t bytes = 0;
    for (const auto& step : db.list_steps(ctx.plan.id)) {
        if (step.status == StepStatus::Completed) {
            ++files;
            bytes += step.size_bytes;
        }
    }
    ctx.plan.completed_files = files;
    ctx.plan.completed_bytes = bytes;
    db.update_plan_progress(ctx.plan.id, files, bytes);
}


StepReport MigrationExecutor::run_step(RunContext& ctx, MigrationStep& step)
{
    for (int attempt = 1; attempt <= ctx.max_attempts; ++attempt) {
        if (attempt_step(ctx, step)) {
            break;
        }
        const auto code = ErrorCodes::code_from_int(step.error_code);
        if (!ErrorCodes::is_retryable(code) || attempt == ctx.max_attempts) {
            break;
        }
        if (core_logger) {
            core_logger->warn("Step {} of plan {} failed ({}), retry {}/{}", step.id, step.plan_id,
                              ErrorCodes::ErrorCatalog::code_name(code), attempt, ctx.max_attempts - 1);
        }
    }
    // Retryable failures keep their partial file for the next run to resume
    if (step.status == StepStatus::Failed &&
        !ErrorCodes::is_retryable(ErrorCodes::code_from_int(step.error_code))) {
        discard_partial_transfer(ctx, step);
    }
    return make_report(step);
}


void MigrationExecutor::discard_partial_transfer(RunContext& ctx, const MigrationStep& step) const
{
    if (!is_transfer_action(step.action) || !step.dest_drive_id || step.dest_path.empty()) {
        return;
    }
    try {
        adapter_for(ctx, *step.dest_drive_id)->discard_partial(step.dest_path);
    } catch (const ErrorCodes::EngineException& ex) {
        if (ex.fatal()) {
            throw;
        }
        if (core_logger) {
            core_logger->warn("Step {}: cannot discard partial transfer of {}: {}", step.id, step.dest_path,
                              ex.what());
        }
    }
}


bool MigrationExecutor::attempt_step(RunContext& ctx, MigrationStep& step)
{
    step.status = StepStatus::InProgress;
    step.attempts += 1;
    step.error.clear();
    step.error_code = 0;
    step.post_hash.clear();
    db.update_step(step);
    if (step.action != StepAction::Delete) {
        db.update_file_status(step.file_id, FileStatus::Migrating);
    }

    try {
        switch (step.action) {
            case StepAction::Move:
            case StepAction::Copy:
                perform_transfer(ctx, step);
                break;
            case StepAction::Hardlink:
            case StepAction::Symlink:
                perform_link(ctx, step);
                break;
            case StepAction::Delete:
                perform_delete(ctx, step);
                break;
        }
    } catch (const ErrorCodes::EngineException& ex) {
        if (ex.fatal()) {
            throw;
        }
        step.status = StepStatus::Failed;
        step.error = ex.what();
        step.error_code = ex.get_error_code_int();
        step.executed_at = Utils::current_timestamp_iso();
        db.update_step(step);
        if (step.action != StepAction::Delete) {
            db.update_file_status(step.file_id, FileStatus::Planned);
        }
        audit.record_step("step_failed", step, ctx.options.agent_mode);
        if (core_logger) {
            core_logger->error("Step {} ({} {}) failed: {}", step.id, to_string(step.action),
                               step.source_path, ex.what());
        }
        return false;
    }

    commit_step(ctx, step);
    if (step.action == StepAction::Move) {
        remove_moved_source(ctx, step);
    }
    return true;
}


void MigrationExecutor::verify_source(ITransferAdapter& adapter, const MigrationStep& step) const
{
    if (!adapter.exists(step.source_path)) {
        THROW_ENGINE_ERROR(Code::SOURCE_MISSING, step.source_path);
    }
    if (step.pre_hash.empty()) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN, fmt::format("step {} has no pre-hash", step.id));
    }
    const auto algorithm = ContentHasher::algorithm_for_digest(step.pre_hash);
    const auto current = adapter.compute_hash(step.source_path, algorithm);
    if (!ContentHasher::digests_equal(current, step.pre_hash)) {
        THROW_ENGINE_ERROR_MSG(Code::SOURCE_CHANGED,
                               fmt::format("source {} changed since planning (expected {}, found {})",
                                           step.source_path, step.pre_hash, current),
                               step.source_path);
    }
}


bool MigrationExecutor::claim_existing_destination(ITransferAdapter& adapter, const MigrationStep& step) const
{
    if (!adapter.exists(step.dest_path)) {
        return false;
    }
    // Only a retry may take over a destination, and only one that already verifies
    if (step.attempts > 1) {
        const auto algorithm = ContentHasher::algorithm_for_digest(step.pre_hash);
        if (ContentHasher::digests_equal(adapter.compute_hash(step.dest_path, algorithm), step.pre_hash)) {
            if (core_logger) {
                core_logger->info("Step {} adopts verified destination {} from an earlier attempt",
                                  step.id, step.dest_path);
            }
            return true;
        }
    }
    THROW_ENGINE_ERROR(Code::DESTINATION_EXISTS, step.dest_path);
}


void MigrationExecutor::perform_transfer(RunContext& ctx, MigrationStep& step)
{
    if (!step.dest_drive_id) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN, fmt::format("step {} has no destination drive", step.id));
    }
    auto source = adapter_for(ctx, step.source_drive_id);
    verify_source(*source, step);

    const DriveRecord dest_drive = drive_for(*step.dest_drive_id);
    if (space_guard.exceeds_capacity(dest_drive, static_cast<std::uint64_t>(step.size_bytes))) {
        THROW_ENGINE_ERROR_MSG(Code::INSUFFICIENT_SPACE,
                               fmt::format("{} cannot fit on drive '{}'",
                                           Utils::format_bytes(static_cast<std::uint64_t>(step.size_bytes)),
                                           dest_drive.label),
                               step.dest_path);
    }

    auto dest = adapter_for(ctx, dest_drive);
    const bool adopted = claim_existing_destination(*dest, step);
    if (!adopted) {
        dest->prepare_destination(step.dest_path);
        const auto result = dest->transfer(step.source_path, step.dest_path, ctx.transfer);
        if (!result.completed()) {
            THROW_ENGINE_ERROR_MSG(Code::TRANSFER_FAILED,
                                   result.timed_out
                                       ? fmt::format("transfer of {} timed out", step.source_path)
                                       : fmt::format("transfer of {} failed: {}", step.source_path, result.message),
                                   step.dest_path);
        }
    }

    step.post_hash = verify_destination(*dest, step);
}


std::string MigrationExecutor::verify_destination(ITransferAdapter& dest, const MigrationStep& step) const
{
    std::string written;
    try {
        written = dest.compute_hash(step.dest_path, ContentHasher::algorithm_for_digest(step.pre_hash));
    } catch (const ErrorCodes::EngineException& ex) {
        // An artifact that cannot be read back is as unverified as a mismatching one
        if (!ex.fatal()) {
            discard_destination(dest, step);
        }
        throw;
    }
    if (!ContentHasher::digests_equal(written, step.pre_hash)) {
        discard_destination(dest, step);
        THROW_ENGINE_ERROR_MSG(Code::DESTINATION_MISMATCH,
                               fmt::format("destination {} does not match the source (expected {}, found {})",
                                           step.dest_path, step.pre_hash, written),
                               step.dest_path);
    }
    return written;
}


void MigrationExecutor::discard_destination(ITransferAdapter& dest, const MigrationStep& step) const
{
    try {
        dest.remove(step.dest_path);
    } catch (const ErrorCodes::EngineException& ex) {
        if (ex.fatal()) {
            throw;
        }
        if (core_logger) {
            core_logger->error("Could not remove unverified destination {}: {}", step.dest_path, ex.what());
        }
    }
}


void MigrationExecutor::perform_link(RunContext& ctx, MigrationStep& step)
{
    if (!step.dest_drive_id) {
        THROW_ENGINE_ERROR(Code::INVALID_PLAN, fmt::format("step {} has no destination drive", step.id));
    }
    auto source = adapter_for(ctx, step.source_drive_id);
    verify_source(*source, step);

    auto dest = adapter_for(ctx, *step.dest_drive_id);
    if (!claim_existing_destination(*dest, step)) {
        dest->prepare_destination(step.dest_path);
        const auto result = dest->link(step.source_path, step.dest_path, step.action == StepAction::Symlink);
        if (!result.completed()) {
            THROW_ENGINE_ERROR_MSG(Code::TRANSFER_FAILED,
                                   fmt::format("cannot create {} {}: {}", to_string(step.action),
                                               step.dest_path, result.message),
                                   step.dest_path);
        }
    }

    step.post_hash = verify_destination(*dest, step);
}


void MigrationExecutor::verify_survivor(RunContext& ctx, const MigrationStep& step) const
{
    auto file = db.get_file(step.file_id);
    if (!file || !file->duplicate_group) {
        THROW_ENGINE_ERROR(Code::SURVIVOR_UNVERIFIED,
                           fmt::format("file {} has no duplicate group", step.file_id));
    }

    for (const auto& member : db.list_duplicate_group(*file->duplicate_group)) {
        if (member.id == file->id || !member.is_original || member.status == FileStatus::SourceRemoved) {
            continue;
        }
        if (!ContentHasher::digests_equal(member.hash, step.pre_hash)) {
            continue;
        }
        auto drive = db.get_drive(member.drive_id);
        if (!drive || !drive->is_online) {
            continue;
        }
        auto adapter = transfer_factory(*drive);
        if (!adapter) {
            continue;
        }
        adapter->set_heartbeat([&lease = ctx.lease] { lease.keep_alive(); });
        const std::string path = local_path_of(member, *drive);
        try {
            if (adapter->exists(path) &&
                ContentHasher::digests_equal(
                    adapter->compute_hash(path, ContentHasher::algorithm_for_digest(step.pre_hash)),
                    step.pre_hash)) {
                if (core_logger) {
                    core_logger->debug("Step {}: survivor {} verified at {}", step.id, member.id, path);
                }
                return;
            }
        } catch (const ErrorCodes::EngineException& ex) {
            if (ex.fatal()) {
                throw;
            }
            if (core_logger) {
                core_logger->warn("Step {}: survivor candidate {} unreadable: {}", step.id, path, ex.what());
            }
        }
    }
    THROW_ENGINE_ERROR(Code::SURVIVOR_UNVERIFIED,
                       fmt::format("no verified original of file {} remains", step.file_id));
}


void MigrationExecutor::perform_delete(RunContext& ctx, MigrationStep& step)
{
    // Deletion is gated on the stored status, not the status seen at run start
    auto plan = db.get_plan(ctx.plan.id);
    if (!plan || (plan->status != PlanStatus::Approved && plan->status != PlanStatus::InProgress)) {
        THROW_ENGINE_ERROR(Code::PLAN_NOT_APPROVED,
                           fmt::format("plan {} is not approved for deletion", ctx.plan.id));
    }
    auto source = adapter_for(ctx, step.source_drive_id);
    verify_source(*source, step);
    verify_survivor(ctx, step);
    source->remove(step.source_path);
}


void MigrationExecutor::commit_step(RunContext& ctx, MigrationStep& step)
{
    step.status = StepStatus::Completed;
    step.executed_at = Utils::current_timestamp_iso();
    step.error.clear();
    step.error_code = 0;
    db.update_step(step);

    if (step.action == StepAction::Delete) {
        db.update_file_status(step.file_id, FileStatus::SourceRemoved);
    } else {
        db.mark_file_migrated(step.file_id, step.dest_path, step.dest_drive_id, step.post_hash);
    }

    ctx.plan.completed_files += 1;
    ctx.plan.completed_bytes += step.size_bytes;
    db.update_plan_progress(ctx.plan.id, ctx.plan.completed_files, ctx.plan.completed_bytes);

    audit.record_step(fmt::format("step_completed_{}", to_string(step.action)), step, ctx.options.agent_mode);
    if (core_logger) {
        core_logger->info("Step {} completed: {} {} -> {}", step.id, to_string(step.action),
                          step.source_path, step.dest_path.empty() ? "(deleted)" : step.dest_path);
    }
}


void MigrationExecutor::remove_moved_source(RunContext& ctx, const MigrationStep& step)
{
    try {
        auto source = adapter_for(ctx, step.source_drive_id);
        source->remove(step.source_path);
    } catch (const ErrorCodes::EngineException& ex) {
        if (ex.fatal()) {
            throw;
        }
        // The copy is verified; the next run finalizes the removal
        if (core_logger) {
            core_logger->error("Step {}: verified copy kept but source {} not removed: {}",
                               step.id, step.source_path, ex.what());
        }
        Json::Value details(Json::objectValue);
        details["error"] = ex.what();
        audit.record_step("move_source_removal_failed", step, ctx.options.agent_mode, details);
        return;
    }
    db.update_file_status(step.file_id, FileStatus::SourceRemoved);
    audit.record_step("source_removed", step, ctx.options.agent_mode);
}


void MigrationExecutor::finalize_interrupted_moves(RunContext& ctx)
{
    for (const auto& step : db.list_steps(ctx.plan.id)) {
        if (step.action != StepAction::Move || step.status != StepStatus::Completed || !step.dest_drive_id) {
            continue;
        }
        try {
            auto source = adapter_for(ctx, step.source_drive_id);
            if (!source->exists(step.source_path)) {
                auto file = db.get_file(step.file_id);
                if (file && file->status != FileStatus::SourceRemoved) {
                    db.update_file_status(step.file_id, FileStatus::SourceRemoved);
                }
                continue;
            }
            auto dest = adapter_for(ctx, *step.dest_drive_id);
            const auto algorithm = ContentHasher::algorithm_for_digest(step.pre_hash);
            const bool dest_ok = dest->exists(step.dest_path) &&
                ContentHasher::digests_equal(dest->compute_hash(step.dest_path, algorithm), step.pre_hash);
            const bool source_ok =
                ContentHasher::digests_equal(source->compute_hash(step.source_path, algorithm), step.pre_hash);
            if (!dest_ok || !source_ok) {
                if (core_logger) {
                    core_logger->warn("Step {}: interrupted move left {} in place; copies no longer verify",
                                      step.id, step.source_path);
                }
                continue;
            }
            source->remove(step.source_path);
            db.update_file_status(step.file_id, FileStatus::SourceRemoved);
            audit.record_step("move_finalized", step, ctx.options.agent_mode);
        } catch (const ErrorCodes::EngineException& ex) {
            if (ex.fatal()) {
                throw;
            }
            if (core_logger) {
                core_logger->warn("Step {}: cannot finalize interrupted move: {}", step.id, ex.what());
            }
        }
    }
}


ExecutionReport MigrationExecutor::dry_run(const MigrationPlan& plan, const ExecuteOptions& options)
{
    if (is_terminal(plan.status)) {
        THROW_ENGINE_ERROR(Code::INVALID_STATUS_TRANSITION,
                           fmt::format("plan {} is {}", plan.id, to_string(plan.status)));
    }

    ExecutionReport report;
    report.plan_id = plan.id;
    report.mode = ExecutionMode::DryRun;
    report.outcome = RunOutcome::DryRun;
    report.plan_status = plan.status;
    report.total_bytes = plan.total_bytes;

    for (const auto& step : db.list_steps(plan.id)) {
        if (step.status == StepStatus::Completed) {
            ++report.completed_steps;
            report.completed_bytes += step.size_bytes;
        } else if (step.status == StepStatus::Failed) {
            ++report.failed_steps;
        } else if (step.status == StepStatus::Pending || step.status == StepStatus::InProgress) {
            ++report.pending_steps;
        }
    }

    const auto work = collect_work(plan.id);
    const auto batches = make_batches(work, plan, options.batch_size);
    for (std::size_t index = 0; index < batches.size(); ++index) {
        BatchReport batch_report;
        batch_report.index = index;
        for (const auto& step : batches[index]) {
            batch_report.step_ids.push_back(step.id);
            if (occupies_space(step.action)) {
                batch_report.bytes += static_cast<std::uint64_t>(step.size_bytes);
            }
            report.steps.push_back(make_report(step));
        }
        batch_report.admissions = admit(batches[index]);
        batch_report.admitted = std::all_of(batch_report.admissions.begin(), batch_report.admissions.end(),
                                            [](const BatchAdmission& a) { return a.admitted; });
        report.batches.push_back(std::move(batch_report));
    }

    if (core_logger) {
        core_logger->info("Dry run of plan {}: {} step(s) in {} batch(es)", plan.id, work.size(), batches.size());
    }
    return report;
}
