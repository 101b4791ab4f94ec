#include "MigrationService.hpp"
#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

TransferFactory resolve_factory(const Settings& settings, TransferFactory factory)
{
    if (factory) {
        return factory;
    }
    TransferToolConfig config;
    config.rsync_path = settings.get_rsync_path();
    config.rclone_path = settings.get_rclone_path();
    config.prefer_rsync = settings.get_prefer_rsync();
    config.hash_timeout = settings.get_transfer_timeout();
    return make_transfer_factory(config);
}

}


MigrationService::MigrationService(Settings& settings,
                                   DatabaseManager& db,
                                   TransferFactory transfer_factory)
    : settings(settings),
      db(db),
      core_logger(Logger::get_logger("core_logger")),
      transfer_factory(resolve_factory(settings, std::move(transfer_factory))),
      audit(db),
      guard(this->transfer_factory),
      planner(db, audit, guard, this->transfer_factory, core_logger),
      executor(db, audit, guard, this->transfer_factory, core_logger),
      rollback_engine(db, audit, this->transfer_factory, core_logger)
{
}


std::int64_t MigrationService::create_plan(const Selection& selection,
                                           StepAction action,
                                           const PlannerOptions& options)
{
    return planner.create_plan(selection, action, options);
}


PlanStatusReport MigrationService::approve_plan(std::int64_t plan_id, AgentMode agent_mode)
{
    planner.approve_plan(plan_id, agent_mode);
    return plan_status(plan_id);
}


PlanStatusReport MigrationService::abort_plan(std::int64_t plan_id,
                                              const std::string& reason,
                                              AgentMode agent_mode)
{
    planner.abort_plan(plan_id, reason, agent_mode);
    return plan_status(plan_id);
}


ExecuteOptions MigrationService::default_execute_options() const
{
    ExecuteOptions options;
    options.batch_size = settings.get_batch_size();
    options.io_limit_kibps = settings.get_io_limit_kibps();
    options.failure_policy.mode = settings.get_failure_mode();
    options.retry_count = settings.get_retry_count();
    options.transfer_timeout = settings.get_transfer_timeout();
    options.stale_run_after = settings.get_stale_run_after();
    return options;
}


ExecutionReport MigrationService::execute_plan(std::int64_t plan_id,
                                               ExecutionMode mode,
                                               std::optional<std::size_t> batch_size,
                                               std::optional<std::uint64_t> io_limit_kibps)
{
    auto options = default_execute_options();
    options.mode = mode;
    if (batch_size) {
        options.batch_size = *batch_size;
    }
    if (io_limit_kibps) {
        options.io_limit_kibps = *io_limit_kibps;
    }
    return executor.execute_plan(plan_id, options);
}


ExecutionReport MigrationService::execute_plan(std::int64_t plan_id, const ExecuteOptions& options)
{
    return executor.execute_plan(plan_id, options);
}


RollbackReport MigrationService::rollback(std::int64_t plan_id,
                                          std::optional<std::int64_t> step_id,
                                          const RollbackOptions& options)
{
    if (step_id) {
        return rollback_engine.rollback_step(plan_id, *step_id, options);
    }
    return rollback_engine.rollback_plan(plan_id, options);
}


bool MigrationService::can_rollback(std::int64_t plan_id) const
{
    return rollback_engine.can_rollback(plan_id);
}


PlanStatusReport MigrationService::plan_status(std::int64_t plan_id) const
{
    auto plan = db.get_plan(plan_id);
    if (!plan) {
        THROW_ENGINE_ERROR(ErrorCodes::Code::PLAN_NOT_FOUND, fmt::format("plan {}", plan_id));
    }

    PlanStatusReport report;
    report.plan = *plan;
    report.running = !plan->active_run.empty();
    for (const auto& step : db.list_steps(plan_id)) {
        switch (step.status) {
            case StepStatus::Pending: ++report.pending_steps; break;
            case StepStatus::InProgress: ++report.in_progress_steps; break;
            case StepStatus::Completed: ++report.completed_steps; break;
            case StepStatus::RolledBack: ++report.rolled_back_steps; break;
            case StepStatus::Failed: {
                ++report.failed_steps;
                StepReport error;
                error.step_id = step.id;
                error.step_order = step.step_order;
                error.file_id = step.file_id;
                error.action = step.action;
                error.status = step.status;
                error.source_path = step.source_path;
                error.dest_path = step.dest_path;
                error.bytes = step.size_bytes;
                error.attempts = step.attempts;
                error.error_code = ErrorCodes::code_from_int(step.error_code);
                error.error = step.error;
                report.errors.push_back(std::move(error));
                break;
            }
        }
        if (step.action == StepAction::Delete && step.status == StepStatus::Completed) {
            report.can_rollback = false;
        }
    }
    return report;
}


std::vector<MigrationPlan> MigrationService::list_plans(std::optional<PlanStatus> status) const
{
    return db.list_plans(status);
}
