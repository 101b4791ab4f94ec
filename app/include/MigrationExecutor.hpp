#ifndef MIGRATIONEXECUTOR_HPP
#define MIGRATIONEXECUTOR_HPP

#include "ErrorCode.hpp"
#include "SpaceGuard.hpp"
#include "TransferAdapter.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class AuditLog;
class DatabaseManager;
namespace spdlog { class logger; }

enum class ExecutionMode { DryRun, Execute };

enum class RunOutcome {
    Completed,      ///< Every step of the plan is Completed.
    Partial,        ///< All work was attempted; some steps stay Failed.
    Paused,         ///< A batch did not fit the destination headroom.
    DriveOffline,   ///< A drive of the next batch is offline.
    Stopped,        ///< A step failed under AbortOnFailure.
    NeedsDecision,  ///< A step failed under RetryThenPrompt.
    Declined,       ///< The confirmation callback refused a batch.
    Cancelled,      ///< The stop flag was raised between steps.
    Halted,         ///< The store failed; the run could not continue.
    DryRun
};

const char* to_string(RunOutcome outcome);
const char* to_string(ExecutionMode mode);

struct ProgressEvent {
    std::int64_t plan_id{0};
    std::int64_t step_id{0};
    int step_order{0};
    StepAction action{StepAction::Copy};
    StepStatus status{StepStatus::Pending};
    std::int64_t bytes{0};
    std::int64_t completed_files{0};
    std::int64_t total_files{0};
    std::int64_t completed_bytes{0};
    std::int64_t total_bytes{0};
    ErrorCodes::Code error_code{ErrorCodes::Code::SUCCESS};
};

struct BatchProposal {
    std::int64_t plan_id{0};
    std::size_t batch_index{0};
    std::vector<MigrationStep> steps;
    std::uint64_t bytes{0};
    std::vector<BatchAdmission> admissions;
};

struct ExecuteOptions {
    ExecutionMode mode{ExecutionMode::Execute};
    std::size_t batch_size{50};
    std::uint64_t io_limit_kibps{0};
    FailurePolicy failure_policy{};
    int retry_count{3};
    std::chrono::seconds transfer_timeout{3600};
    std::chrono::seconds stale_run_after{3600};
    AgentMode agent_mode{AgentMode::Automatic};

    // Propose mode: called before each batch; false stops the run.
    std::function<bool(const BatchProposal&)> confirm_batch;
    std::function<void(const ProgressEvent&)> on_progress;
    const std::atomic<bool>* stop_flag{nullptr};
};

struct StepReport {
    std::int64_t step_id{0};
    int step_order{0};
    std::int64_t file_id{0};
    StepAction action{StepAction::Copy};
    StepStatus status{StepStatus::Pending};
    std::string source_path;
    std::string dest_path;
    std::int64_t bytes{0};
    int attempts{0};
    ErrorCodes::Code error_code{ErrorCodes::Code::SUCCESS};
    std::string error;
};

struct BatchReport {
    std::size_t index{0};
    std::vector<std::int64_t> step_ids;
    std::uint64_t bytes{0};
    std::vector<BatchAdmission> admissions;
    bool admitted{false};
};

struct ExecutionReport {
    std::int64_t plan_id{0};
    ExecutionMode mode{ExecutionMode::Execute};
    RunOutcome outcome{RunOutcome::Completed};
    PlanStatus plan_status{PlanStatus::Draft};
    std::vector<StepReport> steps;
    std::vector<BatchReport> batches;
    std::int64_t completed_steps{0};
    std::int64_t failed_steps{0};
    std::int64_t pending_steps{0};
    std::int64_t completed_bytes{0};
    std::int64_t total_bytes{0};
    std::optional<std::int64_t> failed_step_id;
    std::string message;
};

/**
 * @brief Runs the Pending steps of an approved plan in step_order.
 *
 * Each step is source-verified, transferred, destination-verified and
 * committed as individual durable writes. Per-step failures are recorded
 * on the step; only precondition violations and store failures escape
 * as exceptions (the latter are reported as RunOutcome::Halted).
 */
class MigrationExecutor {
public:
    MigrationExecutor(DatabaseManager& db,
                      AuditLog& audit,
                      SpaceGuard& space_guard,
                      TransferFactory transfer_factory,
                      std::shared_ptr<spdlog::logger> core_logger);

    ExecutionReport execute_plan(std::int64_t plan_id, const ExecuteOptions& options);

private:
    struct RunContext;

    ExecutionReport dry_run(const MigrationPlan& plan, const ExecuteOptions& options);
    void run_batches(RunContext& ctx);
    bool drives_online(const std::vector<MigrationStep>& batch, std::string& offline_label) const;
    std::vector<BatchAdmission> admit(const std::vector<MigrationStep>& batch) const;
    std::vector<std::vector<MigrationStep>> make_batches(const std::vector<MigrationStep>& work,
                                                         const MigrationPlan& plan,
                                                         std::size_t batch_size) const;
    std::vector<MigrationStep> collect_work(std::int64_t plan_id) const;

    StepReport run_step(RunContext& ctx, MigrationStep& step);
    bool attempt_step(RunContext& ctx, MigrationStep& step);
    void perform_transfer(RunContext& ctx, MigrationStep& step);
    void perform_link(RunContext& ctx, MigrationStep& step);
    void perform_delete(RunContext& ctx, MigrationStep& step);
    void commit_step(RunContext& ctx, MigrationStep& step);
    void remove_moved_source(RunContext& ctx, const MigrationStep& step);
    void verify_source(ITransferAdapter& adapter, const MigrationStep& step) const;
    bool claim_existing_destination(ITransferAdapter& adapter, const MigrationStep& step) const;
    std::string verify_destination(ITransferAdapter& dest, const MigrationStep& step) const;
    void discard_destination(ITransferAdapter& dest, const MigrationStep& step) const;
    void discard_partial_transfer(RunContext& ctx, const MigrationStep& step) const;
    void verify_survivor(RunContext& ctx, const MigrationStep& step) const;
    void finalize_interrupted_moves(RunContext& ctx);
    std::size_t sources_awaiting_removal(const std::vector<MigrationStep>& steps) const;
    void refresh_plan_totals(RunContext& ctx);

    DriveRecord drive_for(std::int64_t drive_id) const;
    // Adapters handed out during a run keep the run lease alive.
    std::unique_ptr<ITransferAdapter> adapter_for(RunContext& ctx, const DriveRecord& drive) const;
    std::unique_ptr<ITransferAdapter> adapter_for(RunContext& ctx, std::int64_t drive_id) const;
    TransferOptions transfer_options(const ExecuteOptions& options) const;

    DatabaseManager& db;
    AuditLog& audit;
    SpaceGuard& space_guard;
    TransferFactory transfer_factory;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
