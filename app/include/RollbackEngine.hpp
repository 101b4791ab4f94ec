#ifndef ROLLBACKENGINE_HPP
#define ROLLBACKENGINE_HPP

#include "ErrorCode.hpp"
#include "TransferAdapter.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class AuditLog;
class DatabaseManager;
namespace spdlog { class logger; }

struct RollbackOptions {
    AgentMode agent_mode{AgentMode::Automatic};
    std::string reason;
    std::chrono::seconds transfer_timeout{3600};
    std::chrono::seconds stale_run_after{3600};
};

struct RollbackStepResult {
    std::int64_t step_id{0};
    int step_order{0};
    StepAction action{StepAction::Copy};
    StepStatus status{StepStatus::Completed};
    ErrorCodes::Code error_code{ErrorCodes::Code::SUCCESS};
    std::string error;
};

struct RollbackReport {
    std::int64_t plan_id{0};
    std::optional<std::int64_t> requested_step;
    bool success{false};
    std::vector<RollbackStepResult> steps;
    std::int64_t rolled_back_steps{0};
    std::int64_t rolled_back_bytes{0};
    std::optional<std::int64_t> failed_step_id;
    ErrorCodes::Code error_code{ErrorCodes::Code::SUCCESS};
    std::string message;
};

/**
 * @brief Reverses Completed steps in descending step_order.
 *
 * Copies and links are removed after their destination still verifies;
 * moves are restored to their source and verified before the destination
 * goes. Deletions cannot be reversed. Plan status is left as it is.
 */
class RollbackEngine {
public:
    RollbackEngine(DatabaseManager& db,
                   AuditLog& audit,
                   TransferFactory transfer_factory,
                   std::shared_ptr<spdlog::logger> core_logger);

    // False when the plan holds a Completed Delete step.
    bool can_rollback(std::int64_t plan_id) const;

    RollbackReport rollback_plan(std::int64_t plan_id, const RollbackOptions& options);
    RollbackReport rollback_step(std::int64_t plan_id, std::int64_t step_id, const RollbackOptions& options);

private:
    MigrationPlan require_plan(std::int64_t plan_id) const;
    bool reverse(MigrationStep& step, const RollbackOptions& options, RollbackReport& report);
    void reverse_copy(const MigrationStep& step);
    void reverse_move(const MigrationStep& step, const RollbackOptions& options);
    void reverse_link(const MigrationStep& step);
    void verify_destination(ITransferAdapter& adapter, const MigrationStep& step) const;
    std::unique_ptr<ITransferAdapter> adapter_for(std::int64_t drive_id) const;
    void record_refusal(const RollbackReport& report, const RollbackOptions& options);

    DatabaseManager& db;
    AuditLog& audit;
    TransferFactory transfer_factory;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
