#ifndef MIGRATIONSERVICE_HPP
#define MIGRATIONSERVICE_HPP

#include "AuditLog.hpp"
#include "MigrationExecutor.hpp"
#include "Planner.hpp"
#include "RollbackEngine.hpp"
#include "SpaceGuard.hpp"
#include "TransferAdapter.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class DatabaseManager;
class Settings;
namespace spdlog { class logger; }

struct PlanStatusReport {
    MigrationPlan plan;
    std::int64_t pending_steps{0};
    std::int64_t in_progress_steps{0};
    std::int64_t completed_steps{0};
    std::int64_t failed_steps{0};
    std::int64_t rolled_back_steps{0};
    std::vector<StepReport> errors;
    bool can_rollback{true};
    bool running{false};
};

/**
 * @brief Upward command/query surface of the engine for one store handle.
 *
 * Owns the planner, executor and rollback engine and wires them to the
 * same store, audit log and transfer factory. Run defaults come from Settings.
 */
class MigrationService {
public:
    MigrationService(Settings& settings,
                     DatabaseManager& db,
                     TransferFactory transfer_factory = {});

    std::int64_t create_plan(const Selection& selection, StepAction action, const PlannerOptions& options);
    PlanStatusReport approve_plan(std::int64_t plan_id, AgentMode agent_mode);
    PlanStatusReport abort_plan(std::int64_t plan_id, const std::string& reason, AgentMode agent_mode);

    ExecuteOptions default_execute_options() const;
    ExecutionReport execute_plan(std::int64_t plan_id,
                                 ExecutionMode mode,
                                 std::optional<std::size_t> batch_size = std::nullopt,
                                 std::optional<std::uint64_t> io_limit_kibps = std::nullopt);
    ExecutionReport execute_plan(std::int64_t plan_id, const ExecuteOptions& options);

    RollbackReport rollback(std::int64_t plan_id,
                            std::optional<std::int64_t> step_id,
                            const RollbackOptions& options);
    bool can_rollback(std::int64_t plan_id) const;

    PlanStatusReport plan_status(std::int64_t plan_id) const;
    std::vector<MigrationPlan> list_plans(std::optional<PlanStatus> status = std::nullopt) const;

    SpaceGuard& space_guard() { return guard; }

private:
    Settings& settings;
    DatabaseManager& db;
    std::shared_ptr<spdlog::logger> core_logger;
    TransferFactory transfer_factory;
    AuditLog audit;
    SpaceGuard guard;
    Planner planner;
    MigrationExecutor executor;
    RollbackEngine rollback_engine;
};

#endif
