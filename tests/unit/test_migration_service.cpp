#include <catch2/catch_test_macros.hpp>

#include "EngineFixture.hpp"
#include "MigrationService.hpp"
#include "Settings.hpp"

#include <filesystem>

using ErrorCodes::Code;

namespace {

struct ServiceFixture : EngineFixture {
    ServiceFixture()
        : config_guard("ORDNE_CONFIG_DIR", temp.path().string()),
          service(settings, db, factory)
    {
        settings.set_batch_size(1);
    }

    EnvVarGuard config_guard;
    Settings settings;
    MigrationService service;
};

} // namespace

TEST_CASE("Service drives a plan from creation to rollback") {
    ServiceFixture fx;
    const auto first = fx.add_file("a.txt", "alpha");
    const auto second = fx.add_file("b.txt", "bravo");

    const auto plan_id = fx.service.create_plan(Selection::files({first, second}), StepAction::Copy, fx.to_target());
    CHECK(fx.service.plan_status(plan_id).plan.status == PlanStatus::Draft);

    const auto approved = fx.service.approve_plan(plan_id, AgentMode::HumanApproved);
    CHECK(approved.plan.status == PlanStatus::Approved);
    CHECK(approved.pending_steps == 2);

    const auto report = fx.service.execute_plan(plan_id, ExecutionMode::Execute);
    CHECK(report.outcome == RunOutcome::Completed);
    CHECK(report.batches.size() == 2);

    const auto status = fx.service.plan_status(plan_id);
    CHECK(status.completed_steps == 2);
    CHECK(status.can_rollback);
    CHECK_FALSE(status.running);

    RollbackOptions options;
    options.reason = "undo";
    const auto rollback = fx.service.rollback(plan_id, std::nullopt, options);
    CHECK(rollback.success);
    CHECK(fx.service.plan_status(plan_id).rolled_back_steps == 2);
    CHECK_FALSE(std::filesystem::exists(fx.target_file("a.txt")));
}

TEST_CASE("Service run defaults come from settings") {
    ServiceFixture fx;
    fx.settings.set_failure_mode(FailureMode::SkipOnFailure);
    fx.settings.set_retry_count(1);
    fx.settings.set_io_limit_kibps(512);

    const auto options = fx.service.default_execute_options();

    CHECK(options.batch_size == 1);
    CHECK(options.failure_policy.mode == FailureMode::SkipOnFailure);
    CHECK(options.retry_count == 1);
    CHECK(options.io_limit_kibps == 512);
}

TEST_CASE("Service status lists failed steps with their errors") {
    ServiceFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto plan_id = fx.service.create_plan(Selection::files({file_id}), StepAction::Copy, fx.to_target());
    fx.service.approve_plan(plan_id, AgentMode::Automatic);
    write_file(fx.source_file("a.txt"), "changed");

    fx.settings.set_retry_count(0);
    const auto report = fx.service.execute_plan(plan_id, ExecutionMode::Execute);
    CHECK(report.outcome == RunOutcome::Stopped);

    const auto status = fx.service.plan_status(plan_id);
    CHECK(status.failed_steps == 1);
    REQUIRE(status.errors.size() == 1);
    CHECK(status.errors[0].error_code == Code::SOURCE_CHANGED);
    CHECK(fx.service.list_plans(PlanStatus::InProgress).size() == 1);
    CHECK(fx.service.list_plans(PlanStatus::Completed).empty());
}

TEST_CASE("Service reports unknown plans") {
    ServiceFixture fx;
    CHECK(thrown_code([&] { fx.service.plan_status(77); }) == Code::PLAN_NOT_FOUND);
    CHECK(thrown_code([&] { fx.service.execute_plan(77, ExecutionMode::DryRun); }) == Code::PLAN_NOT_FOUND);
    CHECK(thrown_code([&] { fx.service.can_rollback(77); }) == Code::PLAN_NOT_FOUND);
}
