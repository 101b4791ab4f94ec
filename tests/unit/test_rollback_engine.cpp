#include <catch2/catch_test_macros.hpp>

#include "EngineFixture.hpp"

#include <algorithm>
#include <filesystem>

using ErrorCodes::Code;

namespace {

RollbackOptions rollback_options()
{
    RollbackOptions options;
    options.agent_mode = AgentMode::HumanApproved;
    options.reason = "undo test migration";
    return options;
}

bool contains(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

TEST_CASE("Rolling back a copy removes the destination and keeps the source") {
    EngineFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto plan_id = fx.approved_plan(Selection::files({file_id}), StepAction::Copy);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);

    const auto report = fx.rollback.rollback_plan(plan_id, rollback_options());

    CHECK(report.success);
    CHECK(report.rolled_back_steps == 1);
    CHECK(report.rolled_back_bytes == 5);
    CHECK_FALSE(std::filesystem::exists(fx.target_file("a.txt")));
    CHECK(read_file(fx.source_file("a.txt")) == "alpha");
    CHECK(fx.step_at(plan_id, 0).status == StepStatus::RolledBack);

    const auto file = fx.db.get_file(file_id);
    CHECK(file->status == FileStatus::Indexed);
    CHECK(file->migrated_to.empty());

    const auto plan = fx.db.get_plan(plan_id);
    CHECK(plan->status == PlanStatus::Completed);
    CHECK(plan->completed_files == 0);
    CHECK(plan->completed_bytes == 0);

    const auto actions = fx.audit_actions(plan_id);
    CHECK(contains(actions, "rollback_started"));
    CHECK(contains(actions, "step_rolled_back"));
    CHECK(contains(actions, "rollback_completed"));
}

TEST_CASE("Rolling back a move restores the source before removing the destination") {
    EngineFixture fx;
    const auto file_id = fx.add_file("nested/dir/photo.jpg", "jpeg bytes");
    const auto plan_id = fx.approved_plan(Selection::files({file_id}), StepAction::Move);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);
    std::filesystem::remove_all(fx.source_root / "nested");

    const auto report = fx.rollback.rollback_plan(plan_id, rollback_options());

    CHECK(report.success);
    CHECK(read_file(fx.source_file("nested/dir/photo.jpg")) == "jpeg bytes");
    CHECK_FALSE(std::filesystem::exists(fx.target_file("nested/dir/photo.jpg")));
    CHECK(fx.db.get_file(file_id)->status == FileStatus::Indexed);
}

TEST_CASE("Rollback walks completed steps in descending order") {
    EngineFixture fx;
    const auto ids = std::vector<std::int64_t>{fx.add_file("a.txt", "alpha"),
                                               fx.add_file("b.txt", "bravo"),
                                               fx.add_file("c.txt", "charlie")};
    const auto plan_id = fx.approved_plan(Selection::files(ids), StepAction::Copy);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);

    const auto report = fx.rollback.rollback_plan(plan_id, rollback_options());

    REQUIRE(report.steps.size() == 3);
    CHECK(report.steps[0].step_order == 2);
    CHECK(report.steps[1].step_order == 1);
    CHECK(report.steps[2].step_order == 0);
}

TEST_CASE("Rollback stops at a destination modified after migration") {
    EngineFixture fx;
    const auto ids = std::vector<std::int64_t>{fx.add_file("a.txt", "alpha"),
                                               fx.add_file("b.txt", "bravo"),
                                               fx.add_file("c.txt", "charlie")};
    const auto plan_id = fx.approved_plan(Selection::files(ids), StepAction::Copy);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);
    write_file(fx.target_file("b.txt"), "edited on the target");

    const auto report = fx.rollback.rollback_plan(plan_id, rollback_options());

    CHECK_FALSE(report.success);
    CHECK(report.rolled_back_steps == 1);
    CHECK(report.error_code == Code::DESTINATION_MISMATCH);
    REQUIRE(report.failed_step_id);
    CHECK(*report.failed_step_id == fx.step_at(plan_id, 1).id);

    CHECK(fx.step_at(plan_id, 2).status == StepStatus::RolledBack);
    CHECK(fx.step_at(plan_id, 1).status == StepStatus::Completed);
    CHECK(fx.step_at(plan_id, 0).status == StepStatus::Completed);
    CHECK(read_file(fx.target_file("b.txt")) == "edited on the target");
    CHECK(std::filesystem::exists(fx.target_file("a.txt")));
    CHECK(fx.db.get_plan(plan_id)->completed_files == 2);
    CHECK(contains(fx.audit_actions(plan_id), "step_rollback_failed"));
}

TEST_CASE("Plans that deleted files cannot be rolled back") {
    EngineFixture fx;
    fx.add_file("keep/a.txt", "same", 9, true);
    fx.add_file("copy/a.txt", "same", 9, false);
    const auto plan_id = fx.approved_plan(Selection::group(9), StepAction::Delete);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);

    CHECK_FALSE(fx.rollback.can_rollback(plan_id));

    const auto report = fx.rollback.rollback_plan(plan_id, rollback_options());

    CHECK_FALSE(report.success);
    CHECK(report.error_code == Code::IRREVERSIBLE);
    CHECK(report.rolled_back_steps == 0);
    CHECK(fx.step_at(plan_id, 0).status == StepStatus::Completed);
    const auto actions = fx.audit_actions(plan_id);
    CHECK(contains(actions, "rollback_refused"));
    CHECK_FALSE(contains(actions, "rollback_started"));

    const auto single = fx.rollback.rollback_step(plan_id, fx.step_at(plan_id, 0).id, rollback_options());
    CHECK_FALSE(single.success);
    CHECK(single.error_code == Code::IRREVERSIBLE);
}

TEST_CASE("Only completed steps of the plan can be rolled back individually") {
    EngineFixture fx;
    const auto first = fx.add_file("a.txt", "alpha");
    const auto second = fx.add_file("b.txt", "bravo");
    const auto plan_id = fx.approved_plan(Selection::files({first}), StepAction::Copy);
    const auto other_plan = fx.approved_plan(Selection::files({second}), StepAction::Copy);

    CHECK(thrown_code([&] {
        fx.rollback.rollback_step(plan_id, fx.step_at(plan_id, 0).id, rollback_options());
    }) == Code::INVALID_STATUS_TRANSITION);
    CHECK(thrown_code([&] {
        fx.rollback.rollback_step(plan_id, fx.step_at(other_plan, 0).id, rollback_options());
    }) == Code::STEP_NOT_FOUND);
    CHECK(thrown_code([&] {
        fx.rollback.rollback_plan(plan_id + 100, rollback_options());
    }) == Code::PLAN_NOT_FOUND);
}

TEST_CASE("Rolling back one step updates the plan progress") {
    EngineFixture fx;
    const auto first = fx.add_file("a.txt", "alpha");
    const auto second = fx.add_file("b.txt", "bravo");
    const auto plan_id = fx.approved_plan(Selection::files({first, second}), StepAction::Copy);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);

    const auto report = fx.rollback.rollback_step(plan_id, fx.step_at(plan_id, 0).id, rollback_options());

    CHECK(report.success);
    REQUIRE(report.requested_step);
    CHECK(fx.step_at(plan_id, 0).status == StepStatus::RolledBack);
    CHECK(fx.step_at(plan_id, 1).status == StepStatus::Completed);
    CHECK(fx.db.get_plan(plan_id)->completed_files == 1);
    CHECK_FALSE(std::filesystem::exists(fx.target_file("a.txt")));
    CHECK(std::filesystem::exists(fx.target_file("b.txt")));
}

TEST_CASE("Rolling back a symlink removes only the link") {
    EngineFixture fx;
    const auto file_id = fx.add_file("data.bin", "linked bytes");
    const auto plan_id = fx.approved_plan(Selection::files({file_id}), StepAction::Symlink);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);

    const auto report = fx.rollback.rollback_plan(plan_id, rollback_options());

    CHECK(report.success);
    CHECK_FALSE(std::filesystem::exists(std::filesystem::symlink_status(fx.target_file("data.bin"))));
    CHECK(read_file(fx.source_file("data.bin")) == "linked bytes");
}

TEST_CASE("Rollback waits for a live run to finish") {
    EngineFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto plan_id = fx.approved_plan(Selection::files({file_id}), StepAction::Copy);
    REQUIRE(fx.executor.execute_plan(plan_id, fx.run_options()).outcome == RunOutcome::Completed);
    REQUIRE(fx.db.acquire_run_lease(plan_id, "live-run", 3600));

    CHECK(thrown_code([&] { fx.rollback.rollback_plan(plan_id, rollback_options()); }) ==
          Code::PLAN_ALREADY_RUNNING);
    CHECK(std::filesystem::exists(fx.target_file("a.txt")));
}
