#include <catch2/catch_test_macros.hpp>

#include "EngineFixture.hpp"

#include <filesystem>

using ErrorCodes::Code;

TEST_CASE("Planner creates a draft plan with ordered steps") {
    EngineFixture fx;
    const auto first = fx.add_file("docs/a.txt", "alpha");
    const auto second = fx.add_file("docs/b.txt", "bravo!");

    PlannerOptions options = fx.to_target();
    options.dest_subdir = "archive";
    options.description = "archive documents";
    const auto plan_id = fx.planner.create_plan(Selection::files({first, second}), StepAction::Copy, options);

    const auto plan = fx.db.get_plan(plan_id);
    REQUIRE(plan);
    CHECK(plan->status == PlanStatus::Draft);
    CHECK(plan->description == "archive documents");
    CHECK(plan->total_files == 2);
    CHECK(plan->total_bytes == 11);
    CHECK(plan->completed_files == 0);
    REQUIRE(plan->target_drive_id);
    CHECK(*plan->target_drive_id == fx.target_drive);

    const auto steps = fx.db.list_steps(plan_id);
    REQUIRE(steps.size() == 2);
    CHECK(steps[0].step_order == 0);
    CHECK(steps[1].step_order == 1);
    CHECK(steps[0].file_id == first);
    CHECK(steps[0].status == StepStatus::Pending);
    CHECK(steps[0].dest_path == fx.target_file("archive/docs/a.txt").string());
    CHECK(steps[0].source_path == fx.source_file("docs/a.txt").string());
    CHECK(steps[0].pre_hash == fx.db.get_file(first)->hash);

    CHECK(fx.db.get_file(first)->status == FileStatus::Planned);
    CHECK(fx.db.get_file(second)->status == FileStatus::Planned);

    const auto audit = fx.db.list_audit(plan_id);
    REQUIRE(audit.size() == 1);
    CHECK(audit[0].action == "plan_created");
}

TEST_CASE("Planner rejects selections that match nothing") {
    EngineFixture fx;
    CHECK(thrown_code([&] {
        fx.planner.create_plan(Selection::by_category("videos"), StepAction::Copy, fx.to_target());
    }) == Code::INVALID_PLAN);
    CHECK(thrown_code([&] {
        fx.planner.create_plan(Selection::files({4242}), StepAction::Copy, fx.to_target());
    }) == Code::INVALID_PLAN);
    CHECK(fx.db.list_plans().empty());
}

TEST_CASE("Planner validates the destination drive") {
    EngineFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto selection = Selection::files({file_id});

    SECTION("missing target") {
        CHECK(thrown_code([&] {
            fx.planner.create_plan(selection, StepAction::Copy, PlannerOptions{});
        }) == Code::INVALID_PLAN);
    }
    SECTION("offline target") {
        fx.db.set_drive_online(fx.target_drive, false);
        CHECK(thrown_code([&] {
            fx.planner.create_plan(selection, StepAction::Copy, fx.to_target());
        }) == Code::INVALID_PLAN);
    }
    SECTION("read-only target") {
        fx.db.set_drive_readonly(fx.target_drive, true);
        CHECK(thrown_code([&] {
            fx.planner.create_plan(selection, StepAction::Move, fx.to_target());
        }) == Code::INVALID_PLAN);
    }
    SECTION("unregistered target") {
        PlannerOptions options;
        options.target_drive_id = 999;
        CHECK(thrown_code([&] {
            fx.planner.create_plan(selection, StepAction::Copy, options);
        }) == Code::INVALID_PLAN);
    }
    SECTION("occupied destination") {
        write_file(fx.target_file("a.txt"), "already here");
        CHECK(thrown_code([&] {
            fx.planner.create_plan(selection, StepAction::Copy, fx.to_target());
        }) == Code::INVALID_PLAN);
    }
    SECTION("hardlink across drives") {
        CHECK(thrown_code([&] {
            fx.planner.create_plan(selection, StepAction::Hardlink, fx.to_target());
        }) == Code::INVALID_PLAN);
    }

    CHECK(fx.db.list_plans().empty());
    CHECK(fx.db.get_file(file_id)->status == FileStatus::Classified);
}

TEST_CASE("Planner refuses to delete the last copy of a file") {
    EngineFixture fx;

    SECTION("every member of the group is selected") {
        const auto original = fx.add_file("keep/a.txt", "same", 3, true);
        const auto copy = fx.add_file("copy/a.txt", "same", 3, false);
        CHECK(thrown_code([&] {
            fx.planner.create_plan(Selection::files({original, copy}), StepAction::Delete, PlannerOptions{});
        }) == Code::INVALID_PLAN);
        CHECK(fx.db.get_file(copy)->status == FileStatus::Classified);
    }
    SECTION("the original holds different content") {
        fx.add_file("keep/a.txt", "different", 3, true);
        const auto copy = fx.add_file("copy/a.txt", "same", 3, false);
        CHECK(thrown_code([&] {
            fx.planner.create_plan(Selection::files({copy}), StepAction::Delete, PlannerOptions{});
        }) == Code::INVALID_PLAN);
    }
    SECTION("the file is in no duplicate group") {
        const auto lonely = fx.add_file("lonely.txt", "only copy");
        CHECK(thrown_code([&] {
            fx.planner.create_plan(Selection::files({lonely}), StepAction::Delete, PlannerOptions{});
        }) == Code::INVALID_PLAN);
    }

    CHECK(fx.db.list_plans().empty());
}

TEST_CASE("Planner builds a dedup plan from a duplicate group") {
    EngineFixture fx;
    const auto original = fx.add_file("keep/a.txt", "same", 5, true);
    const auto copy_one = fx.add_file("copy1/a.txt", "same", 5, false);
    const auto copy_two = fx.add_file("copy2/a.txt", "same", 5, false);

    const auto plan_id = fx.planner.create_plan(Selection::group(5), StepAction::Delete, PlannerOptions{});

    const auto steps = fx.db.list_steps(plan_id);
    REQUIRE(steps.size() == 2);
    CHECK(steps[0].file_id == copy_one);
    CHECK(steps[1].file_id == copy_two);
    CHECK(steps[0].dest_path.empty());
    CHECK_FALSE(steps[0].dest_drive_id);
    CHECK(fx.db.get_file(original)->status == FileStatus::Classified);
}

TEST_CASE("Planner hashes files with no known digest") {
    EngineFixture fx;
    const auto file_id = fx.add_file("fresh.txt", "never hashed", std::nullopt, false, std::nullopt, false);
    REQUIRE(fx.db.get_file(file_id)->hash.empty());

    const auto plan_id = fx.planner.create_plan(Selection::files({file_id}), StepAction::Copy, fx.to_target());

    const auto expected = ContentHasher::compute_hash(fx.source_file("fresh.txt").string());
    CHECK(fx.step_at(plan_id, 0).pre_hash == expected);
    CHECK(fx.db.get_file(file_id)->hash == expected);
}

TEST_CASE("Planner selects files by category") {
    EngineFixture fx;
    fx.add_file("a.txt", "alpha");
    fx.add_file("b.txt", "bravo");

    const auto plan_id = fx.planner.create_plan(Selection::by_category("documents", fx.source_drive),
                                                StepAction::Copy, fx.to_target());

    CHECK(fx.db.list_steps(plan_id).size() == 2);
}

TEST_CASE("Planner rejects a file larger than the target device") {
    EngineFixture fx;
    const auto file_id = fx.add_file("big.bin", std::string(64, 'b'));
    fx.set_free_space(16, 32);

    CHECK(thrown_code([&] {
        fx.planner.create_plan(Selection::files({file_id}), StepAction::Copy, fx.to_target());
    }) == Code::INSUFFICIENT_SPACE);
    CHECK(fx.db.list_plans().empty());
}

TEST_CASE("Plans are approved exactly once") {
    EngineFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto plan_id = fx.planner.create_plan(Selection::files({file_id}), StepAction::Copy, fx.to_target());

    fx.planner.approve_plan(plan_id, AgentMode::HumanApproved);
    CHECK(fx.db.get_plan(plan_id)->status == PlanStatus::Approved);

    CHECK(thrown_code([&] { fx.planner.approve_plan(plan_id, AgentMode::HumanApproved); }) ==
          Code::INVALID_STATUS_TRANSITION);
    CHECK(thrown_code([&] { fx.planner.approve_plan(plan_id + 100, AgentMode::Automatic); }) ==
          Code::PLAN_NOT_FOUND);

    const auto audit = fx.db.list_audit(plan_id);
    REQUIRE(audit.size() == 2);
    CHECK(audit[1].action == "plan_approved");
    CHECK(audit[1].agent_mode == AgentMode::HumanApproved);
}

TEST_CASE("Aborting a plan releases its files") {
    EngineFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto plan_id = fx.approved_plan(Selection::files({file_id}), StepAction::Copy);

    fx.planner.abort_plan(plan_id, "no longer needed", AgentMode::HumanApproved);

    CHECK(fx.db.get_plan(plan_id)->status == PlanStatus::Aborted);
    CHECK(fx.db.get_file(file_id)->status == FileStatus::Indexed);
    CHECK(fx.db.list_audit(plan_id).back().action == "plan_aborted");
    CHECK(thrown_code([&] { fx.planner.abort_plan(plan_id, "again", AgentMode::Automatic); }) ==
          Code::INVALID_STATUS_TRANSITION);
}

TEST_CASE("Aborting a plan discards partial transfers of unfinished steps") {
    EngineFixture fx;
    const auto done_id = fx.add_file("done.txt", "finished");
    const auto open_id = fx.add_file("open.txt", "unfinished");
    const auto plan_id = fx.approved_plan(Selection::files({done_id, open_id}), StepAction::Copy);

    auto done = fx.step_at(plan_id, 0);
    done.status = StepStatus::Completed;
    fx.db.update_step(done);
    const auto done_partial = LocalTransferAdapter::partial_path_for(done.dest_path);
    write_file(done_partial, "fin");

    const auto open_dest = fx.step_at(plan_id, 1).dest_path;
    write_file(LocalTransferAdapter::partial_path_for(open_dest), "unf");
    write_file(LocalTransferAdapter::rsync_partial_path_for(open_dest), "un");

    fx.planner.abort_plan(plan_id, "no longer needed", AgentMode::HumanApproved);

    CHECK_FALSE(std::filesystem::exists(LocalTransferAdapter::partial_path_for(open_dest)));
    CHECK_FALSE(std::filesystem::exists(LocalTransferAdapter::rsync_partial_path_for(open_dest)));
    CHECK(std::filesystem::exists(done_partial));
}

TEST_CASE("A running plan cannot be aborted") {
    EngineFixture fx;
    const auto file_id = fx.add_file("a.txt", "alpha");
    const auto plan_id = fx.approved_plan(Selection::files({file_id}), StepAction::Copy);
    REQUIRE(fx.db.acquire_run_lease(plan_id, "live-run", 3600));

    CHECK(thrown_code([&] { fx.planner.abort_plan(plan_id, "stop", AgentMode::Automatic); }) ==
          Code::PLAN_ALREADY_RUNNING);
    CHECK(fx.db.get_plan(plan_id)->status == PlanStatus::Approved);
}
