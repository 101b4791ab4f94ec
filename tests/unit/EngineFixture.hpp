/**
 * @file EngineFixture.hpp
 * @brief Store, drives and engine components wired over temp directories.
 */
#pragma once

#include "AuditLog.hpp"
#include "ContentHasher.hpp"
#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "LocalTransferAdapter.hpp"
#include "MigrationExecutor.hpp"
#include "Planner.hpp"
#include "RollbackEngine.hpp"
#include "SpaceGuard.hpp"
#include "TestHelpers.hpp"
#include "TestHooks.hpp"
#include "TransferAdapter.hpp"
#include "Utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Run fn and return the engine error code it throws (SUCCESS when none).
 */
template <typename Fn>
ErrorCodes::Code thrown_code(Fn&& fn) {
    try {
        fn();
    } catch (const ErrorCodes::EngineException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::SUCCESS;
}

/**
 * @brief Failure injection shared by every adapter a fixture hands out.
 */
struct TransferScript {
    int fail_transfers{0};   ///< Number of upcoming transfers that fail.
    bool time_out{false};    ///< Scripted failures report a timeout.
    bool corrupt_next{false};///< Append garbage to the next written destination.
    int transfer_calls{0};
    std::function<void()> during_transfer; ///< Runs mid-transfer, before the adapter's heartbeat.
    std::string fail_remove_path;          ///< remove() of this path fails...
    int fail_removals{0};                  ///< ...this many times.
    std::string fail_hash_path;            ///< compute_hash() of this path fails.
};

/**
 * @brief Local adapter wrapper that fails or corrupts transfers on demand.
 */
class ScriptedTransferAdapter : public ITransferAdapter {
public:
    ScriptedTransferAdapter(std::unique_ptr<ITransferAdapter> inner, std::shared_ptr<TransferScript> script)
        : inner_(std::move(inner)), script_(std::move(script)) {}

    BackendKind backend() const override { return inner_->backend(); }

    TransferResult transfer(const std::string& source,
                            const std::string& destination,
                            const TransferOptions& options) override {
        ++script_->transfer_calls;
        if (script_->during_transfer) {
            script_->during_transfer();
            beat();
        }
        if (script_->fail_transfers > 0) {
            --script_->fail_transfers;
            TransferResult result;
            result.timed_out = script_->time_out;
            result.message = "scripted failure";
            return result;
        }
        auto result = inner_->transfer(source, destination, options);
        if (result.completed() && script_->corrupt_next) {
            script_->corrupt_next = false;
            std::ofstream(destination, std::ios::binary | std::ios::app) << "corrupt";
        }
        return result;
    }

    TransferResult restore(const std::string& destination,
                           const std::string& source,
                           const TransferOptions& options) override {
        return inner_->restore(destination, source, options);
    }

    TransferResult link(const std::string& source, const std::string& destination, bool symbolic) override {
        return inner_->link(source, destination, symbolic);
    }

    bool exists(const std::string& path) override { return inner_->exists(path); }
    void remove(const std::string& path) override {
        if (script_->fail_removals > 0 && path == script_->fail_remove_path) {
            --script_->fail_removals;
            THROW_ENGINE_ERROR(ErrorCodes::Code::TRANSFER_FAILED, "scripted removal failure");
        }
        inner_->remove(path);
    }
    void prepare_destination(const std::string& path) override { inner_->prepare_destination(path); }
    std::string compute_hash(const std::string& path, HashAlgorithm algorithm) override {
        if (!script_->fail_hash_path.empty() && path == script_->fail_hash_path) {
            THROW_ENGINE_ERROR(ErrorCodes::Code::HASH_FAILED, "scripted hash failure");
        }
        return inner_->compute_hash(path, algorithm);
    }
    void discard_partial(const std::string& destination) override { inner_->discard_partial(destination); }
    void set_heartbeat(Heartbeat heartbeat) override {
        inner_->set_heartbeat(heartbeat);
        ITransferAdapter::set_heartbeat(std::move(heartbeat));
    }
    std::optional<SpaceInfo> space() override { return inner_->space(); }

private:
    std::unique_ptr<ITransferAdapter> inner_;
    std::shared_ptr<TransferScript> script_;
};

/**
 * @brief Source and target drives in a temp directory with a fresh store.
 *
 * Free space is reported as plentiful until set_free_space is called.
 */
class EngineFixture {
public:
    static constexpr std::uint64_t kPlentyOfSpace = 1ULL << 40;

    EngineFixture()
        : source_root(temp.path() / "source"),
          target_root(temp.path() / "target"),
          db(Utils::path_to_utf8(temp.path() / "ordne.db")),
          audit(db),
          script(std::make_shared<TransferScript>()),
          factory(make_factory(script)),
          guard(factory),
          planner(db, audit, guard, factory, nullptr),
          executor(db, audit, guard, factory, nullptr),
          rollback(db, audit, factory, nullptr)
    {
        std::filesystem::create_directories(source_root);
        std::filesystem::create_directories(target_root);
        source_drive = add_local_drive("source", source_root, DriveRole::Source);
        target_drive = add_local_drive("target", target_root, DriveRole::Target);
        set_free_space(kPlentyOfSpace);
    }

    ~EngineFixture() {
        TestHooks::reset_free_space_override();
    }

    EngineFixture(const EngineFixture&) = delete;
    EngineFixture& operator=(const EngineFixture&) = delete;

    static TransferFactory make_factory(std::shared_ptr<TransferScript> script) {
        return [script](const DriveRecord& drive) -> std::unique_ptr<ITransferAdapter> {
            auto local = std::make_unique<LocalTransferAdapter>(drive.mount_path, "rsync", false);
            return std::make_unique<ScriptedTransferAdapter>(std::move(local), script);
        };
    }

    std::int64_t add_local_drive(const std::string& label,
                                 const std::filesystem::path& root,
                                 DriveRole role) {
        DriveRecord drive;
        drive.label = label;
        drive.role = role;
        drive.backend = BackendKind::Local;
        drive.mount_path = Utils::path_to_utf8(root);
        return db.add_drive(drive);
    }

    /**
     * @brief Write a file below the drive root and index it.
     * @param known_hash When false the record carries no hash.
     */
    std::int64_t add_file(const std::string& rel,
                          const std::string& content,
                          std::optional<std::int64_t> group = std::nullopt,
                          bool original = false,
                          std::optional<std::int64_t> drive_id = std::nullopt,
                          bool known_hash = true) {
        const auto drive = db.get_drive(drive_id.value_or(source_drive));
        const auto path = Utils::utf8_to_path(drive->mount_path) / rel;
        write_file(path, content);

        FileRecord file;
        file.drive_id = drive->id;
        file.path = rel;
        file.abs_path = Utils::path_to_utf8(path);
        file.size_bytes = static_cast<std::int64_t>(content.size());
        file.hash = known_hash ? ContentHasher::compute_hash(file.abs_path) : std::string();
        file.category = "documents";
        file.duplicate_group = group;
        file.is_original = original;
        file.status = FileStatus::Classified;
        return db.add_file(file);
    }

    std::filesystem::path source_file(const std::string& rel) const { return source_root / rel; }
    std::filesystem::path target_file(const std::string& rel) const { return target_root / rel; }

    void set_free_space(std::uint64_t available, std::uint64_t total = kPlentyOfSpace * 2) {
        TestHooks::set_free_space_override([available, total](const DriveRecord&) {
            return std::optional<SpaceInfo>(SpaceInfo{total, available, available});
        });
    }

    PlannerOptions to_target() const {
        PlannerOptions options;
        options.target_drive_id = target_drive;
        return options;
    }

    std::int64_t approved_plan(const Selection& selection, StepAction action) {
        const auto plan_id = planner.create_plan(selection, action,
                                                 action == StepAction::Delete ? PlannerOptions{} : to_target());
        planner.approve_plan(plan_id, AgentMode::HumanApproved);
        return plan_id;
    }

    ExecuteOptions run_options(FailurePolicy policy = FailurePolicy::abort_on_failure(),
                               int retries = 0) const {
        ExecuteOptions options;
        options.mode = ExecutionMode::Execute;
        options.failure_policy = policy;
        options.retry_count = retries;
        options.transfer_timeout = std::chrono::seconds(60);
        return options;
    }

    MigrationStep step_at(std::int64_t plan_id, std::size_t order) const {
        return db.list_steps(plan_id).at(order);
    }

    std::vector<std::string> audit_actions(std::int64_t plan_id) const {
        std::vector<std::string> actions;
        for (const auto& entry : db.list_audit(plan_id)) {
            actions.push_back(entry.action);
        }
        return actions;
    }

    TempDir temp;
    std::filesystem::path source_root;
    std::filesystem::path target_root;
    DatabaseManager db;
    AuditLog audit;
    std::shared_ptr<TransferScript> script;
    TransferFactory factory;
    SpaceGuard guard;
    Planner planner;
    MigrationExecutor executor;
    RollbackEngine rollback;
    std::int64_t source_drive{0};
    std::int64_t target_drive{0};
};
