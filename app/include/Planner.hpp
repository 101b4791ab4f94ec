#ifndef PLANNER_HPP
#define PLANNER_HPP

#include "TransferAdapter.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class AuditLog;
class DatabaseManager;
class SpaceGuard;
namespace spdlog { class logger; }

struct Selection {
    enum class Kind { ExplicitFiles, Category, DuplicateGroup };

    Kind kind{Kind::ExplicitFiles};
    std::vector<std::int64_t> file_ids;
    std::string category;
    std::optional<std::int64_t> drive_id;
    std::optional<FilePriority> priority;
    std::int64_t duplicate_group{0};

    static Selection files(std::vector<std::int64_t> ids);
    static Selection by_category(std::string category,
                                 std::optional<std::int64_t> drive_id = std::nullopt,
                                 std::optional<FilePriority> priority = std::nullopt);
    static Selection group(std::int64_t group_id);
};

struct PlannerOptions {
    std::optional<std::int64_t> target_drive_id;
    std::optional<std::int64_t> max_batch_size_bytes;
    std::string description;
    std::string dest_subdir;  ///< Prefix under the target root.
    AgentMode agent_mode{AgentMode::Automatic};
};

/**
 * @brief Builds Draft plans and gates them through approval.
 *
 * Every precondition is checked before anything is written; a plan and
 * all of its steps are created in one transaction or not at all.
 */
class Planner {
public:
    Planner(DatabaseManager& db,
            AuditLog& audit,
            SpaceGuard& space_guard,
            TransferFactory transfer_factory,
            std::shared_ptr<spdlog::logger> core_logger);

    std::int64_t create_plan(const Selection& selection,
                             StepAction action,
                             const PlannerOptions& options);

    void approve_plan(std::int64_t plan_id, AgentMode agent_mode);

    void abort_plan(std::int64_t plan_id, const std::string& reason, AgentMode agent_mode);

private:
    std::vector<FileRecord> resolve_selection(const Selection& selection, StepAction action) const;
    DriveRecord require_drive(std::int64_t drive_id) const;
    DriveRecord validate_destination(const PlannerOptions& options, StepAction action) const;
    std::string capture_pre_hash(FileRecord& file, HashAlgorithm algorithm);
    void validate_delete_targets(std::vector<FileRecord>& files);
    std::string destination_for(const FileRecord& file,
                                const DriveRecord& target,
                                const PlannerOptions& options) const;
    std::string source_path_for(const FileRecord& file) const;
    void discard_partial_transfer(const MigrationStep& step) const;

    DatabaseManager& db;
    AuditLog& audit;
    SpaceGuard& space_guard;
    TransferFactory transfer_factory;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
