#ifndef DATABASEMANAGER_HPP
#define DATABASEMANAGER_HPP

#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
namespace spdlog { class logger; }

/**
 * @brief SQLite-backed store for drives, files, plans, steps and the audit log.
 *
 * Every write outside create_plan_with_steps is a single autocommit
 * statement, so it is durable and visible to every later read once the
 * call returns. Failures throw ErrorCodes::EngineException with a DB_* code.
 */
class DatabaseManager {
public:
    struct FileQuery {
        std::optional<std::string> category;
        std::optional<std::int64_t> drive_id;
        std::optional<FilePriority> priority;
    };

    explicit DatabaseManager(std::string db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    const std::string& path() const { return db_path_; }

    // Drives
    std::int64_t add_drive(const DriveRecord& drive);
    std::optional<DriveRecord> get_drive(std::int64_t drive_id) const;
    std::vector<DriveRecord> list_drives() const;
    void set_drive_online(std::int64_t drive_id, bool online);
    void set_drive_readonly(std::int64_t drive_id, bool readonly);

    // Files
    std::int64_t add_file(const FileRecord& file);
    std::optional<FileRecord> get_file(std::int64_t file_id) const;
    std::vector<FileRecord> find_files(const FileQuery& query) const;
    std::vector<FileRecord> list_duplicate_group(std::int64_t group_id) const;
    void set_file_hash(std::int64_t file_id, const std::string& hash);
    void update_file_status(std::int64_t file_id, FileStatus status);
    void mark_file_migrated(std::int64_t file_id,
                            const std::string& dest_path,
                            std::optional<std::int64_t> dest_drive_id,
                            const std::string& verified_hash);
    void clear_file_migration(std::int64_t file_id, FileStatus status);

    // Plans
    std::int64_t create_plan_with_steps(const MigrationPlan& plan,
                                        std::vector<MigrationStep>& steps,
                                        const AuditEntry& created_entry);
    std::optional<MigrationPlan> get_plan(std::int64_t plan_id) const;
    std::vector<MigrationPlan> list_plans(std::optional<PlanStatus> status = std::nullopt) const;
    // Conditional update; false when the plan is not in `from`.
    bool transition_plan_status(std::int64_t plan_id, PlanStatus from, PlanStatus to);
    void update_plan_progress(std::int64_t plan_id,
                              std::int64_t completed_files,
                              std::int64_t completed_bytes);

    // Run lease. Acquire succeeds when no run holds the plan or the holder's
    // heartbeat is older than stale_after_seconds.
    bool acquire_run_lease(std::int64_t plan_id,
                           const std::string& token,
                           std::int64_t stale_after_seconds);
    // False when the lease no longer belongs to token.
    bool refresh_run_lease(std::int64_t plan_id, const std::string& token);
    void release_run_lease(std::int64_t plan_id, const std::string& token);

    // Steps
    std::vector<MigrationStep> list_steps(std::int64_t plan_id) const;
    std::optional<MigrationStep> get_step(std::int64_t step_id) const;
    void update_step(const MigrationStep& step);
    int reset_orphaned_steps(std::int64_t plan_id);

    // Audit log (append-only)
    std::int64_t append_audit(const AuditEntry& entry);
    std::vector<AuditEntry> list_audit(std::optional<std::int64_t> plan_id = std::nullopt) const;

private:
    void open();
    void initialize_schema();
    void exec(const char* sql);

    std::string db_path_;
    sqlite3* db_{nullptr};
    std::shared_ptr<spdlog::logger> db_logger_;
};

#endif
