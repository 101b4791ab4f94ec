#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

using ErrorCodes::Code;

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS drives (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    label TEXT NOT NULL UNIQUE,
    role TEXT NOT NULL,
    backend TEXT NOT NULL DEFAULT 'local',
    mount_path TEXT,
    rclone_remote TEXT,
    total_bytes INTEGER NOT NULL DEFAULT 0,
    is_online INTEGER NOT NULL DEFAULT 1,
    is_readonly INTEGER NOT NULL DEFAULT 0,
    added_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    drive_id INTEGER NOT NULL REFERENCES drives(id),
    path TEXT NOT NULL,
    abs_path TEXT NOT NULL,
    size_bytes INTEGER NOT NULL DEFAULT 0,
    content_hash TEXT,
    category TEXT,
    priority TEXT NOT NULL DEFAULT 'normal',
    duplicate_group INTEGER,
    is_original INTEGER NOT NULL DEFAULT 0,
    status TEXT NOT NULL DEFAULT 'indexed',
    migrated_to TEXT,
    migrated_to_drive INTEGER REFERENCES drives(id),
    migrated_at TEXT,
    verified_hash TEXT,
    UNIQUE(drive_id, path)
);

CREATE TABLE IF NOT EXISTS migration_plans (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    created_at TEXT NOT NULL,
    description TEXT,
    source_drive_id INTEGER REFERENCES drives(id),
    target_drive_id INTEGER REFERENCES drives(id),
    status TEXT NOT NULL DEFAULT 'draft',
    total_files INTEGER NOT NULL DEFAULT 0,
    total_bytes INTEGER NOT NULL DEFAULT 0,
    completed_files INTEGER NOT NULL DEFAULT 0,
    completed_bytes INTEGER NOT NULL DEFAULT 0,
    max_batch_size_bytes INTEGER,
    started_at TEXT,
    completed_at TEXT,
    active_run TEXT,
    run_heartbeat INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS migration_steps (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    plan_id INTEGER NOT NULL REFERENCES migration_plans(id),
    file_id INTEGER NOT NULL REFERENCES files(id),
    action TEXT NOT NULL,
    source_path TEXT NOT NULL,
    source_drive_id INTEGER NOT NULL REFERENCES drives(id),
    dest_path TEXT,
    dest_drive_id INTEGER REFERENCES drives(id),
    status TEXT NOT NULL DEFAULT 'pending',
    pre_hash TEXT,
    post_hash TEXT,
    executed_at TEXT,
    error TEXT,
    error_code INTEGER NOT NULL DEFAULT 0,
    attempts INTEGER NOT NULL DEFAULT 0,
    size_bytes INTEGER NOT NULL DEFAULT 0,
    step_order INTEGER NOT NULL,
    UNIQUE(plan_id, step_order)
);

CREATE TABLE IF NOT EXISTS audit_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp TEXT NOT NULL,
    action TEXT NOT NULL,
    file_id INTEGER,
    plan_id INTEGER,
    drive_id INTEGER,
    details TEXT,
    agent_mode TEXT NOT NULL
);

CREATE TRIGGER IF NOT EXISTS audit_log_no_update BEFORE UPDATE ON audit_log
BEGIN
    SELECT RAISE(ABORT, 'audit_log is append-only');
END;

CREATE TRIGGER IF NOT EXISTS audit_log_no_delete BEFORE DELETE ON audit_log
BEGIN
    SELECT RAISE(ABORT, 'audit_log is append-only');
END;

CREATE INDEX IF NOT EXISTS idx_files_drive ON files(drive_id);
CREATE INDEX IF NOT EXISTS idx_files_category ON files(category);
CREATE INDEX IF NOT EXISTS idx_files_duplicate_group ON files(duplicate_group);
CREATE INDEX IF NOT EXISTS idx_migration_steps_plan ON migration_steps(plan_id, step_order);
CREATE INDEX IF NOT EXISTS idx_audit_log_plan ON audit_log(plan_id);
)SQL";

constexpr const char* kDriveColumns =
    "id, label, role, backend, mount_path, rclone_remote, total_bytes, is_online, is_readonly";

constexpr const char* kFileColumns =
    "id, drive_id, path, abs_path, size_bytes, content_hash, category, priority, "
    "duplicate_group, is_original, status, migrated_to, migrated_to_drive, migrated_at, verified_hash";

constexpr const char* kPlanColumns =
    "id, created_at, description, source_drive_id, target_drive_id, status, total_files, "
    "total_bytes, completed_files, completed_bytes, max_batch_size_bytes, started_at, "
    "completed_at, active_run, run_heartbeat";

constexpr const char* kStepColumns =
    "id, plan_id, file_id, action, source_path, source_drive_id, dest_path, dest_drive_id, "
    "status, pre_hash, post_hash, executed_at, error, error_code, attempts, size_bytes, step_order";

constexpr const char* kAuditColumns =
    "id, timestamp, action, file_id, plan_id, drive_id, details, agent_mode";

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql)
        : db_(db)
    {
        const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            THROW_ENGINE_ERROR(Code::DB_QUERY_FAILED,
                               std::string(sqlite3_errmsg(db_)) + " in: " + sql);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, std::int64_t value)
    {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind(int index, const std::string& value)
    {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, const char* value)
    {
        return bind(index, std::string(value));
    }

    Statement& bind(int index, std::optional<std::int64_t> value)
    {
        if (value) {
            return bind(index, *value);
        }
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    // Empty strings are stored as NULL
    Statement& bind_text_or_null(int index, const std::string& value)
    {
        if (value.empty()) {
            check(sqlite3_bind_null(stmt_, index));
            return *this;
        }
        return bind(index, value);
    }

    bool step()
    {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        THROW_ENGINE_ERROR(Code::DB_QUERY_FAILED, sqlite3_errmsg(db_));
    }

    void run()
    {
        while (step()) {
        }
    }

    void reset()
    {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::int64_t int64(int column) const { return sqlite3_column_int64(stmt_, column); }

    std::string text(int column) const
    {
        const auto* raw = sqlite3_column_text(stmt_, column);
        if (!raw) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(raw),
                           static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
    }

    std::optional<std::int64_t> optional_int64(int column) const
    {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return int64(column);
    }

private:
    void check(int rc)
    {
        if (rc != SQLITE_OK) {
            THROW_ENGINE_ERROR(Code::DB_QUERY_FAILED, sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    Transaction(sqlite3* db, std::shared_ptr<spdlog::logger> logger)
        : db_(db), logger_(std::move(logger))
    {
        execute("BEGIN IMMEDIATE;", Code::DB_TRANSACTION_FAILED);
    }

    ~Transaction()
    {
        if (committed_) {
            return;
        }
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK && logger_) {
            logger_->error("Rollback failed: {}", err ? err : "unknown error");
        }
        sqlite3_free(err);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit()
    {
        execute("COMMIT;", Code::DB_TRANSACTION_FAILED);
        committed_ = true;
    }

private:
    void execute(const char* sql, Code code)
    {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string message = err ? err : "unknown error";
            sqlite3_free(err);
            THROW_ENGINE_ERROR(code, message);
        }
    }

    sqlite3* db_;
    std::shared_ptr<spdlog::logger> logger_;
    bool committed_{false};
};

template <typename Enum, typename Parser>
Enum parse_or(const std::string& value, Parser parser, Enum fallback)
{
    if (auto parsed = parser(value)) {
        return *parsed;
    }
    return fallback;
}

DriveRecord read_drive(const Statement& stmt)
{
    DriveRecord drive;
    drive.id = stmt.int64(0);
    drive.label = stmt.text(1);
    drive.role = parse_or(stmt.text(2), parse_drive_role, DriveRole::Source);
    drive.backend = parse_or(stmt.text(3), parse_backend_kind, BackendKind::Local);
    drive.mount_path = stmt.text(4);
    drive.rclone_remote = stmt.text(5);
    drive.total_bytes = stmt.int64(6);
    drive.is_online = stmt.int64(7) != 0;
    drive.is_readonly = stmt.int64(8) != 0;
    return drive;
}

FileRecord read_file(const Statement& stmt)
{
    FileRecord file;
    file.id = stmt.int64(0);
    file.drive_id = stmt.int64(1);
    file.path = stmt.text(2);
    file.abs_path = stmt.text(3);
    file.size_bytes = stmt.int64(4);
    file.hash = stmt.text(5);
    file.category = stmt.text(6);
    file.priority = parse_or(stmt.text(7), parse_file_priority, FilePriority::Normal);
    file.duplicate_group = stmt.optional_int64(8);
    file.is_original = stmt.int64(9) != 0;
    file.status = parse_or(stmt.text(10), parse_file_status, FileStatus::Indexed);
    file.migrated_to = stmt.text(11);
    file.migrated_to_drive = stmt.optional_int64(12);
    file.migrated_at = stmt.text(13);
    file.verified_hash = stmt.text(14);
    return file;
}

MigrationPlan read_plan(const Statement& stmt)
{
    MigrationPlan plan;
    plan.id = stmt.int64(0);
    plan.created_at = stmt.text(1);
    plan.description = stmt.text(2);
    plan.source_drive_id = stmt.optional_int64(3);
    plan.target_drive_id = stmt.optional_int64(4);
    plan.status = parse_or(stmt.text(5), parse_plan_status, PlanStatus::Draft);
    plan.total_files = stmt.int64(6);
    plan.total_bytes = stmt.int64(7);
    plan.completed_files = stmt.int64(8);
    plan.completed_bytes = stmt.int64(9);
    plan.max_batch_size_bytes = stmt.optional_int64(10);
    plan.started_at = stmt.text(11);
    plan.completed_at = stmt.text(12);
    plan.active_run = stmt.text(13);
    plan.run_heartbeat = stmt.int64(14);
    return plan;
}

MigrationStep read_step(const Statement& stmt)
{
    MigrationStep step;
    step.id = stmt.int64(0);
    step.plan_id = stmt.int64(1);
    step.file_id = stmt.int64(2);
    step.action = parse_or(stmt.text(3), parse_step_action, StepAction::Copy);
    step.source_path = stmt.text(4);
    step.source_drive_id = stmt.int64(5);
    step.dest_path = stmt.text(6);
    step.dest_drive_id = stmt.optional_int64(7);
    step.status = parse_or(stmt.text(8), parse_step_status, StepStatus::Pending);
    step.pre_hash = stmt.text(9);
    step.post_hash = stmt.text(10);
    step.executed_at = stmt.text(11);
    step.error = stmt.text(12);
    step.error_code = static_cast<int>(stmt.int64(13));
    step.attempts = static_cast<int>(stmt.int64(14));
    step.size_bytes = stmt.int64(15);
    step.step_order = static_cast<int>(stmt.int64(16));
    return step;
}

AuditEntry read_audit(const Statement& stmt)
{
    AuditEntry entry;
    entry.id = stmt.int64(0);
    entry.timestamp = stmt.text(1);
    entry.action = stmt.text(2);
    entry.file_id = stmt.optional_int64(3);
    entry.plan_id = stmt.optional_int64(4);
    entry.drive_id = stmt.optional_int64(5);
    entry.details = stmt.text(6);
    entry.agent_mode = parse_or(stmt.text(7), parse_agent_mode, AgentMode::Automatic);
    return entry;
}

std::int64_t insert_audit(sqlite3* db, const AuditEntry& entry)
{
    Statement stmt(db,
        "INSERT INTO audit_log (timestamp, action, file_id, plan_id, drive_id, details, agent_mode) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7);");
    stmt.bind(1, entry.timestamp.empty() ? Utils::current_timestamp_iso() : entry.timestamp)
        .bind(2, entry.action)
        .bind(3, entry.file_id)
        .bind(4, entry.plan_id)
        .bind(5, entry.drive_id)
        .bind(6, entry.details.empty() ? std::string("{}") : entry.details)
        .bind(7, to_string(entry.agent_mode));
    stmt.run();
    return sqlite3_last_insert_rowid(db);
}

} // namespace


DatabaseManager::DatabaseManager(std::string db_path)
    : db_path_(std::move(db_path)),
      db_logger_(Logger::get_logger("db_logger"))
{
    open();
    initialize_schema();
}


DatabaseManager::~DatabaseManager()
{
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}


void DatabaseManager::open()
{
    if (db_path_ != ":memory:") {
        const auto parent = std::filesystem::path(db_path_).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        if (ec) {
            THROW_ENGINE_ERROR(Code::DB_CONNECTION_FAILED, "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        THROW_ENGINE_ERROR(Code::DB_CONNECTION_FAILED, db_path_ + ": " + message);
    }

    sqlite3_busy_timeout(db_, 5000);

    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        if (db_logger_) {
            db_logger_->warn("Failed to enable WAL mode: {}", err ? err : "unknown error");
        }
        sqlite3_free(err);
        err = nullptr;
    }

    exec("PRAGMA synchronous=FULL;");
    exec("PRAGMA foreign_keys=ON;");
}


void DatabaseManager::initialize_schema()
{
    try {
        exec(kSchema);
        exec(("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";").c_str());
    } catch (const ErrorCodes::EngineException& ex) {
        THROW_ENGINE_ERROR(Code::DB_INIT_FAILED, ex.what());
    }
    if (db_logger_) {
        db_logger_->info("Database ready at '{}' (schema v{})", db_path_, kSchemaVersion);
    }
}


void DatabaseManager::exec(const char* sql)
{
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        if (db_logger_) {
            db_logger_->error("SQL failed: {}", message);
        }
        THROW_ENGINE_ERROR(Code::DB_QUERY_FAILED, message);
    }
}


std::int64_t DatabaseManager::add_drive(const DriveRecord& drive)
{
    Statement stmt(db_,
        "INSERT INTO drives (label, role, backend, mount_path, rclone_remote, total_bytes, "
        "is_online, is_readonly, added_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);");
    stmt.bind(1, drive.label)
        .bind(2, to_string(drive.role))
        .bind(3, to_string(drive.backend))
        .bind_text_or_null(4, drive.mount_path)
        .bind_text_or_null(5, drive.rclone_remote)
        .bind(6, drive.total_bytes)
        .bind(7, static_cast<std::int64_t>(drive.is_online ? 1 : 0))
        .bind(8, static_cast<std::int64_t>(drive.is_readonly ? 1 : 0))
        .bind(9, Utils::current_timestamp_iso());
    stmt.run();
    return sqlite3_last_insert_rowid(db_);
}


std::optional<DriveRecord> DatabaseManager::get_drive(std::int64_t drive_id) const
{
    Statement stmt(db_, std::string("SELECT ") + kDriveColumns + " FROM drives WHERE id = ?1;");
    stmt.bind(1, drive_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_drive(stmt);
}


std::vector<DriveRecord> DatabaseManager::list_drives() const
{
    Statement stmt(db_, std::string("SELECT ") + kDriveColumns + " FROM drives ORDER BY id;");
    std::vector<DriveRecord> drives;
    while (stmt.step()) {
        drives.push_back(read_drive(stmt));
    }
    return drives;
}


void DatabaseManager::set_drive_online(std::int64_t drive_id, bool online)
{
    Statement stmt(db_, "UPDATE drives SET is_online = ?1 WHERE id = ?2;");
    stmt.bind(1, static_cast<std::int64_t>(online ? 1 : 0)).bind(2, drive_id);
    stmt.run();
}


void DatabaseManager::set_drive_readonly(std::int64_t drive_id, bool readonly)
{
    Statement stmt(db_, "UPDATE drives SET is_readonly = ?1 WHERE id = ?2;");
    stmt.bind(1, static_cast<std::int64_t>(readonly ? 1 : 0)).bind(2, drive_id);
    stmt.run();
}


std::int64_t DatabaseManager::add_file(const FileRecord& file)
{
    Statement stmt(db_,
        "INSERT INTO files (drive_id, path, abs_path, size_bytes, content_hash, category, priority, "
        "duplicate_group, is_original, status) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10);");
    stmt.bind(1, file.drive_id)
        .bind(2, file.path)
        .bind(3, file.abs_path)
        .bind(4, file.size_bytes)
        .bind_text_or_null(5, file.hash)
        .bind_text_or_null(6, file.category)
        .bind(7, to_string(file.priority))
        .bind(8, file.duplicate_group)
        .bind(9, static_cast<std::int64_t>(file.is_original ? 1 : 0))
        .bind(10, to_string(file.status));
    stmt.run();
    return sqlite3_last_insert_rowid(db_);
}


std::optional<FileRecord> DatabaseManager::get_file(std::int64_t file_id) const
{
    Statement stmt(db_, std::string("SELECT ") + kFileColumns + " FROM files WHERE id = ?1;");
    stmt.bind(1, file_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_file(stmt);
}


std::vector<FileRecord> DatabaseManager::find_files(const FileQuery& query) const
{
    std::string sql = std::string("SELECT ") + kFileColumns +
                      " FROM files WHERE status != 'source_removed'";
    if (query.category) {
        sql += " AND category = ?1";
    }
    if (query.drive_id) {
        sql += " AND drive_id = ?2";
    }
    if (query.priority) {
        sql += " AND priority = ?3";
    }
    sql += " ORDER BY drive_id, path;";

    Statement stmt(db_, sql);
    if (query.category) {
        stmt.bind(1, *query.category);
    }
    if (query.drive_id) {
        stmt.bind(2, *query.drive_id);
    }
    if (query.priority) {
        stmt.bind(3, to_string(*query.priority));
    }

    std::vector<FileRecord> files;
    while (stmt.step()) {
        files.push_back(read_file(stmt));
    }
    return files;
}


std::vector<FileRecord> DatabaseManager::list_duplicate_group(std::int64_t group_id) const
{
    Statement stmt(db_, std::string("SELECT ") + kFileColumns +
                        " FROM files WHERE duplicate_group = ?1 ORDER BY is_original DESC, id;");
    stmt.bind(1, group_id);
    std::vector<FileRecord> files;
    while (stmt.step()) {
        files.push_back(read_file(stmt));
    }
    return files;
}


void DatabaseManager::set_file_hash(std::int64_t file_id, const std::string& hash)
{
    Statement stmt(db_, "UPDATE files SET content_hash = ?1 WHERE id = ?2;");
    stmt.bind(1, hash).bind(2, file_id);
    stmt.run();
}


void DatabaseManager::update_file_status(std::int64_t file_id, FileStatus status)
{
    Statement stmt(db_, "UPDATE files SET status = ?1 WHERE id = ?2;");
    stmt.bind(1, to_string(status)).bind(2, file_id);
    stmt.run();
}


void DatabaseManager::mark_file_migrated(std::int64_t file_id,
                                         const std::string& dest_path,
                                         std::optional<std::int64_t> dest_drive_id,
                                         const std::string& verified_hash)
{
    Statement stmt(db_,
        "UPDATE files SET status = 'verified', migrated_to = ?1, migrated_to_drive = ?2, "
        "migrated_at = ?3, verified_hash = ?4 WHERE id = ?5;");
    stmt.bind(1, dest_path)
        .bind(2, dest_drive_id)
        .bind(3, Utils::current_timestamp_iso())
        .bind(4, verified_hash)
        .bind(5, file_id);
    stmt.run();
}


void DatabaseManager::clear_file_migration(std::int64_t file_id, FileStatus status)
{
    Statement stmt(db_,
        "UPDATE files SET status = ?1, migrated_to = NULL, migrated_to_drive = NULL, "
        "migrated_at = NULL, verified_hash = NULL WHERE id = ?2;");
    stmt.bind(1, to_string(status)).bind(2, file_id);
    stmt.run();
}


std::int64_t DatabaseManager::create_plan_with_steps(const MigrationPlan& plan,
                                                     std::vector<MigrationStep>& steps,
                                                     const AuditEntry& created_entry)
{
    Transaction tx(db_, db_logger_);

    Statement insert_plan(db_,
        "INSERT INTO migration_plans (created_at, description, source_drive_id, target_drive_id, "
        "status, total_files, total_bytes, max_batch_size_bytes) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
    insert_plan.bind(1, plan.created_at.empty() ? Utils::current_timestamp_iso() : plan.created_at)
        .bind(2, plan.description)
        .bind(3, plan.source_drive_id)
        .bind(4, plan.target_drive_id)
        .bind(5, to_string(PlanStatus::Draft))
        .bind(6, plan.total_files)
        .bind(7, plan.total_bytes)
        .bind(8, plan.max_batch_size_bytes);
    insert_plan.run();
    const std::int64_t plan_id = sqlite3_last_insert_rowid(db_);

    Statement insert_step(db_,
        "INSERT INTO migration_steps (plan_id, file_id, action, source_path, source_drive_id, "
        "dest_path, dest_drive_id, status, pre_hash, size_bytes, step_order) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, 'pending', ?8, ?9, ?10);");
    Statement mark_planned(db_,
        "UPDATE files SET status = 'planned' WHERE id = ?1 AND status != 'source_removed';");

    for (auto& step : steps) {
        insert_step.reset();
        insert_step.bind(1, plan_id)
            .bind(2, step.file_id)
            .bind(3, to_string(step.action))
            .bind(4, step.source_path)
            .bind(5, step.source_drive_id)
            .bind_text_or_null(6, step.dest_path)
            .bind(7, step.dest_drive_id)
            .bind_text_or_null(8, step.pre_hash)
            .bind(9, step.size_bytes)
            .bind(10, static_cast<std::int64_t>(step.step_order));
        insert_step.run();
        step.id = sqlite3_last_insert_rowid(db_);
        step.plan_id = plan_id;
        step.status = StepStatus::Pending;

        mark_planned.reset();
        mark_planned.bind(1, step.file_id);
        mark_planned.run();
    }

    AuditEntry entry = created_entry;
    entry.plan_id = plan_id;
    insert_audit(db_, entry);

    tx.commit();

    if (db_logger_) {
        db_logger_->info("Created plan {} with {} step(s)", plan_id, steps.size());
    }
    return plan_id;
}


std::optional<MigrationPlan> DatabaseManager::get_plan(std::int64_t plan_id) const
{
    Statement stmt(db_, std::string("SELECT ") + kPlanColumns + " FROM migration_plans WHERE id = ?1;");
    stmt.bind(1, plan_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_plan(stmt);
}


std::vector<MigrationPlan> DatabaseManager::list_plans(std::optional<PlanStatus> status) const
{
    std::string sql = std::string("SELECT ") + kPlanColumns + " FROM migration_plans";
    if (status) {
        sql += " WHERE status = ?1";
    }
    sql += " ORDER BY id;";
    Statement stmt(db_, sql);
    if (status) {
        stmt.bind(1, to_string(*status));
    }
    std::vector<MigrationPlan> plans;
    while (stmt.step()) {
        plans.push_back(read_plan(stmt));
    }
    return plans;
}


bool DatabaseManager::transition_plan_status(std::int64_t plan_id, PlanStatus from, PlanStatus to)
{
    Statement stmt(db_,
        "UPDATE migration_plans SET status = ?1, "
        "started_at = CASE WHEN ?1 = 'in_progress' AND started_at IS NULL THEN ?2 ELSE started_at END, "
        "completed_at = CASE WHEN ?1 IN ('completed', 'aborted') THEN ?2 ELSE completed_at END "
        "WHERE id = ?3 AND status = ?4;");
    stmt.bind(1, to_string(to))
        .bind(2, Utils::current_timestamp_iso())
        .bind(3, plan_id)
        .bind(4, to_string(from));
    stmt.run();
    const bool changed = sqlite3_changes(db_) == 1;
    if (changed && db_logger_) {
        db_logger_->info("Plan {} status {} -> {}", plan_id, to_string(from), to_string(to));
    }
    return changed;
}


void DatabaseManager::update_plan_progress(std::int64_t plan_id,
                                           std::int64_t completed_files,
                                           std::int64_t completed_bytes)
{
    Statement stmt(db_,
        "UPDATE migration_plans SET completed_files = ?1, completed_bytes = ?2 WHERE id = ?3;");
    stmt.bind(1, completed_files).bind(2, completed_bytes).bind(3, plan_id);
    stmt.run();
}


bool DatabaseManager::acquire_run_lease(std::int64_t plan_id,
                                        const std::string& token,
                                        std::int64_t stale_after_seconds)
{
    const std::int64_t now = Utils::unix_now();
    Statement stmt(db_,
        "UPDATE migration_plans SET active_run = ?1, run_heartbeat = ?2 "
        "WHERE id = ?3 AND (active_run IS NULL OR run_heartbeat < ?4);");
    stmt.bind(1, token).bind(2, now).bind(3, plan_id).bind(4, now - stale_after_seconds);
    stmt.run();
    return sqlite3_changes(db_) == 1;
}


bool DatabaseManager::refresh_run_lease(std::int64_t plan_id, const std::string& token)
{
    Statement stmt(db_,
        "UPDATE migration_plans SET run_heartbeat = ?1 WHERE id = ?2 AND active_run = ?3;");
    stmt.bind(1, Utils::unix_now()).bind(2, plan_id).bind(3, token);
    stmt.run();
    return sqlite3_changes(db_) == 1;
}


void DatabaseManager::release_run_lease(std::int64_t plan_id, const std::string& token)
{
    Statement stmt(db_,
        "UPDATE migration_plans SET active_run = NULL, run_heartbeat = 0 "
        "WHERE id = ?1 AND active_run = ?2;");
    stmt.bind(1, plan_id).bind(2, token);
    stmt.run();
}


std::vector<MigrationStep> DatabaseManager::list_steps(std::int64_t plan_id) const
{
    Statement stmt(db_, std::string("SELECT ") + kStepColumns +
                        " FROM migration_steps WHERE plan_id = ?1 ORDER BY step_order ASC;");
    stmt.bind(1, plan_id);
    std::vector<MigrationStep> steps;
    while (stmt.step()) {
        steps.push_back(read_step(stmt));
    }
    return steps;
}


std::optional<MigrationStep> DatabaseManager::get_step(std::int64_t step_id) const
{
    Statement stmt(db_, std::string("SELECT ") + kStepColumns + " FROM migration_steps WHERE id = ?1;");
    stmt.bind(1, step_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_step(stmt);
}


void DatabaseManager::update_step(const MigrationStep& step)
{
    Statement stmt(db_,
        "UPDATE migration_steps SET status = ?1, post_hash = ?2, executed_at = ?3, error = ?4, "
        "error_code = ?5, attempts = ?6, pre_hash = ?7 WHERE id = ?8;");
    stmt.bind(1, to_string(step.status))
        .bind_text_or_null(2, step.post_hash)
        .bind_text_or_null(3, step.executed_at)
        .bind_text_or_null(4, step.error)
        .bind(5, static_cast<std::int64_t>(step.error_code))
        .bind(6, static_cast<std::int64_t>(step.attempts))
        .bind_text_or_null(7, step.pre_hash)
        .bind(8, step.id);
    stmt.run();
    if (sqlite3_changes(db_) != 1) {
        THROW_ENGINE_ERROR(Code::DB_QUERY_FAILED, "Step " + std::to_string(step.id) + " not updated");
    }
}


int DatabaseManager::reset_orphaned_steps(std::int64_t plan_id)
{
    Statement stmt(db_,
        "UPDATE migration_steps SET status = 'pending' WHERE plan_id = ?1 AND status = 'in_progress';");
    stmt.bind(1, plan_id);
    stmt.run();
    const int reset = sqlite3_changes(db_);
    if (reset > 0 && db_logger_) {
        db_logger_->warn("Reset {} orphaned in-progress step(s) of plan {}", reset, plan_id);
    }
    return reset;
}


std::int64_t DatabaseManager::append_audit(const AuditEntry& entry)
{
    return insert_audit(db_, entry);
}


std::vector<AuditEntry> DatabaseManager::list_audit(std::optional<std::int64_t> plan_id) const
{
    std::string sql = std::string("SELECT ") + kAuditColumns + " FROM audit_log";
    if (plan_id) {
        sql += " WHERE plan_id = ?1";
    }
    sql += " ORDER BY id ASC;";
    Statement stmt(db_, sql);
    if (plan_id) {
        stmt.bind(1, *plan_id);
    }
    std::vector<AuditEntry> entries;
    while (stmt.step()) {
        entries.push_back(read_audit(stmt));
    }
    return entries;
}
