#include "AuditLog.hpp"
#include "DatabaseManager.hpp"
#include "Logger.hpp"
#include "Utils.hpp"


AuditLog::AuditLog(DatabaseManager& db)
    : db_(db)
{
}


std::string AuditLog::serialize(const Json::Value& details)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    if (details.isNull()) {
        return "{}";
    }
    return Json::writeString(writer, details);
}


AuditEntry AuditLog::make_entry(const std::string& action,
                                AgentMode agent_mode,
                                const Json::Value& details,
                                std::optional<std::int64_t> plan_id,
                                std::optional<std::int64_t> file_id,
                                std::optional<std::int64_t> drive_id)
{
    AuditEntry entry;
    entry.timestamp = Utils::current_timestamp_iso();
    entry.action = action;
    entry.agent_mode = agent_mode;
    entry.details = serialize(details);
    entry.plan_id = plan_id;
    entry.file_id = file_id;
    entry.drive_id = drive_id;
    return entry;
}


std::int64_t AuditLog::record(const std::string& action,
                              AgentMode agent_mode,
                              const Json::Value& details,
                              std::optional<std::int64_t> plan_id,
                              std::optional<std::int64_t> file_id,
                              std::optional<std::int64_t> drive_id)
{
    const auto id = db_.append_audit(make_entry(action, agent_mode, details, plan_id, file_id, drive_id));
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("audit #{} {} plan={} file={}", id, action,
                      plan_id ? std::to_string(*plan_id) : "-",
                      file_id ? std::to_string(*file_id) : "-");
    }
    return id;
}


std::int64_t AuditLog::record_step(const std::string& action,
                                   const MigrationStep& step,
                                   AgentMode agent_mode,
                                   Json::Value details)
{
    if (!details.isObject()) {
        details = Json::Value(Json::objectValue);
    }
    details["step_id"] = Json::Int64(step.id);
    details["step_order"] = step.step_order;
    details["action"] = to_string(step.action);
    details["source_path"] = step.source_path;
    if (!step.dest_path.empty()) {
        details["dest_path"] = step.dest_path;
    }
    if (!step.pre_hash.empty()) {
        details["pre_hash"] = step.pre_hash;
    }
    if (!step.post_hash.empty()) {
        details["post_hash"] = step.post_hash;
    }
    if (step.error_code != 0) {
        details["error_code"] = step.error_code;
        details["error"] = step.error;
    }
    details["attempts"] = step.attempts;

    const auto drive_id = step.dest_drive_id ? step.dest_drive_id : std::optional<std::int64_t>(step.source_drive_id);
    return record(action, agent_mode, details, step.plan_id, step.file_id, drive_id);
}


std::vector<AuditEntry> AuditLog::entries_for_plan(std::int64_t plan_id) const
{
    return db_.list_audit(plan_id);
}
