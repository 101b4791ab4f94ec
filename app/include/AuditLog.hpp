#ifndef AUDITLOG_HPP
#define AUDITLOG_HPP

#include "Types.hpp"

#ifdef __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class DatabaseManager;

// Append-only record of every mutating engine action.
class AuditLog {
public:
    explicit AuditLog(DatabaseManager& db);

    std::int64_t record(const std::string& action,
                        AgentMode agent_mode,
                        const Json::Value& details,
                        std::optional<std::int64_t> plan_id = std::nullopt,
                        std::optional<std::int64_t> file_id = std::nullopt,
                        std::optional<std::int64_t> drive_id = std::nullopt);

    // Adds step id, order, action, paths and hashes to details.
    std::int64_t record_step(const std::string& action,
                             const MigrationStep& step,
                             AgentMode agent_mode,
                             Json::Value details = Json::Value(Json::objectValue));

    std::vector<AuditEntry> entries_for_plan(std::int64_t plan_id) const;

    static AuditEntry make_entry(const std::string& action,
                                 AgentMode agent_mode,
                                 const Json::Value& details,
                                 std::optional<std::int64_t> plan_id = std::nullopt,
                                 std::optional<std::int64_t> file_id = std::nullopt,
                                 std::optional<std::int64_t> drive_id = std::nullopt);

    static std::string serialize(const Json::Value& details);

private:
    DatabaseManager& db_;
};

#endif
