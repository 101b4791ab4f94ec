#include "ReportJson.hpp"

namespace ReportJson {

namespace {

void set_optional(Json::Value& node, const char* key, const std::optional<std::int64_t>& value)
{
    node[key] = value ? Json::Value(Json::Int64(*value)) : Json::Value(Json::nullValue);
}

}


Json::Value to_json(const MigrationPlan& plan)
{
    Json::Value node(Json::objectValue);
    node["id"] = Json::Int64(plan.id);
    node["created_at"] = plan.created_at;
    node["description"] = plan.description;
    set_optional(node, "source_drive_id", plan.source_drive_id);
    set_optional(node, "target_drive_id", plan.target_drive_id);
    node["status"] = to_string(plan.status);
    node["total_files"] = Json::Int64(plan.total_files);
    node["total_bytes"] = Json::Int64(plan.total_bytes);
    node["completed_files"] = Json::Int64(plan.completed_files);
    node["completed_bytes"] = Json::Int64(plan.completed_bytes);
    set_optional(node, "max_batch_size_bytes", plan.max_batch_size_bytes);
    if (!plan.started_at.empty()) {
        node["started_at"] = plan.started_at;
    }
    if (!plan.completed_at.empty()) {
        node["completed_at"] = plan.completed_at;
    }
    return node;
}


Json::Value to_json(const StepReport& step)
{
    Json::Value node(Json::objectValue);
    node["step_id"] = Json::Int64(step.step_id);
    node["step_order"] = step.step_order;
    node["file_id"] = Json::Int64(step.file_id);
    node["action"] = to_string(step.action);
    node["status"] = to_string(step.status);
    node["source_path"] = step.source_path;
    if (!step.dest_path.empty()) {
        node["dest_path"] = step.dest_path;
    }
    node["bytes"] = Json::Int64(step.bytes);
    node["attempts"] = step.attempts;
    if (step.error_code != ErrorCodes::Code::SUCCESS) {
        node["error_code"] = ErrorCodes::ErrorCatalog::code_name(step.error_code);
        node["error"] = step.error;
    }
    return node;
}


Json::Value to_json(const BatchAdmission& admission)
{
    Json::Value node(Json::objectValue);
    node["drive_id"] = Json::Int64(admission.drive_id);
    node["batch_bytes"] = Json::UInt64(admission.batch_bytes);
    node["measured"] = admission.measured;
    if (admission.measured) {
        node["free_bytes"] = Json::UInt64(admission.free_bytes);
        node["max_safe_bytes"] = Json::UInt64(admission.max_safe_bytes);
    }
    node["admitted"] = admission.admitted;
    return node;
}


Json::Value to_json(const ExecutionReport& report)
{
    Json::Value node(Json::objectValue);
    node["plan_id"] = Json::Int64(report.plan_id);
    node["mode"] = to_string(report.mode);
    node["outcome"] = to_string(report.outcome);
    node["plan_status"] = to_string(report.plan_status);
    node["completed_steps"] = Json::Int64(report.completed_steps);
    node["failed_steps"] = Json::Int64(report.failed_steps);
    node["pending_steps"] = Json::Int64(report.pending_steps);
    node["completed_bytes"] = Json::Int64(report.completed_bytes);
    node["total_bytes"] = Json::Int64(report.total_bytes);
    set_optional(node, "failed_step_id", report.failed_step_id);
    if (!report.message.empty()) {
        node["message"] = report.message;
    }

    Json::Value steps(Json::arrayValue);
    for (const auto& step : report.steps) {
        steps.append(to_json(step));
    }
    node["steps"] = steps;

    Json::Value batches(Json::arrayValue);
    for (const auto& batch : report.batches) {
        Json::Value entry(Json::objectValue);
        entry["index"] = Json::UInt64(batch.index);
        entry["bytes"] = Json::UInt64(batch.bytes);
        entry["admitted"] = batch.admitted;
        Json::Value ids(Json::arrayValue);
        for (const auto id : batch.step_ids) {
            ids.append(Json::Int64(id));
        }
        entry["step_ids"] = ids;
        Json::Value admissions(Json::arrayValue);
        for (const auto& admission : batch.admissions) {
            admissions.append(to_json(admission));
        }
        entry["space"] = admissions;
        batches.append(entry);
    }
    node["batches"] = batches;
    return node;
}


Json::Value to_json(const RollbackReport& report)
{
    Json::Value node(Json::objectValue);
    node["plan_id"] = Json::Int64(report.plan_id);
    set_optional(node, "step_id", report.requested_step);
    node["success"] = report.success;
    node["rolled_back_steps"] = Json::Int64(report.rolled_back_steps);
    node["rolled_back_bytes"] = Json::Int64(report.rolled_back_bytes);
    set_optional(node, "failed_step_id", report.failed_step_id);
    if (report.error_code != ErrorCodes::Code::SUCCESS) {
        node["error_code"] = ErrorCodes::ErrorCatalog::code_name(report.error_code);
        node["message"] = report.message;
    }

    Json::Value steps(Json::arrayValue);
    for (const auto& step : report.steps) {
        Json::Value entry(Json::objectValue);
        entry["step_id"] = Json::Int64(step.step_id);
        entry["step_order"] = step.step_order;
        entry["action"] = to_string(step.action);
        entry["status"] = to_string(step.status);
        if (step.error_code != ErrorCodes::Code::SUCCESS) {
            entry["error_code"] = ErrorCodes::ErrorCatalog::code_name(step.error_code);
            entry["error"] = step.error;
        }
        steps.append(entry);
    }
    node["steps"] = steps;
    return node;
}


Json::Value to_json(const PlanStatusReport& report)
{
    Json::Value node = to_json(report.plan);
    Json::Value counts(Json::objectValue);
    counts["pending"] = Json::Int64(report.pending_steps);
    counts["in_progress"] = Json::Int64(report.in_progress_steps);
    counts["completed"] = Json::Int64(report.completed_steps);
    counts["failed"] = Json::Int64(report.failed_steps);
    counts["rolled_back"] = Json::Int64(report.rolled_back_steps);
    node["steps"] = counts;

    Json::Value errors(Json::arrayValue);
    for (const auto& error : report.errors) {
        errors.append(to_json(error));
    }
    node["errors"] = errors;
    node["can_rollback"] = report.can_rollback;
    node["running"] = report.running;
    return node;
}


Json::Value error_to_json(const ErrorCodes::EngineException& ex)
{
    Json::Value node(Json::objectValue);
    node["error_code"] = ErrorCodes::ErrorCatalog::code_name(ex.get_error_code());
    node["code"] = ex.get_error_code_int();
    node["message"] = ex.what();
    node["resolution"] = ex.get_error_info().resolution;
    return node;
}


std::string write(const Json::Value& value, bool pretty)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = pretty ? "  " : "";
    return Json::writeString(writer, value);
}

} // namespace ReportJson
