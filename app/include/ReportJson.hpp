#ifndef REPORTJSON_HPP
#define REPORTJSON_HPP

#include "EngineException.hpp"
#include "MigrationService.hpp"

#ifdef __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <string>

// JSON renderings of the engine's structured reports.
namespace ReportJson {

Json::Value to_json(const MigrationPlan& plan);
Json::Value to_json(const StepReport& step);
Json::Value to_json(const BatchAdmission& admission);
Json::Value to_json(const ExecutionReport& report);
Json::Value to_json(const RollbackReport& report);
Json::Value to_json(const PlanStatusReport& report);
Json::Value error_to_json(const ErrorCodes::EngineException& ex);

std::string write(const Json::Value& value, bool pretty = true);

} // namespace ReportJson

#endif
