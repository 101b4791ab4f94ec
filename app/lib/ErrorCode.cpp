#include "ErrorCode.hpp"

#include <sstream>
#include <utility>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    Code code;
    const char* name;
    const char* message;
    const char* resolution;
};

constexpr CatalogEntry kCatalog[] = {
    {Code::SUCCESS, "SUCCESS", "Operation completed.", ""},
    {Code::SOURCE_MISSING, "SOURCE_MISSING",
     "The source file no longer exists.",
     "Re-index the source drive or remove the file from the plan."},
    {Code::SOURCE_CHANGED, "SOURCE_CHANGED",
     "The source file changed since the plan was created.",
     "Re-index the file and create a new plan."},
    {Code::DESTINATION_MISMATCH, "DESTINATION_MISMATCH",
     "The destination content does not match the source hash.",
     "Check the destination drive for I/O errors and retry."},
    {Code::DESTINATION_EXISTS, "DESTINATION_EXISTS",
     "A different file already exists at the destination path.",
     "Move the existing file aside or choose another destination."},
    {Code::TRANSFER_FAILED, "TRANSFER_FAILED",
     "The file transfer did not complete.",
     "Check connectivity to the destination and retry."},
    {Code::HASH_FAILED, "HASH_FAILED",
     "The file content could not be hashed.",
     "Check read permissions and that the drive is mounted."},
    {Code::SURVIVOR_UNVERIFIED, "SURVIVOR_UNVERIFIED",
     "No verified surviving copy exists for this file.",
     "Mount the drive holding the original and retry, or re-plan."},
    {Code::INSUFFICIENT_SPACE, "INSUFFICIENT_SPACE",
     "Not enough free space on the destination drive.",
     "Free space on the destination or choose a larger drive."},
    {Code::DRIVE_OFFLINE, "DRIVE_OFFLINE",
     "A drive required by the batch is offline.",
     "Mount or reconnect the drive and resume the plan."},
    {Code::DRIVE_NOT_FOUND, "DRIVE_NOT_FOUND",
     "The referenced drive is not registered.",
     "Register the drive before planning against it."},
    {Code::INVALID_PLAN, "INVALID_PLAN",
     "The plan violates a safety precondition.",
     "Adjust the selection so every deleted file keeps a verified original."},
    {Code::PLAN_NOT_FOUND, "PLAN_NOT_FOUND",
     "The plan does not exist.",
     "List plans to find a valid plan id."},
    {Code::PLAN_NOT_APPROVED, "PLAN_NOT_APPROVED",
     "The plan must be approved before it can run.",
     "Approve the plan first."},
    {Code::PLAN_ALREADY_RUNNING, "PLAN_ALREADY_RUNNING",
     "Another run is active for this plan.",
     "Wait for the active run to finish."},
    {Code::INVALID_STATUS_TRANSITION, "INVALID_STATUS_TRANSITION",
     "The requested status change is not allowed.",
     "Check the current plan status."},
    {Code::IRREVERSIBLE, "IRREVERSIBLE",
     "Deleted files cannot be rolled back.",
     "Recover the content from a known hash-equal copy instead."},
    {Code::STEP_NOT_FOUND, "STEP_NOT_FOUND",
     "The step does not belong to the plan.",
     "Check the plan status for valid step ids."},
    {Code::RUN_LEASE_LOST, "RUN_LEASE_LOST",
     "Another run took over the plan while this run was working.",
     "Check the plan status; the other run owns the remaining steps."},
    {Code::DB_CONNECTION_FAILED, "DB_CONNECTION_FAILED",
     "Could not open the database.",
     "Check the database path and its permissions."},
    {Code::DB_QUERY_FAILED, "DB_QUERY_FAILED",
     "A database query failed.",
     "Check disk space and database integrity."},
    {Code::DB_INIT_FAILED, "DB_INIT_FAILED",
     "The database schema could not be initialized.",
     "Remove the database file if it is corrupted and re-index."},
    {Code::DB_TRANSACTION_FAILED, "DB_TRANSACTION_FAILED",
     "A database transaction failed.",
     "Retry the operation."},
    {Code::CONFIG_INVALID, "CONFIG_INVALID",
     "The configuration contains an invalid value.",
     "Correct the value in config.ini."},
    {Code::CONFIG_LOAD_FAILED, "CONFIG_LOAD_FAILED",
     "The configuration file could not be read.",
     "Check that config.ini exists and is readable."},
    {Code::CONFIG_SAVE_FAILED, "CONFIG_SAVE_FAILED",
     "The configuration file could not be written.",
     "Check permissions on the configuration directory."},
    {Code::FATAL, "FATAL",
     "The run stopped because of an unrecoverable error.",
     "Inspect the log, fix the cause and resume the plan."},
    {Code::EXTERNAL_TOOL_MISSING, "EXTERNAL_TOOL_MISSING",
     "A required external tool is not installed.",
     "Install the tool or set its path in config.ini."},
    {Code::UNKNOWN_ERROR, "UNKNOWN_ERROR",
     "An unknown error occurred.",
     "Check the log for details."},
};

const CatalogEntry& lookup(Code code)
{
    for (const auto& entry : kCatalog) {
        if (entry.code == code) {
            return entry;
        }
    }
    return kCatalog[sizeof(kCatalog) / sizeof(kCatalog[0]) - 1];
}

} // namespace

ErrorInfo::ErrorInfo(Code code,
                     std::string message,
                     std::string resolution,
                     std::string context)
    : code(code),
      message(std::move(message)),
      resolution(std::move(resolution)),
      context(std::move(context))
{
}

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + " " + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << ErrorCatalog::code_name(code) << ")\n"
        << message << "\n";
    if (!resolution.empty()) {
        oss << "Resolution: " << resolution << "\n";
    }
    if (!context.empty()) {
        oss << "Details: " << context << "\n";
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entry = lookup(code);
    return ErrorInfo(code, entry.message, entry.resolution, context);
}

const char* ErrorCatalog::code_name(Code code)
{
    return lookup(code).name;
}

bool is_retryable(Code code)
{
    switch (code) {
        case Code::SOURCE_MISSING:
        case Code::SOURCE_CHANGED:
        case Code::DESTINATION_MISMATCH:
        case Code::TRANSFER_FAILED:
        case Code::HASH_FAILED:
            return true;
        default:
            return false;
    }
}

bool is_fatal(Code code)
{
    switch (code) {
        case Code::DB_CONNECTION_FAILED:
        case Code::DB_QUERY_FAILED:
        case Code::DB_INIT_FAILED:
        case Code::DB_TRANSACTION_FAILED:
        case Code::RUN_LEASE_LOST:
        case Code::FATAL:
            return true;
        default:
            return false;
    }
}

Code code_from_int(int value)
{
    for (const auto& entry : kCatalog) {
        if (static_cast<int>(entry.code) == value) {
            return entry.code;
        }
    }
    return Code::UNKNOWN_ERROR;
}

} // namespace ErrorCodes
