#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Engine error codes, grouped by range:
//   Step (1000-1099), Space/Drive (1100-1199), Plan (1200-1299),
//   Database (1300-1399), Configuration (1500-1599), System (1700-1799)
enum class Code {
    SUCCESS = 0,

    SOURCE_MISSING = 1000,
    SOURCE_CHANGED = 1001,
    DESTINATION_MISMATCH = 1002,
    DESTINATION_EXISTS = 1003,
    TRANSFER_FAILED = 1004,
    HASH_FAILED = 1005,
    SURVIVOR_UNVERIFIED = 1006,

    INSUFFICIENT_SPACE = 1100,
    DRIVE_OFFLINE = 1101,
    DRIVE_NOT_FOUND = 1102,

    INVALID_PLAN = 1200,
    PLAN_NOT_FOUND = 1201,
    PLAN_NOT_APPROVED = 1202,
    PLAN_ALREADY_RUNNING = 1203,
    INVALID_STATUS_TRANSITION = 1204,
    IRREVERSIBLE = 1205,
    STEP_NOT_FOUND = 1206,
    RUN_LEASE_LOST = 1207,

    DB_CONNECTION_FAILED = 1300,
    DB_QUERY_FAILED = 1301,
    DB_INIT_FAILED = 1302,
    DB_TRANSACTION_FAILED = 1303,

    CONFIG_INVALID = 1500,
    CONFIG_LOAD_FAILED = 1501,
    CONFIG_SAVE_FAILED = 1502,

    FATAL = 1700,
    EXTERNAL_TOOL_MISSING = 1701,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo(Code code,
              std::string message,
              std::string resolution,
              std::string context = "");

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Code, name, message, resolution and context on separate lines
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static const char* code_name(Code code);
};

// Step failures that may re-enter InProgress under the run's retry budget.
bool is_retryable(Code code);

// Store failures and lost run leases halt a run entirely.
bool is_fatal(Code code);

Code code_from_int(int value);

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
