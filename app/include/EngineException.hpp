#ifndef ENGINEEXCEPTION_HPP
#define ENGINEEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>

namespace ErrorCodes {

// Exception carrying an engine error code and its catalog entry
class EngineException : public std::runtime_error {
public:
    explicit EngineException(Code code, const std::string& context = "")
        : std::runtime_error(build_message(code, context)),
          error_code_(code),
          error_info_(ErrorCatalog::get_error_info(code, context)) {}

    // Custom message, catalog resolution
    EngineException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(custom_message),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    Code get_error_code() const noexcept { return error_code_; }
    const ErrorInfo& get_error_info() const noexcept { return error_info_; }
    std::string get_user_message() const { return error_info_.get_user_message(); }
    std::string get_full_details() const { return error_info_.get_full_details(); }
    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

    bool retryable() const noexcept { return is_retryable(error_code_); }
    bool fatal() const noexcept { return is_fatal(error_code_); }

private:
    static std::string build_message(Code code, const std::string& context)
    {
        auto info = ErrorCatalog::get_error_info(code, context);
        if (context.empty()) {
            return info.message;
        }
        return info.message + " (" + context + ")";
    }

    Code error_code_;
    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#define THROW_ENGINE_ERROR(code, context) \
    throw ErrorCodes::EngineException(code, context)

#define THROW_ENGINE_ERROR_MSG(code, message, context) \
    throw ErrorCodes::EngineException(code, message, context)

#endif // ENGINEEXCEPTION_HPP
