#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>

namespace ErrorCodes {

// Installer exception carrying a catalog code and the path/action context.
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : std::runtime_error(build_what(ErrorCatalog::get_error_info(code, context))),
          error_code_(code),
          error_info_(ErrorCatalog::get_error_info(code, context)) {}

    // Custom message replaces the catalog text; the resolution is kept.
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(build_what(ErrorInfo(code, custom_message, "", context))),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    Code get_error_code() const noexcept { return error_code_; }
    const ErrorInfo& get_error_info() const noexcept { return error_info_; }
    const std::string& get_context() const noexcept { return error_info_.context; }

    std::string get_user_message() const { return error_info_.get_user_message(); }
    std::string get_full_details() const { return error_info_.get_full_details(); }

    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

private:
    static std::string build_what(const ErrorInfo& info)
    {
        if (info.context.empty()) {
            return info.message;
        }
        return info.message + " (" + info.context + ")";
    }

    Code error_code_;
    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
