#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>

namespace ErrorCodes {

// Exception carrying a catalog error code. what() returns the specific message;
// get_user_message() appends the catalog resolution hint.
class AppException : public std::runtime_error {
public:
    // Catalog message, optional technical context
    explicit AppException(Code code, const std::string& context = "")
        : AppException(code, ErrorCatalog::get_error_info(code, context)) {}

    // Custom message overriding the catalog text; resolution stays from the catalog
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(custom_message),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    Code get_error_code() const noexcept { return error_code_; }
    const ErrorInfo& get_error_info() const noexcept { return error_info_; }
    std::string get_user_message() const { return error_info_.get_user_message(); }
    std::string get_full_details() const { return error_info_.get_full_details(); }
    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

private:
    AppException(Code code, ErrorInfo info)
        : std::runtime_error(info.message),
          error_code_(code),
          error_info_(std::move(info)) {}

    Code error_code_;
    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#endif // APPEXCEPTION_HPP
