#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Numeric error codes grouped by subsystem.
enum class Code {
    // Journal (1000-1099)
    JOURNAL_NOT_FOUND = 1000,
    JOURNAL_WRITE_FAILED = 1001,
    JOURNAL_READ_FAILED = 1002,
    JOURNAL_CORRUPTED = 1003,

    // Backup store (1100-1199)
    BACKUP_FAILED = 1100,
    BACKUP_NOT_FOUND = 1101,

    // Mutations (1200-1299)
    MUTATION_FAILED = 1200,
    PATH_INVALID = 1201,
    PRIVILEGED_COMMAND_FAILED = 1202,

    // Configuration (1500-1599)
    CONFIG_LOAD_FAILED = 1500,
    CONFIG_INVALID_VALUE = 1501,

    // Usage (1600-1699)
    USAGE_UNKNOWN_ARGUMENT = 1600,

    // Installation (1800-1899)
    PREFLIGHT_FAILED = 1800,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message plus resolution, suitable for the terminal.
    std::string get_user_message() const;

    // Code, message, context and resolution in one block.
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static const char* name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
