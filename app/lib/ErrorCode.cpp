#include "ErrorCode.hpp"

#include <fmt/format.h>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

CatalogEntry lookup(Code code)
{
    switch (code) {
        case Code::JOURNAL_NOT_FOUND:
            return {"No installation journal was found; there is nothing to reverse.",
                    "Run the installer once before requesting a reversal, or check the working directory."};
        case Code::JOURNAL_WRITE_FAILED:
            return {"Could not record the change in the installation journal.",
                    "Check free disk space and write permission on the backup directory."};
        case Code::JOURNAL_READ_FAILED:
            return {"Could not read the installation journal.",
                    "Check read permission on the journal file."};
        case Code::JOURNAL_CORRUPTED:
            return {"The installation journal contains an unreadable entry.",
                    "Inspect the journal file; every line must be kind|target[|backup]."};
        case Code::BACKUP_FAILED:
            return {"Could not back up an existing path before changing it; the change was not made.",
                    "Check free disk space and permissions, then re-run the installer."};
        case Code::BACKUP_NOT_FOUND:
            return {"The backup needed to restore this path is missing.",
                    "Restore the path manually or recover the backup directory."};
        case Code::MUTATION_FAILED:
            return {"A filesystem change failed after it was journaled.",
                    "Fix the cause and re-run; a reversal will treat the change as possibly applied."};
        case Code::PATH_INVALID:
            return {"The path cannot be recorded in the installation journal.",
                    "Use an absolute path without '|' or line breaks."};
        case Code::PRIVILEGED_COMMAND_FAILED:
            return {"An elevated command failed.",
                    "Check that the elevation command is available and that you authorised it."};
        case Code::CONFIG_LOAD_FAILED:
            return {"The installer configuration could not be loaded.",
                    "Check the configuration file path and its syntax."};
        case Code::CONFIG_INVALID_VALUE:
            return {"The installer configuration contains an invalid value.",
                    "Correct the value named in the details."};
        case Code::USAGE_UNKNOWN_ARGUMENT:
            return {"Unknown command-line argument.",
                    "Run with --help to list the supported options."};
        case Code::PREFLIGHT_FAILED:
            return {"Pre-flight validation failed.",
                    "Resolve the reported problem and run the installer again."};
        case Code::UNKNOWN_ERROR:
            break;
    }
    return {"An unexpected error occurred.", "See the log for details."};
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{}\n{}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error {} ({}): {}",
                                      static_cast<int>(code), ErrorCatalog::name(code), message);
    if (!context.empty()) {
        details += fmt::format("\nContext: {}", context);
    }
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const CatalogEntry entry = lookup(code);
    return ErrorInfo(code, entry.message, entry.resolution, context);
}

const char* ErrorCatalog::name(Code code)
{
    switch (code) {
        case Code::JOURNAL_NOT_FOUND: return "JOURNAL_NOT_FOUND";
        case Code::JOURNAL_WRITE_FAILED: return "JOURNAL_WRITE_FAILED";
        case Code::JOURNAL_READ_FAILED: return "JOURNAL_READ_FAILED";
        case Code::JOURNAL_CORRUPTED: return "JOURNAL_CORRUPTED";
        case Code::BACKUP_FAILED: return "BACKUP_FAILED";
        case Code::BACKUP_NOT_FOUND: return "BACKUP_NOT_FOUND";
        case Code::MUTATION_FAILED: return "MUTATION_FAILED";
        case Code::PATH_INVALID: return "PATH_INVALID";
        case Code::PRIVILEGED_COMMAND_FAILED: return "PRIVILEGED_COMMAND_FAILED";
        case Code::CONFIG_LOAD_FAILED: return "CONFIG_LOAD_FAILED";
        case Code::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case Code::USAGE_UNKNOWN_ARGUMENT: return "USAGE_UNKNOWN_ARGUMENT";
        case Code::PREFLIGHT_FAILED: return "PREFLIGHT_FAILED";
        case Code::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

} // namespace ErrorCodes
