#include "CommandLine.hpp"
#include "AppException.hpp"

#include <fmt/format.h>

#include <optional>

ParsedArguments parse_command_line(const std::vector<std::string>& args)
{
    ParsedArguments parsed;
    std::optional<std::string> unknown;
    for (const auto& arg : args) {
        if (arg == "--dry-run") {
            parsed.dry_run = true;
        } else if (arg == "--reverse" || arg == "--rollback" || arg == "--undo") {
            parsed.reverse = true;
        } else if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
        } else if (!unknown) {
            unknown = arg;
        }
    }
    // --help wins over anything else on the line.
    if (unknown && !parsed.show_help) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::USAGE_UNKNOWN_ARGUMENT,
                            fmt::format("Unknown argument: {}", *unknown), *unknown);
    }
    return parsed;
}


ParsedArguments parse_command_line(int argc, char** argv)
{
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}


std::string usage_text(const std::string& program_name)
{
    return fmt::format(
        "Usage: {0} [OPTIONS]\n"
        "\n"
        "Install the desktop application on Fedora/KDE with every filesystem\n"
        "change journaled and backed up so it can be reversed.\n"
        "\n"
        "Options:\n"
        "  --dry-run                     Show what would be done without changing anything\n"
        "  --reverse, --rollback, --undo Reverse a previous installation from its manifest\n"
        "  -h, --help                    Show this help message\n"
        "\n"
        "Environment:\n"
        "  FEDORA_INSTALLER_CONFIG       Path of an INI file overriding the defaults\n"
        "  FEDORA_INSTALLER_LOG_LEVEL    trace, debug, info, warn, error or off\n"
        "\n"
        "Examples:\n"
        "  {0} --dry-run            # Preview the installation\n"
        "  {0}                      # Install with approval prompts\n"
        "  {0} --reverse --dry-run  # Preview the reversal\n"
        "  {0} --reverse            # Undo the installation\n",
        program_name);
}
