#include "AppException.hpp"
#include "ApprovalGate.hpp"
#include "BackupStore.hpp"
#include "CommandLine.hpp"
#include "CommandRunner.hpp"
#include "FileOperations.hpp"
#include "GuardedMutator.hpp"
#include "Installer.hpp"
#include "InstallerSettings.hpp"
#include "Journal.hpp"
#include "Logger.hpp"
#include "PrivilegeRouter.hpp"
#include "ReversalEngine.hpp"
#include "RunContext.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>


namespace {

void report_fatal(const std::string& message)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->critical("{}", message);
        logger->flush();
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

// An invalid FEDORA_INSTALLER_LOG_LEVEL propagates as CONFIG_INVALID_VALUE.
bool initialize_loggers(const RunContext& context, const InstallerSettings& settings)
{
    LoggerOptions options;
    options.level = Logger::resolve_level(settings.get_log_level());
    try {
        if (!context.dry_run()) {
            options.log_file = context.log_path();
        }
        Logger::setup_loggers(options);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

int run_reversal(const RunContext& context,
                 const InstallerSettings& settings,
                 const Journal& journal,
                 PrivilegeRouter& router,
                 ApprovalGate& gate)
{
    ReversalOptions options;
    options.confirmation_phrase = settings.get_confirmation_phrase();
    options.cli_symlink = settings.get_bin_link();
    options.launcher_path = settings.get_launcher_path();
    options.backup_root = settings.get_state_dir();

    ReversalEngine engine(context, journal, router, gate, std::move(options));
    const ReversalReport report = engine.run();
    return report.failures.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run_application(const ParsedArguments& args)
{
    const InstallerSettings settings =
        InstallerSettings::load(Utils::home_directory(), std::filesystem::current_path());
    const RunContext context(args.dry_run, args.reverse, settings.get_state_dir());
    if (!initialize_loggers(context, settings)) {
        return EXIT_FAILURE;
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        for (const auto& warning : settings.get_warnings()) {
            logger->warn("Config: {}", warning);
        }
    }

    ProcessRunner runner;
    PrivilegeRouter router(settings.get_privileged_roots(),
                           std::make_unique<DirectFileOperations>(),
                           std::make_unique<ElevatedFileOperations>(settings.get_elevation_command(), runner));
    Journal journal(context);
    ApprovalGate gate(context, std::cin, std::cout);

    if (context.reverse_mode()) {
        return run_reversal(context, settings, journal, router, gate);
    }

    BackupStore backups(context);
    GuardedMutator mutator(context, journal, backups, router, InstallLayout::from(settings).owned_roots);
    Installer installer(context, settings, journal, mutator, gate);
    // A declined phase is a normal ending.
    installer.run();
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char** argv)
{
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "fedora-installer";

    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const ErrorCodes::AppException& e) {
        std::fprintf(stderr, "%s\n\n%s", e.get_user_message().c_str(), usage_text(program).c_str());
        return EXIT_FAILURE;
    }

    if (args.show_help) {
        std::cout << usage_text(program);
        return EXIT_SUCCESS;
    }

    int exit_code = EXIT_FAILURE;
    try {
        exit_code = run_application(args);
    } catch (const ErrorCodes::AppException& e) {
        report_fatal(e.get_full_details());
    } catch (const std::exception& e) {
        report_fatal(std::string("Unexpected error: ") + e.what());
    }

    Logger::shutdown();
    return exit_code;
}
