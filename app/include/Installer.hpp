#ifndef INSTALLER_HPP
#define INSTALLER_HPP

#include "ApprovalGate.hpp"
#include "GuardedMutator.hpp"
#include "InstallerSettings.hpp"
#include "Journal.hpp"
#include "RunContext.hpp"

#include <filesystem>
#include <string>
#include <vector>

enum class InstallOutcome {
    Completed,
    Declined
};

// Every location the installer writes to, derived from the settings.
struct InstallLayout {
    std::filesystem::path launcher;
    std::filesystem::path user_data_dir;
    std::filesystem::path user_log_dir;
    std::filesystem::path user_cache_dir;
    std::filesystem::path preferences_dir;
    std::filesystem::path electron_flags;
    std::filesystem::path electron25_flags;
    std::filesystem::path kde_env_script;
    std::filesystem::path desktop_file;
    // Trees created wholly by the install; missing parents inside them are journaled.
    std::vector<std::filesystem::path> owned_roots;

    static InstallLayout from(const InstallerSettings& settings);
};

/**
 * @brief Runs the installation phases in order, each behind an approval gate.
 *
 * All filesystem changes go through the GuardedMutator so that a later
 * reversal can undo them. A declined gate ends the run without touching the
 * remaining phases.
 */
class Installer {
public:
    Installer(const RunContext& context,
              const InstallerSettings& settings,
              Journal& journal,
              GuardedMutator& mutator,
              ApprovalGate& gate);

    InstallOutcome run();

    // @throws ErrorCodes::AppException PREFLIGHT_FAILED
    void preflight() const;

    Approval install_application();
    Approval create_launcher();
    Approval configure_wayland();
    Approval setup_user_directories();
    Approval create_desktop_entry();
    Approval verify_and_summarize();

    // Missing artifacts found by the last verification.
    const std::vector<std::filesystem::path>& missing_artifacts() const { return missing_; }
    const InstallLayout& layout() const { return layout_; }

    static std::string launcher_script(const std::string& app_name);
    static std::string electron_flags_content(bool electron25);
    static std::string kde_env_script_content();
    static std::string desktop_entry_content(const InstallerSettings& settings);
    static std::string default_config_json();
    static std::string default_desktop_config_json();

private:
    void log_environment_summary() const;
    void create_missing_directory(const std::filesystem::path& dir, std::filesystem::perms perms);
    void write_if_missing(const std::filesystem::path& path, const std::string& content);
    void check_artifact(const std::filesystem::path& path, bool directory);

    const RunContext& context_;
    const InstallerSettings& settings_;
    Journal& journal_;
    GuardedMutator& mutator_;
    ApprovalGate& gate_;
    InstallLayout layout_;
    std::vector<std::filesystem::path> missing_;
};

#endif
