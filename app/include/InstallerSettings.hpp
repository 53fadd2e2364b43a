#ifndef INSTALLER_SETTINGS_HPP
#define INSTALLER_SETTINGS_HPP

#include "IniConfig.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Paths and policy knobs for one installer invocation.
 *
 * Defaults derive from the home and working directories; an INI file can
 * override any of them. Values are validated as they are applied and a bad
 * one raises CONFIG_INVALID_VALUE naming the offending key.
 */
class InstallerSettings
{
public:
    static InstallerSettings defaults_for(const std::filesystem::path& home,
                                          const std::filesystem::path& working_dir);

    // Defaults plus the config file found by locate_config_file(), if any.
    static InstallerSettings load(const std::filesystem::path& home,
                                  const std::filesystem::path& working_dir);

    // $FEDORA_INSTALLER_CONFIG, else <working_dir>/installer.ini when present.
    static std::optional<std::filesystem::path> locate_config_file(const std::filesystem::path& working_dir);

    void apply(const IniConfig& config);

    const std::string& get_app_name() const { return app_name; }
    std::string get_command_name() const;
    const std::filesystem::path& get_staging_dir() const { return staging_dir; }
    const std::filesystem::path& get_install_dir() const { return install_dir; }
    const std::filesystem::path& get_bin_link() const { return bin_link; }
    const std::filesystem::path& get_state_dir() const { return state_dir; }
    const std::filesystem::path& get_home() const { return home; }
    const std::vector<std::filesystem::path>& get_privileged_roots() const { return privileged_roots; }
    const std::string& get_elevation_command() const { return elevation_command; }
    const std::string& get_confirmation_phrase() const { return confirmation_phrase; }
    bool get_allow_root() const { return allow_root; }
    const std::string& get_log_level() const { return log_level; }

    // <install_dir>/Contents/MacOS/<name>
    std::filesystem::path get_launcher_path() const;

    // Config lines that were ignored or overridden, including unknown keys.
    const std::vector<std::string>& get_warnings() const { return warnings; }

private:
    InstallerSettings(std::filesystem::path home, std::filesystem::path working_dir);
    void derive_name_defaults();
    void collect_warnings(const IniConfig& config);

    std::filesystem::path working_dir;
    std::string app_name{"Claude"};
    std::filesystem::path staging_dir;
    std::filesystem::path install_dir;
    std::filesystem::path bin_link;
    std::filesystem::path state_dir;
    std::filesystem::path home;
    std::vector<std::filesystem::path> privileged_roots;
    std::string elevation_command{"sudo"};
    std::string confirmation_phrase{"REVERSE"};
    bool allow_root{false};
    std::string log_level{"debug"};
    std::vector<std::string> warnings;
};

#endif
