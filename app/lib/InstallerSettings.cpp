#include "InstallerSettings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string trim_copy(std::string value)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::vector<std::string> parse_list(const std::string& value)
{
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string key_name(const std::string& section, const std::string& key)
{
    return fmt::format("[{}] {}", section, key);
}

[[noreturn]] void invalid_value(const std::string& section, const std::string& key,
                                const std::string& value, const std::string& reason)
{
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("Invalid value '{}' for {}: {}", value, key_name(section, key), reason),
                        key_name(section, key));
}

fs::path absolute_path_value(const IniConfig& config, const std::string& section,
                             const std::string& key, const fs::path& fallback)
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const std::string value = config.getValue(section, key);
    fs::path path(value);
    if (value.empty() || !path.is_absolute()) {
        invalid_value(section, key, value, "an absolute path is required");
    }
    return path.lexically_normal();
}

std::string non_empty_value(const IniConfig& config, const std::string& section,
                            const std::string& key, const std::string& fallback)
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const std::string value = config.getValue(section, key);
    if (value.empty()) {
        invalid_value(section, key, value, "the value must not be empty");
    }
    return value;
}

bool bool_value(const IniConfig& config, const std::string& section,
                const std::string& key, bool fallback)
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const std::string value = to_lower_copy(config.getValue(section, key));
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }
    invalid_value(section, key, config.getValue(section, key), "expected true or false");
}

// Keys apply() understands, as "Section.key".
constexpr const char* kKnownKeys[] = {
    "Application.name",
    "Paths.staging_dir", "Paths.install_dir", "Paths.bin_link", "Paths.state_dir", "Paths.home",
    "Privilege.privileged_roots", "Privilege.elevation_command",
    "Reversal.confirmation_phrase",
    "Install.allow_root",
    "Logging.level"};

bool is_known_key(const std::string& section, const std::string& key)
{
    const std::string qualified = section + "." + key;
    return std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys),
                       [&qualified](const char* known) { return qualified == known; });
}

} // namespace


InstallerSettings::InstallerSettings(fs::path home_dir, fs::path working)
    : working_dir(std::move(working)),
      state_dir(working_dir / ".fedora-install-backups"),
      home(std::move(home_dir)),
      privileged_roots{"/Applications", "/usr"}
{
    derive_name_defaults();
}


void InstallerSettings::derive_name_defaults()
{
    staging_dir = working_dir / (app_name + ".app");
    install_dir = fs::path("/Applications") / (app_name + ".app");
    bin_link = fs::path("/usr/local/bin") / get_command_name();
}


InstallerSettings InstallerSettings::defaults_for(const fs::path& home, const fs::path& working_dir)
{
    return InstallerSettings(home, working_dir);
}


std::optional<fs::path> InstallerSettings::locate_config_file(const fs::path& working_dir)
{
    if (const char* env_path = std::getenv("FEDORA_INSTALLER_CONFIG")) {
        if (*env_path != '\0') {
            return fs::path(env_path);
        }
    }
    const fs::path candidate = working_dir / "installer.ini";
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}


InstallerSettings InstallerSettings::load(const fs::path& home, const fs::path& working_dir)
{
    InstallerSettings settings = defaults_for(home, working_dir);
    const auto config_file = locate_config_file(working_dir);
    if (!config_file) {
        return settings;
    }

    IniConfig config;
    if (!config.load(config_file->string())) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_LOAD_FAILED, config_file->string());
    }
    settings.apply(config);
    return settings;
}


void InstallerSettings::apply(const IniConfig& config)
{
    collect_warnings(config);

    if (config.hasValue("Application", "name")) {
        const std::string name = config.getValue("Application", "name");
        if (name.empty() || name.find('/') != std::string::npos) {
            invalid_value("Application", "name", name, "a non-empty name without '/' is required");
        }
        app_name = name;
        derive_name_defaults();
    }

    staging_dir = absolute_path_value(config, "Paths", "staging_dir", staging_dir);
    install_dir = absolute_path_value(config, "Paths", "install_dir", install_dir);
    bin_link = absolute_path_value(config, "Paths", "bin_link", bin_link);
    state_dir = absolute_path_value(config, "Paths", "state_dir", state_dir);
    home = absolute_path_value(config, "Paths", "home", home);

    if (config.hasValue("Privilege", "privileged_roots")) {
        std::vector<fs::path> roots;
        for (const auto& item : parse_list(config.getValue("Privilege", "privileged_roots"))) {
            fs::path root(item);
            if (!root.is_absolute()) {
                invalid_value("Privilege", "privileged_roots", item, "roots must be absolute paths");
            }
            roots.push_back(root.lexically_normal());
        }
        privileged_roots = std::move(roots);
    }
    elevation_command = non_empty_value(config, "Privilege", "elevation_command", elevation_command);

    confirmation_phrase = non_empty_value(config, "Reversal", "confirmation_phrase", confirmation_phrase);
    allow_root = bool_value(config, "Install", "allow_root", allow_root);

    if (config.hasValue("Logging", "level")) {
        const std::string level = to_lower_copy(config.getValue("Logging", "level"));
        if (!Logger::is_known_level(level)) {
            invalid_value("Logging", "level", level, "unknown log level");
        }
        log_level = level;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Settings: install_dir={}, state_dir={}, privileged roots={}",
                      install_dir.string(), state_dir.string(), privileged_roots.size());
    }
}


std::string InstallerSettings::get_command_name() const
{
    return to_lower_copy(app_name);
}


fs::path InstallerSettings::get_launcher_path() const
{
    return install_dir / "Contents" / "MacOS" / app_name;
}


void InstallerSettings::collect_warnings(const IniConfig& config)
{
    warnings.insert(warnings.end(), config.problems().begin(), config.problems().end());
    for (const auto& [section, key] : config.entries()) {
        if (!is_known_key(section, key)) {
            warnings.push_back(fmt::format("Unknown setting {} ignored", key_name(section, key)));
        }
    }
}
