#include "Installer.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <jsoncpp/json/json.h>

#include <unistd.h>

#include <array>
#include <cstdlib>

namespace fs = std::filesystem;

namespace {

constexpr const char* kLauncherTemplate = R"SCRIPT(#!/bin/bash
# @APP_NAME@ Desktop Launcher for Fedora / Wayland / KDE Plasma

# Resolve symlinks to find the actual installation
SCRIPT_PATH="$0"
while [ -L "$SCRIPT_PATH" ]; do
    SCRIPT_DIR="$(cd "$(dirname "$SCRIPT_PATH")" && pwd)"
    SCRIPT_PATH="$(readlink "$SCRIPT_PATH")"
    [[ "$SCRIPT_PATH" != /* ]] && SCRIPT_PATH="$SCRIPT_DIR/$SCRIPT_PATH"
done

SCRIPT_DIR="$(cd "$(dirname "$SCRIPT_PATH")" && pwd)"
RESOURCES_DIR="$SCRIPT_DIR/../Resources"
cd "$RESOURCES_DIR" || exit 1

ELECTRON_ARGS=()
for arg in "$@"; do
    case "$arg" in
        --debug)
            export CLAUDE_TRACE=1
            echo "[@APP_NAME@] Debug trace logging enabled"
            ;;
        --devtools)
            ELECTRON_ARGS+=("--inspect")
            echo "[@APP_NAME@] DevTools enabled (--inspect)"
            ;;
        --isolate-network)
            export CLAUDE_ISOLATE_NETWORK=1
            echo "[@APP_NAME@] Network isolation enabled"
            ;;
        --x11)
            export ELECTRON_OZONE_PLATFORM_HINT=x11
            echo "[@APP_NAME@] Forcing X11 backend"
            ;;
        *)
            ELECTRON_ARGS+=("$arg")
            ;;
    esac
done

export ELECTRON_ENABLE_LOGGING=1

if [[ -n "${WAYLAND_DISPLAY:-}" ]] || [[ "${XDG_SESSION_TYPE:-}" == "wayland" ]]; then
    export ELECTRON_OZONE_PLATFORM_HINT="${ELECTRON_OZONE_PLATFORM_HINT:-wayland}"
    echo "[@APP_NAME@] Wayland session detected - Ozone platform: $ELECTRON_OZONE_PLATFORM_HINT"

    desktop_env="${XDG_CURRENT_DESKTOP:-}${XDG_SESSION_DESKTOP:-}${DESKTOP_SESSION:-}"
    if [[ "${desktop_env,,}" == *kde* ]] || [[ "${desktop_env,,}" == *plasma* ]]; then
        echo "[@APP_NAME@] KDE Plasma detected - enabling Wayland window decorations"
        ELECTRON_ARGS+=("--enable-features=WaylandWindowDecorations")
        ELECTRON_ARGS+=("--ozone-platform-hint=auto")
        ELECTRON_ARGS+=("--enable-wayland-ime")
    fi

    ELECTRON_ARGS+=("--enable-gpu-rasterization")
    ELECTRON_ARGS+=("--enable-zero-copy")
fi

mkdir -p ~/Library/Logs/@APP_NAME@

exec electron linux-loader.js "${ELECTRON_ARGS[@]}" 2>&1 | tee -a ~/Library/Logs/@APP_NAME@/startup.log
)SCRIPT";

constexpr std::array<const char*, 5> kElectronFlags = {
    "--ozone-platform-hint=auto",
    "--enable-features=WaylandWindowDecorations",
    "--enable-wayland-ime",
    "--enable-gpu-rasterization",
    "--enable-zero-copy"};

constexpr std::array<const char*, 8> kEnvironmentVariables = {
    "WAYLAND_DISPLAY",
    "XDG_SESSION_TYPE",
    "XDG_CURRENT_DESKTOP",
    "XDG_SESSION_DESKTOP",
    "DESKTOP_SESSION",
    "KDE_FULL_SESSION",
    "KDE_SESSION_VERSION",
    "ELECTRON_OZONE_PLATFORM_HINT"};

const fs::perms kPrivateDirPerms = fs::perms::owner_all;
const fs::perms kDirPerms = fs::perms(0755);
const fs::perms kFilePerms = fs::perms(0644);
const fs::perms kExecutablePerms = fs::perms(0755);

std::string replace_all(std::string text, const std::string& token, const std::string& value)
{
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
    return text;
}

std::string write_json(const Json::Value& root)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

void log_phase_header(const std::string& title)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("==== {} ====", title);
    }
}

} // namespace


InstallLayout InstallLayout::from(const InstallerSettings& settings)
{
    const fs::path& home = settings.get_home();
    const std::string& name = settings.get_app_name();

    InstallLayout layout;
    layout.launcher = settings.get_launcher_path();
    layout.user_data_dir = home / "Library" / "Application Support" / name;
    layout.user_log_dir = home / "Library" / "Logs" / name;
    layout.user_cache_dir = home / "Library" / "Caches" / name;
    layout.preferences_dir = home / "Library" / "Preferences";
    layout.electron_flags = home / ".config" / "electron-flags.conf";
    layout.electron25_flags = home / ".config" / "electron25-flags.conf";
    layout.kde_env_script = home / ".config" / "plasma-workspace" / "env" / "electron-wayland.sh";
    layout.desktop_file = home / ".local" / "share" / "applications" / (settings.get_command_name() + ".desktop");
    layout.owned_roots = {settings.get_install_dir(), layout.user_data_dir, layout.user_log_dir, layout.user_cache_dir};
    return layout;
}


Installer::Installer(const RunContext& context,
                     const InstallerSettings& settings,
                     Journal& journal,
                     GuardedMutator& mutator,
                     ApprovalGate& gate)
    : context_(context),
      settings_(settings),
      journal_(journal),
      mutator_(mutator),
      gate_(gate),
      layout_(InstallLayout::from(settings))
{
}


InstallOutcome Installer::run()
{
    auto logger = Logger::get_logger("core_logger");
    if (logger) {
        logger->info("{} Desktop installer for Fedora (Wayland + KDE Plasma)", settings_.get_app_name());
        if (context_.dry_run()) {
            logger->warn("DRY-RUN MODE: no changes will be made");
        }
        logger->debug("Run stamp: {}", context_.run_stamp());
    }

    preflight();
    journal_.ensure_created();
    if (logger) {
        logger->info("Backup directory: {}", context_.backup_run_dir().string());
        logger->info("Manifest file: {}", journal_.path().string());
    }

    using Phase = Approval (Installer::*)();
    constexpr std::array<Phase, 6> phases = {
        &Installer::install_application,
        &Installer::create_launcher,
        &Installer::configure_wayland,
        &Installer::setup_user_directories,
        &Installer::create_desktop_entry,
        &Installer::verify_and_summarize};

    for (const Phase phase : phases) {
        if ((this->*phase)() == Approval::Declined) {
            if (logger) {
                logger->warn("Installer stopped at user request");
                logger->info("Changes made so far can be undone with --reverse");
            }
            return InstallOutcome::Declined;
        }
    }
    return InstallOutcome::Completed;
}


void Installer::preflight() const
{
    log_phase_header("Phase 1/7: Pre-flight Validation");
    auto logger = Logger::get_logger("core_logger");

    const fs::path& staging = settings_.get_staging_dir();
    std::error_code ec;
    if (!fs::is_directory(staging, ec)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::PREFLIGHT_FAILED,
                            fmt::format("Application bundle not found at: {}", staging.string()),
                            staging.string());
    }
    if (fs::is_empty(staging, ec) || ec) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::PREFLIGHT_FAILED,
                            fmt::format("Application bundle is empty or unreadable: {}", staging.string()),
                            staging.string());
    }
    if (logger) {
        logger->info("Found application bundle: {}", staging.string());
    }

    if (::geteuid() == 0 && !settings_.get_allow_root()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::PREFLIGHT_FAILED,
                            "Do not run as root. The installer elevates individual commands when needed.",
                            "euid 0");
    }
    if (logger) {
        logger->info("Running as uid {} ({} will be used where needed)", ::geteuid(),
                     settings_.get_elevation_command());
    }

    log_environment_summary();
    if (logger) {
        logger->info("Pre-flight validation passed");
    }
}


void Installer::log_environment_summary() const
{
    auto logger = Logger::get_logger("core_logger");
    if (!logger) {
        return;
    }
    logger->info("Environment summary:");
    for (const char* name : kEnvironmentVariables) {
        const char* value = std::getenv(name);
        logger->debug("  {:<30} {}", fmt::format("{}:", name), value ? value : "<not set>");
    }
}


Approval Installer::install_application()
{
    log_phase_header("Phase 2/7: Install Application Structure");
    const fs::path& install_dir = settings_.get_install_dir();

    if (gate_.confirm("Application Installation",
                      fmt::format("Create {} and install application files (elevated where required).",
                                  install_dir.string())) == Approval::Declined) {
        return Approval::Declined;
    }

    mutator_.install_tree(settings_.get_staging_dir(), install_dir);
    for (const char* sub : {"MacOS", "Resources", "Frameworks"}) {
        create_missing_directory(install_dir / "Contents" / sub, kDirPerms);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Application structure ready: {}", install_dir.string());
    }
    return Approval::Approved;
}


Approval Installer::create_launcher()
{
    log_phase_header("Phase 3/7: Create Launcher Script");

    if (gate_.confirm("Launcher Creation",
                      fmt::format("Create the {} launch script with Wayland + KDE Plasma optimizations.",
                                  settings_.get_app_name())) == Approval::Declined) {
        return Approval::Declined;
    }

    mutator_.write_file(layout_.launcher, launcher_script(settings_.get_app_name()), kExecutablePerms);
    mutator_.create_symlink(settings_.get_bin_link(), layout_.launcher);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Launcher ready: {} -> {}", settings_.get_bin_link().string(), layout_.launcher.string());
    }
    return Approval::Approved;
}


Approval Installer::configure_wayland()
{
    log_phase_header("Phase 4/7: Configure Electron for Wayland");

    if (gate_.confirm("Wayland Configuration",
                      "Create Electron flags files and a KDE Plasma env script for Wayland.") == Approval::Declined) {
        return Approval::Declined;
    }

    mutator_.write_file(layout_.electron_flags, electron_flags_content(false), kFilePerms);
    mutator_.write_file(layout_.electron25_flags, electron_flags_content(true), kFilePerms);
    mutator_.write_file(layout_.kde_env_script, kde_env_script_content(), kExecutablePerms);
    return Approval::Approved;
}


Approval Installer::setup_user_directories()
{
    log_phase_header("Phase 5/7: Setup User Directories");

    if (gate_.confirm("User Directory Setup",
                      fmt::format("Create macOS-style directories under ~/Library for {} data, logs, and cache.",
                                  settings_.get_app_name())) == Approval::Declined) {
        return Approval::Declined;
    }

    // Roots are private; only directories created here get the mode applied.
    for (const auto& root : {layout_.user_data_dir, layout_.user_log_dir, layout_.user_cache_dir}) {
        create_missing_directory(root, kPrivateDirPerms);
    }
    for (const char* sub : {"Projects", "Conversations", "Claude Extensions", "Claude Extensions Settings",
                            "claude-code-vm", "vm_bundles", "blob_storage"}) {
        create_missing_directory(layout_.user_data_dir / sub, kDirPerms);
    }
    create_missing_directory(layout_.preferences_dir, kDirPerms);

    write_if_missing(layout_.user_data_dir / "config.json", default_config_json());
    write_if_missing(layout_.user_data_dir / "claude_desktop_config.json", default_desktop_config_json());
    return Approval::Approved;
}


Approval Installer::create_desktop_entry()
{
    log_phase_header("Phase 6/7: Create Desktop Entry");

    if (gate_.confirm("Desktop Entry",
                      fmt::format("Create a .desktop file so {} appears in your KDE application menu.",
                                  settings_.get_app_name())) == Approval::Declined) {
        return Approval::Declined;
    }

    mutator_.write_file(layout_.desktop_file, desktop_entry_content(settings_), kExecutablePerms);
    return Approval::Approved;
}


Approval Installer::verify_and_summarize()
{
    log_phase_header("Phase 7/7: Verification & Summary");
    auto logger = Logger::get_logger("core_logger");

    if (gate_.confirm("Final Verification",
                      "Verify installation integrity and show a summary.") == Approval::Declined) {
        return Approval::Declined;
    }

    missing_.clear();
    if (!context_.dry_run()) {
        check_artifact(layout_.launcher, false);
        check_artifact(settings_.get_bin_link(), false);
        check_artifact(layout_.electron_flags, false);
        check_artifact(layout_.electron25_flags, false);
        check_artifact(layout_.kde_env_script, false);
        check_artifact(layout_.user_data_dir, true);
        check_artifact(layout_.user_log_dir, true);
        check_artifact(layout_.user_cache_dir, true);
        check_artifact(layout_.desktop_file, false);
    }

    if (!logger) {
        return Approval::Approved;
    }
    if (missing_.empty()) {
        logger->info("Installation complete!");
    } else {
        logger->warn("Installation completed with {} warning(s) (see above)", missing_.size());
    }
    logger->info("Installation summary:");
    logger->info("  Application:    {}", settings_.get_install_dir().string());
    logger->info("  Data:           {}", layout_.user_data_dir.string());
    logger->info("  Logs:           {}", layout_.user_log_dir.string());
    logger->info("  Cache:          {}", layout_.user_cache_dir.string());
    logger->info("  Electron flags: {}", layout_.electron_flags.string());
    logger->info("  Desktop entry:  {}", layout_.desktop_file.string());
    logger->info("  Backups:        {}", context_.backup_run_dir().string());
    logger->info("  Manifest:       {}", journal_.path().string());
    logger->info("Launch: {} (options: --debug, --devtools, --x11)", settings_.get_command_name());
    logger->info("To undo this installation: fedora-installer --reverse");
    logger->info("Startup log: {}", (layout_.user_log_dir / "startup.log").string());
    return Approval::Approved;
}


void Installer::check_artifact(const fs::path& path, bool directory)
{
    auto logger = Logger::get_logger("core_logger");
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);

    bool ok = fs::exists(status);
    if (ok && directory) {
        ok = fs::is_directory(status);
    }
    if (!ok) {
        missing_.push_back(path);
        if (logger) {
            logger->warn("Missing:  {}", path.string());
        }
        return;
    }

    if (!logger) {
        return;
    }
    if (fs::is_symlink(status)) {
        logger->info("Verified: {} -> {}", path.string(), fs::read_symlink(path, ec).string());
    } else if (directory) {
        logger->info("Verified: {} (permissions: {})", path.string(), Utils::format_permissions(status.permissions()));
    } else {
        logger->info("Verified: {}", path.string());
    }
}


void Installer::create_missing_directory(const fs::path& dir, fs::perms perms)
{
    if (mutator_.is_present(dir)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("  Exists:  {}", dir.string());
        }
        return;
    }
    mutator_.create_directory(dir, perms);
}


void Installer::write_if_missing(const fs::path& path, const std::string& content)
{
    if (mutator_.is_present(path)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("{} already exists (preserved)", path.filename().string());
        }
        return;
    }
    mutator_.write_file(path, content, kFilePerms);
}


std::string Installer::launcher_script(const std::string& app_name)
{
    return replace_all(kLauncherTemplate, "@APP_NAME@", app_name);
}


std::string Installer::electron_flags_content(bool electron25)
{
    std::string content = electron25
        ? "# Electron 25+ flags for Wayland + KDE Plasma (Fedora)\n"
        : "# Electron flags for Wayland + KDE Plasma (Fedora)\n";
    content += "# Generated by fedora-installer\n";
    for (const char* flag : kElectronFlags) {
        content += flag;
        content += '\n';
    }
    return content;
}


std::string Installer::kde_env_script_content()
{
    return "#!/bin/sh\n"
           "# Set Electron Ozone platform for all Electron apps on Wayland under KDE Plasma\n"
           "# Generated by fedora-installer\n"
           "export ELECTRON_OZONE_PLATFORM_HINT=auto\n";
}


std::string Installer::desktop_entry_content(const InstallerSettings& settings)
{
    return fmt::format("[Desktop Entry]\n"
                       "Type=Application\n"
                       "Name={0}\n"
                       "Comment=AI assistant by Anthropic\n"
                       "Exec={1}\n"
                       "Icon={2}\n"
                       "Terminal=false\n"
                       "Categories=Utility;Development;Chat;\n"
                       "Keywords=AI;assistant;chat;anthropic;\n"
                       "StartupWMClass={0}\n",
                       settings.get_app_name(),
                       settings.get_bin_link().string(),
                       (settings.get_install_dir() / "Contents" / "Resources" / "icon.icns").string());
}


std::string Installer::default_config_json()
{
    Json::Value root(Json::objectValue);
    root["scale"] = 0;
    root["locale"] = "en-US";
    root["userThemeMode"] = "system";
    root["hasTrackedInitialActivation"] = false;
    return write_json(root);
}


std::string Installer::default_desktop_config_json()
{
    Json::Value root(Json::objectValue);
    root["preferences"]["chromeExtensionEnabled"] = true;
    return write_json(root);
}
