#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "IniConfig.hpp"
#include "InstallerSettings.hpp"
#include "TestHelpers.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace {

IniConfig parse_ini(const std::string& text)
{
    IniConfig config;
    std::istringstream in(text);
    config.load(in);
    return config;
}

ErrorCodes::Code apply_error(const std::string& text)
{
    auto settings = InstallerSettings::defaults_for("/home/u", "/work");
    try {
        settings.apply(parse_ini(text));
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::UNKNOWN_ERROR;
}

} // namespace

TEST_CASE("IniConfig parses sections, comments and whitespace") {
    const auto config = parse_ini("; comment\n# another\n[Paths]\n  state_dir =  /var/state  \n[ Install ]\nallow_root=true\n");
    CHECK(config.getValue("Paths", "state_dir") == "/var/state");
    CHECK(config.getValue("Install", "allow_root") == "true");
    CHECK(config.hasValue("Install", "allow_root"));
    CHECK_FALSE(config.hasValue("Paths", "home"));
    CHECK(config.getValue("Paths", "home", "fallback") == "fallback");
}

TEST_CASE("IniConfig keeps malformed lines and repeated keys as problems") {
    IniConfig config;
    std::istringstream in("[Paths\nstate_dir = /a\nstate_dir = /b\njust words\n= value\n");
    config.load(in, "installer.ini");

    CHECK(config.getValue("", "state_dir") == "/b");
    REQUIRE(config.problems().size() == 4);
    CHECK(config.problems()[0] == "installer.ini:1: unterminated section header '[Paths'");
    CHECK(config.problems()[1] == "installer.ini:3: [] state_dir repeated; the later value wins");
    CHECK(config.problems()[2] == "installer.ini:4: expected 'key = value', got 'just words'");
    CHECK(config.problems()[3] == "installer.ini:5: expected 'key = value', got '= value'");
}

TEST_CASE("InstallerSettings warns about settings it does not understand") {
    auto settings = InstallerSettings::defaults_for("/home/u", "/work");
    settings.apply(parse_ini("[Paths]\ninstal_dir = /opt/Claude.app\nstate_dir = /var/state\n"
                             "[Reversal]\nconfirmation_phrase = GO\nconfirmation_phrase = UNDO\n"));

    CHECK(settings.get_install_dir() == "/Applications/Claude.app");
    CHECK(settings.get_state_dir() == "/var/state");
    CHECK(settings.get_confirmation_phrase() == "UNDO");
    REQUIRE(settings.get_warnings().size() == 2);
    CHECK(settings.get_warnings()[0] == "<input>:6: [Reversal] confirmation_phrase repeated; the later value wins");
    CHECK(settings.get_warnings()[1] == "Unknown setting [Paths] instal_dir ignored");
}

TEST_CASE("InstallerSettings defaults follow the shell installer") {
    const auto settings = InstallerSettings::defaults_for("/home/u", "/work");
    CHECK(settings.get_app_name() == "Claude");
    CHECK(settings.get_command_name() == "claude");
    CHECK(settings.get_staging_dir() == "/work/Claude.app");
    CHECK(settings.get_install_dir() == "/Applications/Claude.app");
    CHECK(settings.get_bin_link() == "/usr/local/bin/claude");
    CHECK(settings.get_state_dir() == "/work/.fedora-install-backups");
    CHECK(settings.get_home() == "/home/u");
    CHECK(settings.get_privileged_roots() == std::vector<fs::path>{"/Applications", "/usr"});
    CHECK(settings.get_elevation_command() == "sudo");
    CHECK(settings.get_confirmation_phrase() == "REVERSE");
    CHECK_FALSE(settings.get_allow_root());
    CHECK(settings.get_warnings().empty());
    CHECK(settings.get_launcher_path() == "/Applications/Claude.app/Contents/MacOS/Claude");
}

TEST_CASE("InstallerSettings derives paths from a configured name") {
    auto settings = InstallerSettings::defaults_for("/home/u", "/work");
    settings.apply(parse_ini("[Application]\nname = Sonnet\n[Paths]\nbin_link = /opt/bin/sonnet-app\n"));

    CHECK(settings.get_staging_dir() == "/work/Sonnet.app");
    CHECK(settings.get_install_dir() == "/Applications/Sonnet.app");
    CHECK(settings.get_bin_link() == "/opt/bin/sonnet-app");
    CHECK(settings.get_launcher_path() == "/Applications/Sonnet.app/Contents/MacOS/Sonnet");
}

TEST_CASE("InstallerSettings applies policy keys") {
    auto settings = InstallerSettings::defaults_for("/home/u", "/work");
    settings.apply(parse_ini("[Privilege]\nprivileged_roots = /opt, /srv/apps\nelevation_command = doas\n"
                             "[Reversal]\nconfirmation_phrase = UNDO-ALL\n"
                             "[Install]\nallow_root = yes\n[Logging]\nlevel = INFO\n"));

    CHECK(settings.get_privileged_roots() == std::vector<fs::path>{"/opt", "/srv/apps"});
    CHECK(settings.get_elevation_command() == "doas");
    CHECK(settings.get_confirmation_phrase() == "UNDO-ALL");
    CHECK(settings.get_allow_root());
    CHECK(settings.get_log_level() == "info");
}

TEST_CASE("InstallerSettings rejects invalid values") {
    using ErrorCodes::Code;
    CHECK(apply_error("[Paths]\nstate_dir = relative/dir\n") == Code::CONFIG_INVALID_VALUE);
    CHECK(apply_error("[Paths]\ninstall_dir =\n") == Code::CONFIG_INVALID_VALUE);
    CHECK(apply_error("[Reversal]\nconfirmation_phrase =\n") == Code::CONFIG_INVALID_VALUE);
    CHECK(apply_error("[Install]\nallow_root = maybe\n") == Code::CONFIG_INVALID_VALUE);
    CHECK(apply_error("[Logging]\nlevel = chatty\n") == Code::CONFIG_INVALID_VALUE);
    CHECK(apply_error("[Privilege]\nprivileged_roots = /usr, opt\n") == Code::CONFIG_INVALID_VALUE);
    CHECK(apply_error("[Application]\nname = a/b\n") == Code::CONFIG_INVALID_VALUE);
}

TEST_CASE("InstallerSettings::load finds the config file") {
    TempDir temp;

    SECTION("no file means defaults") {
        EnvVarGuard env("FEDORA_INSTALLER_CONFIG", std::nullopt);
        const auto settings = InstallerSettings::load("/home/u", temp.path());
        CHECK(settings.get_state_dir() == temp.path() / ".fedora-install-backups");
    }

    SECTION("installer.ini in the working directory") {
        EnvVarGuard env("FEDORA_INSTALLER_CONFIG", std::nullopt);
        write_text_file(temp.path() / "installer.ini", "[Paths]\nstate_dir = /var/lib/fedora-installer\n");
        const auto settings = InstallerSettings::load("/home/u", temp.path());
        CHECK(settings.get_state_dir() == "/var/lib/fedora-installer");
    }

    SECTION("environment variable wins") {
        const fs::path custom = temp.path() / "custom.ini";
        write_text_file(custom, "[Reversal]\nconfirmation_phrase = GO\n");
        write_text_file(temp.path() / "installer.ini", "[Reversal]\nconfirmation_phrase = IGNORED\n");
        EnvVarGuard env("FEDORA_INSTALLER_CONFIG", custom.string());
        CHECK(InstallerSettings::load("/home/u", temp.path()).get_confirmation_phrase() == "GO");
    }

    SECTION("missing explicit file is an error") {
        EnvVarGuard env("FEDORA_INSTALLER_CONFIG", (temp.path() / "absent.ini").string());
        try {
            InstallerSettings::load("/home/u", temp.path());
            FAIL("expected CONFIG_LOAD_FAILED");
        } catch (const ErrorCodes::AppException& ex) {
            CHECK(ex.get_error_code() == ErrorCodes::Code::CONFIG_LOAD_FAILED);
        }
    }
}
