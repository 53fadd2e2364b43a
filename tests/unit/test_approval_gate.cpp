#include <catch2/catch_test_macros.hpp>
#include "ApprovalGate.hpp"
#include "RunContext.hpp"
#include "TestHelpers.hpp"

#include <sstream>

namespace {

Approval ask(const std::string& input, bool dry_run = false)
{
    RunContext context(dry_run, false, "/tmp/unused-state", "20250101-120000");
    std::istringstream in(input);
    std::ostringstream out;
    ApprovalGate gate(context, in, out);
    return gate.confirm("Desktop Entry", "Create a .desktop file.");
}

} // namespace

TEST_CASE("ApprovalGate accepts yes in any letter case") {
    CHECK(ask("yes\n") == Approval::Approved);
    CHECK(ask("Y\n") == Approval::Approved);
    CHECK(ask("  YES  \r\n") == Approval::Approved);
}

TEST_CASE("ApprovalGate treats anything else as a decline") {
    CHECK(ask("no\n") == Approval::Declined);
    CHECK(ask("\n") == Approval::Declined);
    CHECK(ask("yess\n") == Approval::Declined);
    CHECK(ask("") == Approval::Declined);
}

TEST_CASE("ApprovalGate shows the phase banner and question") {
    RunContext context(false, false, "/tmp/unused-state", "20250101-120000");
    std::istringstream in("y\n");
    std::ostringstream out;
    ApprovalGate gate(context, in, out);

    gate.confirm("Wayland Configuration", "Create Electron flags files.");

    const std::string text = out.str();
    CHECK(text.find("APPROVAL REQUIRED: Wayland Configuration") != std::string::npos);
    CHECK(text.find("Create Electron flags files.") != std::string::npos);
    CHECK(text.find("Proceed with Wayland Configuration? [yes/no] > ") != std::string::npos);
}

TEST_CASE("ApprovalGate phrase must match exactly") {
    RunContext context(false, true, "/tmp/unused-state", "20250101-120000");
    std::ostringstream out;

    SECTION("exact phrase") {
        std::istringstream in("REVERSE\n");
        ApprovalGate gate(context, in, out);
        CHECK(gate.confirm_phrase("FINAL CONFIRMATION", "REVERSE") == Approval::Approved);
    }
    SECTION("wrong case") {
        std::istringstream in("reverse\n");
        ApprovalGate gate(context, in, out);
        CHECK(gate.confirm_phrase("FINAL CONFIRMATION", "REVERSE") == Approval::Declined);
    }
    SECTION("padding") {
        std::istringstream in(" REVERSE\n");
        ApprovalGate gate(context, in, out);
        CHECK(gate.confirm_phrase("FINAL CONFIRMATION", "REVERSE") == Approval::Declined);
    }
    SECTION("end of input") {
        std::istringstream in("");
        ApprovalGate gate(context, in, out);
        CHECK(gate.confirm_phrase("FINAL CONFIRMATION", "REVERSE") == Approval::Declined);
    }
}

TEST_CASE("ApprovalGate under dry-run approves without reading") {
    CapturedLog log;
    RunContext context(true, false, "/tmp/unused-state", "20250101-120000");
    std::istringstream in("no\n");
    std::ostringstream out;
    ApprovalGate gate(context, in, out);

    CHECK(gate.confirm("Launcher Creation", "Create the launcher.") == Approval::Approved);
    CHECK(gate.confirm_phrase("FINAL CONFIRMATION", "REVERSE") == Approval::Approved);

    std::string unread;
    std::getline(in, unread);
    CHECK(unread == "no");
    CHECK(log.contains("[DRY-RUN] Would proceed with: Launcher Creation"));
}

TEST_CASE("ApprovalGate logs each decision") {
    CapturedLog log;
    ask("yes\n");
    ask("no\n");
    CHECK(log.contains("Approved: Desktop Entry"));
    CHECK(log.contains("Declined: Desktop Entry"));
}
