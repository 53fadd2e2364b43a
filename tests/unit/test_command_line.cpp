#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "CommandLine.hpp"

TEST_CASE("parse_command_line defaults to a forward run") {
    const auto args = parse_command_line(std::vector<std::string>{});
    CHECK_FALSE(args.dry_run);
    CHECK_FALSE(args.reverse);
    CHECK_FALSE(args.show_help);
}

TEST_CASE("parse_command_line accepts every reverse alias") {
    for (const char* alias : {"--reverse", "--rollback", "--undo"}) {
        CHECK(parse_command_line(std::vector<std::string>{alias}).reverse);
    }
}

TEST_CASE("parse_command_line combines dry-run with reverse") {
    const auto args = parse_command_line(std::vector<std::string>{"--reverse", "--dry-run"});
    CHECK(args.reverse);
    CHECK(args.dry_run);
}

TEST_CASE("parse_command_line rejects unknown arguments") {
    try {
        parse_command_line(std::vector<std::string>{"--dry-run", "--force"});
        FAIL("expected USAGE_UNKNOWN_ARGUMENT");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::USAGE_UNKNOWN_ARGUMENT);
        CHECK(ex.get_context() == "--force");
    }
}

TEST_CASE("parse_command_line lets help win over unknown arguments") {
    const auto args = parse_command_line(std::vector<std::string>{"--bogus", "-h"});
    CHECK(args.show_help);
}

TEST_CASE("parse_command_line reads argv after the program name") {
    char program[] = "fedora-installer";
    char dry_run[] = "--dry-run";
    char* argv[] = {program, dry_run, nullptr};
    CHECK(parse_command_line(2, argv).dry_run);
}

TEST_CASE("usage_text lists every option") {
    const std::string text = usage_text("fedora-installer");
    for (const char* option : {"--dry-run", "--reverse", "--rollback", "--undo", "--help"}) {
        CHECK(text.find(option) != std::string::npos);
    }
    CHECK(text.rfind("Usage: fedora-installer", 0) == 0);
}
