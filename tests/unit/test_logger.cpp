#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "Logger.hpp"
#include "TestHelpers.hpp"

TEST_CASE("Logger::resolve_level uses the configured level without an override") {
    EnvVarGuard env("FEDORA_INSTALLER_LOG_LEVEL", std::nullopt);

    CHECK(Logger::resolve_level("debug") == spdlog::level::debug);
    CHECK(Logger::resolve_level("verbose") == spdlog::level::debug);
    CHECK(Logger::resolve_level("") == spdlog::level::debug);
    CHECK(Logger::resolve_level("warning") == spdlog::level::warn);
}

TEST_CASE("Logger::resolve_level lets the environment override the configured level") {
    EnvVarGuard env("FEDORA_INSTALLER_LOG_LEVEL", std::string("Info"));
    CHECK(Logger::resolve_level("debug") == spdlog::level::info);
}

TEST_CASE("Logger::resolve_level rejects a misspelled environment level") {
    EnvVarGuard env("FEDORA_INSTALLER_LOG_LEVEL", std::string("verbos"));

    try {
        Logger::resolve_level("debug");
        FAIL("expected CONFIG_INVALID_VALUE");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::CONFIG_INVALID_VALUE);
        CHECK(std::string(ex.what()).find("verbos") != std::string::npos);
    }
}

TEST_CASE("Logger::is_known_level accepts only lower-case level names") {
    CHECK(Logger::is_known_level("trace"));
    CHECK(Logger::is_known_level("err"));
    CHECK_FALSE(Logger::is_known_level("DEBUG"));
    CHECK_FALSE(Logger::is_known_level("chatty"));
}
