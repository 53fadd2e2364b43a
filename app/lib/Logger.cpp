#include "Logger.hpp"
#include "AppException.hpp"

#include <fmt/format.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace {
constexpr const char* kConsolePattern = "%^[%l]%$ %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";
constexpr const char* kLoggerNames[] = {"core_logger", "journal_logger"};
}


void Logger::setup_loggers(const LoggerOptions& options)
{
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (options.log_file) {
        std::filesystem::create_directories(options.log_file->parent_path());
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string(), false);
        file_sink->set_pattern(kFilePattern);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    for (const char* name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }
    console_sink->set_level(options.level);
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::shutdown()
{
    spdlog::shutdown();
}


bool Logger::is_known_level(const std::string& level)
{
    static constexpr std::array<const char*, 10> kLevels = {
        "trace", "debug", "verbose", "info", "warn", "warning", "err", "error", "critical", "off"};
    return std::any_of(kLevels.begin(), kLevels.end(),
                       [&level](const char* known) { return level == known; });
}


spdlog::level::level_enum Logger::resolve_level(const std::string& configured)
{
    std::string level = configured;
    if (const char* env_level = std::getenv("FEDORA_INSTALLER_LOG_LEVEL")) {
        level = env_level;
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (!is_known_level(level)) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                                fmt::format("Invalid value '{}' for FEDORA_INSTALLER_LOG_LEVEL: unknown log level",
                                            env_level),
                                "FEDORA_INSTALLER_LOG_LEVEL");
        }
    }
    if (level.empty() || level == "verbose") {
        return spdlog::level::debug;
    }
    return spdlog::level::from_str(level);
}
