#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/logger.h>
#include <spdlog/common.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct LoggerOptions {
    spdlog::level::level_enum level{spdlog::level::debug};
    // Audit file; left empty under dry-run so nothing is written.
    std::optional<std::filesystem::path> log_file;
};

class Logger {
public:
    static void setup_loggers(const LoggerOptions& options);
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static void shutdown();

    // spdlog level names plus "verbose" and "warning", lower case.
    static bool is_known_level(const std::string& level);

    /**
     * @brief FEDORA_INSTALLER_LOG_LEVEL wins over the configured level.
     * @throws ErrorCodes::AppException CONFIG_INVALID_VALUE for an unknown
     *         level in the environment.
     */
    static spdlog::level::level_enum resolve_level(const std::string& configured);
};

#endif
