#include "RunContext.hpp"

#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <utility>

namespace {
constexpr const char* kJournalFileName = "manifest.txt";
constexpr const char* kLogFileName = "install.log";
}

RunContext::RunContext(bool dry_run,
                       bool reverse_mode,
                       std::filesystem::path state_dir,
                       std::string run_stamp)
    : dry_run_(dry_run),
      reverse_mode_(reverse_mode),
      state_dir_(std::move(state_dir)),
      run_stamp_(std::move(run_stamp))
{
}

std::filesystem::path RunContext::journal_path() const
{
    return state_dir_ / kJournalFileName;
}

std::filesystem::path RunContext::backup_run_dir() const
{
    return state_dir_ / run_stamp_;
}

std::filesystem::path RunContext::log_path() const
{
    return state_dir_ / kLogFileName;
}

std::string RunContext::current_stamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    return fmt::format("{:%Y%m%d-%H%M%S}", local);
}
