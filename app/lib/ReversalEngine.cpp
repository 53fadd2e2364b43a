#include "ReversalEngine.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string plan_line(const MutationRecord& record)
{
    switch (record.kind()) {
        case MutationKind::FileCreated:
            return fmt::format("[DELETE]  {}  (was newly created)", record.target_path().string());
        case MutationKind::DirCreated:
            return fmt::format("[RMDIR]   {}  (was newly created)", record.target_path().string());
        case MutationKind::FileModified:
        case MutationKind::DirModified:
            return fmt::format("[RESTORE] {}  (from {})", record.target_path().string(),
                               record.backup_path()->string());
    }
    return fmt::format("[UNKNOWN] {}", record.target_path().string());
}

} // namespace


std::string to_string(ReversalState state)
{
    switch (state) {
        case ReversalState::Pending: return "Pending";
        case ReversalState::Loaded: return "Loaded";
        case ReversalState::Previewed: return "Previewed";
        case ReversalState::Confirmed: return "Confirmed";
        case ReversalState::Executing: return "Executing";
        case ReversalState::Done: return "Done";
        case ReversalState::Aborted: return "Aborted";
    }
    return "Unknown";
}


ReversalEngine::ReversalEngine(const RunContext& context,
                               const Journal& journal,
                               PrivilegeRouter& router,
                               ApprovalGate& gate,
                               ReversalOptions options)
    : context_(context),
      journal_(journal),
      router_(router),
      gate_(gate),
      options_(std::move(options))
{
}


void ReversalEngine::require_state(ReversalState expected, const char* operation) const
{
    if (state_ != expected) {
        throw std::logic_error(fmt::format("ReversalEngine::{} requires state {}, current state is {}",
                                           operation, to_string(expected), to_string(state_)));
    }
}


void ReversalEngine::load()
{
    require_state(ReversalState::Pending, "load");
    records_ = journal_.read_all();
    state_ = ReversalState::Loaded;

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Manifest file: {}", journal_.path().string());
        logger->debug("{} record(s) loaded", records_.size());
    }
}


std::vector<std::string> ReversalEngine::preview()
{
    require_state(ReversalState::Loaded, "preview");
    std::vector<std::string> lines;
    lines.reserve(records_.size());
    for (const auto& record : records_) {
        lines.push_back(plan_line(record));
    }
    state_ = ReversalState::Previewed;
    return lines;
}


bool ReversalEngine::confirm()
{
    require_state(ReversalState::Previewed, "confirm");

    const std::string description =
        fmt::format("This will undo {} recorded operation(s).", records_.size());
    if (gate_.confirm("Reversal", description) == Approval::Declined) {
        state_ = ReversalState::Aborted;
        return false;
    }
    if (gate_.confirm_phrase("FINAL CONFIRMATION: All changes listed above will be reversed.",
                             options_.confirmation_phrase) == Approval::Declined) {
        state_ = ReversalState::Aborted;
        return false;
    }
    state_ = ReversalState::Confirmed;
    return true;
}


ReversalReport ReversalEngine::make_report() const
{
    ReversalReport report;
    report.records = records_.size();
    report.backup_root = options_.backup_root;
    return report;
}


ReversalReport ReversalEngine::execute()
{
    require_state(ReversalState::Confirmed, "execute");
    state_ = ReversalState::Executing;

    auto logger = Logger::get_logger("core_logger");
    if (logger) {
        logger->info("Reversing changes...");
    }

    ReversalReport report = make_report();
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        undo_record(*it, report);
        ++report.processed;
    }
    remove_cli_symlink(report);

    state_ = ReversalState::Done;
    if (logger) {
        if (report.failures.empty()) {
            logger->info("Reversal complete: {} record(s) processed", report.processed);
        } else {
            logger->warn("Reversal finished with {} failure(s) across {} record(s)",
                         report.failures.size(), report.processed);
        }
        logger->info("Backups are preserved in: {}", report.backup_root.string());
        logger->info("You may delete them manually when satisfied.");
    }
    return report;
}


ReversalReport ReversalEngine::run()
{
    auto logger = Logger::get_logger("core_logger");

    load();
    if (records_.empty()) {
        if (logger) {
            logger->warn("Manifest is empty - nothing to reverse");
        }
        state_ = ReversalState::Done;
        return make_report();
    }

    const auto lines = preview();
    if (logger) {
        logger->info("The following operations will be reversed:");
        for (const auto& line : lines) {
            logger->info("  {}", line);
        }
        logger->warn("This will undo {} recorded operation(s).", records_.size());
    }

    if (!confirm()) {
        if (logger) {
            logger->info("Reversal cancelled.");
        }
        ReversalReport report = make_report();
        report.aborted = true;
        return report;
    }
    return execute();
}


void ReversalEngine::undo_record(const MutationRecord& record, ReversalReport& report)
{
    if (is_created_kind(record.kind())) {
        remove_created(record, report);
    } else {
        restore_modified(record, report);
    }
}


void ReversalEngine::remove_created(const MutationRecord& record, ReversalReport& report)
{
    auto logger = Logger::get_logger("core_logger");
    const fs::path& target = record.target_path();
    const bool directory = is_directory_kind(record.kind());
    const std::string action = directory ? "remove directory" : "remove";

    if (!Utils::path_present(target)) {
        ++report.already_absent;
        if (logger) {
            logger->debug("Already absent: {}", target.string());
        }
        return;
    }

    FileOperations& ops = router_.operations_for(target);
    const std::string via = router_.is_privileged(target) ? fmt::format(" ({})", ops.name()) : "";

    if (context_.dry_run()) {
        if (logger) {
            logger->info("[DRY-RUN] Would {}{}: {}", action, via, target.string());
        }
        return;
    }

    try {
        if (directory) {
            ops.remove_tree(target);
        } else {
            ops.remove_path(target);
        }
    } catch (const ErrorCodes::AppException& e) {
        record_failure(report, target, action, e.get_error_code(), e.what());
        return;
    } catch (const std::exception& e) {
        record_failure(report, target, action, ErrorCodes::Code::MUTATION_FAILED, e.what());
        return;
    }

    if (logger) {
        logger->info("Removed{}{}: {}", directory ? " directory" : "", via, target.string());
    }
}


void ReversalEngine::restore_modified(const MutationRecord& record, ReversalReport& report)
{
    auto logger = Logger::get_logger("core_logger");
    const fs::path& target = record.target_path();
    const fs::path& backup = *record.backup_path();
    const std::string action = fmt::format("restore from {}", backup.string());

    if (!Utils::path_present(backup)) {
        record_failure(report, target, action, ErrorCodes::Code::BACKUP_NOT_FOUND,
                       fmt::format("Backup not found: {} (cannot restore {})", backup.string(), target.string()));
        return;
    }

    FileOperations& ops = router_.operations_for(target);
    const std::string via = router_.is_privileged(target) ? fmt::format(" ({})", ops.name()) : "";

    if (context_.dry_run()) {
        if (logger) {
            logger->info("[DRY-RUN] Would restore{}: {} <- {}", via, target.string(), backup.string());
        }
        return;
    }

    try {
        if (Utils::path_present(target)) {
            ops.remove_tree(target);
        } else if (!Utils::path_present(target.parent_path())) {
            ops.create_directories(target.parent_path());
        }
        ops.copy_tree(backup, target);
    } catch (const ErrorCodes::AppException& e) {
        record_failure(report, target, action, e.get_error_code(), e.what());
        return;
    } catch (const std::exception& e) {
        record_failure(report, target, action, ErrorCodes::Code::MUTATION_FAILED, e.what());
        return;
    }

    if (logger) {
        logger->info("Restored{}: {}", via, target.string());
    }
}


void ReversalEngine::remove_cli_symlink(ReversalReport& report)
{
    if (!options_.cli_symlink) {
        return;
    }
    auto logger = Logger::get_logger("core_logger");
    const fs::path& link = *options_.cli_symlink;

    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(link, ec))) {
        return;
    }
    const fs::path points_to = fs::read_symlink(link, ec);
    if (ec || points_to.lexically_normal() != options_.launcher_path.lexically_normal()) {
        if (logger) {
            logger->info("Leaving {} in place: it does not point at {}", link.string(),
                         options_.launcher_path.string());
        }
        return;
    }

    FileOperations& ops = router_.operations_for(link);
    if (context_.dry_run()) {
        if (logger) {
            logger->info("[DRY-RUN] Would remove symlink: {}", link.string());
        }
        return;
    }

    try {
        ops.remove_path(link);
    } catch (const ErrorCodes::AppException& e) {
        record_failure(report, link, "remove symlink", e.get_error_code(), e.what());
        return;
    } catch (const std::exception& e) {
        record_failure(report, link, "remove symlink", ErrorCodes::Code::MUTATION_FAILED, e.what());
        return;
    }
    report.symlink_removed = true;
    if (logger) {
        logger->info("Removed symlink: {}", link.string());
    }
}


void ReversalEngine::record_failure(ReversalReport& report,
                                    const fs::path& target,
                                    const std::string& action,
                                    ErrorCodes::Code code,
                                    const std::string& message)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("Failed to {} for {}: {}", action, target.string(), message);
    }
    report.failures.push_back(ReversalFailure{target, action, code, message});
}
