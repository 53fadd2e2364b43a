#ifndef REVERSAL_ENGINE_HPP
#define REVERSAL_ENGINE_HPP

#include "ApprovalGate.hpp"
#include "ErrorCode.hpp"
#include "Journal.hpp"
#include "MutationRecord.hpp"
#include "PrivilegeRouter.hpp"
#include "RunContext.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class ReversalState {
    Pending,
    Loaded,
    Previewed,
    Confirmed,
    Executing,
    Done,
    Aborted
};

std::string to_string(ReversalState state);

struct ReversalOptions {
    std::string confirmation_phrase{"REVERSE"};
    // Command-line link removed after the replay when it still points at `launcher_path`.
    std::optional<std::filesystem::path> cli_symlink;
    std::filesystem::path launcher_path;
    // Reported so the operator can inspect or delete backups manually.
    std::filesystem::path backup_root;
};

struct ReversalFailure {
    std::filesystem::path target;
    std::string action;
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
    std::string message;
};

struct ReversalReport {
    std::size_t records{0};
    std::size_t processed{0};
    std::size_t already_absent{0};
    std::vector<ReversalFailure> failures;
    std::filesystem::path backup_root;
    bool symlink_removed{false};
    bool aborted{false};
};

/**
 * @brief Replays the journal backwards to restore the pre-install state.
 *
 * Loaded -> Previewed -> Confirmed -> Executing -> Done, or Aborted on a
 * declined confirmation. Every record is replayed, newest first, with no
 * compaction: a path touched N times is restored N times and ends at its
 * oldest snapshot. Per-record failures are collected and the replay goes
 * on. Backups are never deleted.
 */
class ReversalEngine {
public:
    ReversalEngine(const RunContext& context,
                   const Journal& journal,
                   PrivilegeRouter& router,
                   ApprovalGate& gate,
                   ReversalOptions options);

    // @throws ErrorCodes::AppException JOURNAL_NOT_FOUND when no journal exists.
    void load();

    // One line per record in append order.
    std::vector<std::string> preview();

    // Yes/no followed by the typed confirmation phrase.
    bool confirm();

    ReversalReport execute();

    // load, preview, confirm, execute.
    ReversalReport run();

    ReversalState state() const { return state_; }
    const std::vector<MutationRecord>& records() const { return records_; }

private:
    void require_state(ReversalState expected, const char* operation) const;
    void undo_record(const MutationRecord& record, ReversalReport& report);
    void remove_created(const MutationRecord& record, ReversalReport& report);
    void restore_modified(const MutationRecord& record, ReversalReport& report);
    void remove_cli_symlink(ReversalReport& report);
    void record_failure(ReversalReport& report,
                        const std::filesystem::path& target,
                        const std::string& action,
                        ErrorCodes::Code code,
                        const std::string& message);
    ReversalReport make_report() const;

    const RunContext& context_;
    const Journal& journal_;
    PrivilegeRouter& router_;
    ApprovalGate& gate_;
    ReversalOptions options_;
    ReversalState state_{ReversalState::Pending};
    std::vector<MutationRecord> records_;
};

#endif
