#ifndef JOURNAL_HPP
#define JOURNAL_HPP

#include "MutationRecord.hpp"
#include "RunContext.hpp"

#include <filesystem>
#include <vector>

/**
 * @brief Append-only, ordered log of mutation records persisted as text.
 *
 * One record per line, `kind|target[|backup]`. Append order is the order a
 * reversal replays backwards; the journal itself never reorders, filters or
 * compacts entries.
 *
 * Precondition: one writer at a time. Installer and reversal runs are
 * sequential, operator-initiated invocations, so no file locking is done.
 */
class Journal {
public:
    explicit Journal(const RunContext& context);
    Journal(const RunContext& context, std::filesystem::path path);

    /**
     * @brief Persist one record; returns only after the line is fsync'd.
     *
     * An unterminated tail left by an interrupted append is cut off first.
     * Under dry-run nothing touches disk and the record is kept in
     * simulated_records() instead.
     * @throws ErrorCodes::AppException PATH_INVALID or JOURNAL_WRITE_FAILED.
     */
    void append(const MutationRecord& record);

    /**
     * @brief Every persisted record in exact append order.
     *
     * An unterminated final line is skipped with a warning.
     * @throws ErrorCodes::AppException JOURNAL_NOT_FOUND, JOURNAL_READ_FAILED
     *         or JOURNAL_CORRUPTED.
     */
    std::vector<MutationRecord> read_all() const;

    bool exists() const;

    // Create an empty journal when none exists. No-op under dry-run.
    void ensure_created();

    const std::filesystem::path& path() const { return path_; }
    const std::vector<MutationRecord>& simulated_records() const { return simulated_; }

private:
    void write_line(const std::string& line);

    const RunContext& context_;
    std::filesystem::path path_;
    std::vector<MutationRecord> simulated_;
};

#endif
