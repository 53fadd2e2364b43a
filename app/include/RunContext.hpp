#ifndef RUN_CONTEXT_HPP
#define RUN_CONTEXT_HPP

#include <filesystem>
#include <string>

/**
 * @brief Mode switches and state locations fixed for one invocation.
 *
 * Every component receives the context through its constructor and reads the
 * dry-run and reverse switches from it, never from process-wide state.
 */
class RunContext {
public:
    RunContext(bool dry_run,
               bool reverse_mode,
               std::filesystem::path state_dir,
               std::string run_stamp = current_stamp());

    bool dry_run() const { return dry_run_; }
    bool reverse_mode() const { return reverse_mode_; }

    const std::filesystem::path& state_dir() const { return state_dir_; }
    const std::string& run_stamp() const { return run_stamp_; }

    std::filesystem::path journal_path() const;
    std::filesystem::path backup_run_dir() const;
    std::filesystem::path log_path() const;

    // Local time as YYYYMMDD-HHMMSS.
    static std::string current_stamp();

private:
    bool dry_run_;
    bool reverse_mode_;
    std::filesystem::path state_dir_;
    std::string run_stamp_;
};

#endif
