#ifndef BACKUP_STORE_HPP
#define BACKUP_STORE_HPP

#include "RunContext.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

/**
 * @brief Outcome of a snapshot request.
 *
 * `location` is empty when nothing existed at the path. Under dry-run the
 * location is synthetic and must only be used for logging.
 */
struct BackupResult {
    std::optional<std::filesystem::path> location;
    bool simulated{false};

    bool preserved() const { return location.has_value(); }
};

/**
 * @brief Pre-mutation snapshot area, one timestamped namespace per run.
 *
 * Layout: `<state_dir>/<run_stamp>/<target without leading '/'>`. Repeated
 * snapshots of one path within a run are layered as `<name>.~1~`, `.~2~`, ...
 * The store never deletes snapshots.
 */
class BackupStore {
public:
    explicit BackupStore(const RunContext& context);

    /**
     * @brief Preserve whatever exists at `path` before it is mutated.
     * @throws ErrorCodes::AppException BACKUP_FAILED when the copy cannot be
     *         completed; any partial copy is removed first.
     */
    BackupResult snapshot(const std::filesystem::path& path);

    const std::filesystem::path& run_dir() const { return run_dir_; }

    // Presence as this run sees it, simulated writes included under dry-run.
    bool is_present(const std::filesystem::path& path) const;

    // Dry-run only: record that `destination` now holds a copy of `source`.
    void simulate_tree(const std::filesystem::path& source, const std::filesystem::path& destination);

    // Dry-run only: record that a directory was created outside the journal.
    void simulate_directory(const std::filesystem::path& path);

    // Where the next snapshot of `path` would land.
    std::filesystem::path next_location(const std::filesystem::path& path) const;

private:
    std::pair<std::filesystem::path, int> locate(const std::filesystem::path& path) const;

    const RunContext& context_;
    std::filesystem::path run_dir_;
    std::map<std::filesystem::path, int> layers_;
    // Dry-run only: paths whose simulated mutation already happened.
    std::set<std::filesystem::path> simulated_present_;
    // Dry-run only: trees replaced wholesale; their old contents no longer count.
    std::vector<std::filesystem::path> replaced_roots_;
};

#endif
