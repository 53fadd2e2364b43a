#ifndef GUARDED_MUTATOR_HPP
#define GUARDED_MUTATOR_HPP

#include "BackupStore.hpp"
#include "Journal.hpp"
#include "MutationRecord.hpp"
#include "PrivilegeRouter.hpp"
#include "RunContext.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief The only sanctioned way for installer phases to change the filesystem.
 *
 * Every call runs, in order: snapshot the path, append the journal record,
 * then perform the mutation (or only log it under dry-run). A failed
 * snapshot stops the call before anything is journaled or written. A failed
 * mutation leaves its journal record in place.
 *
 * Missing parent directories are journaled only inside `owned_roots`, the
 * trees the installation owns outright. Elsewhere they are created like
 * `mkdir -p` without a record, so a reversal never runs `rm -rf` on shared
 * locations such as ~/.local/share/applications that other software may
 * fill later. Those parents stay behind, empty, after a reversal.
 */
class GuardedMutator {
public:
    // Receives the strategy chosen for the target path.
    using Mutation = std::function<void(FileOperations& ops, const std::filesystem::path& target)>;

    GuardedMutator(const RunContext& context,
                   Journal& journal,
                   BackupStore& backups,
                   PrivilegeRouter& router,
                   std::vector<std::filesystem::path> owned_roots = {});

    /**
     * @throws ErrorCodes::AppException BACKUP_FAILED, PATH_INVALID,
     *         JOURNAL_WRITE_FAILED (nothing written) or MUTATION_FAILED
     *         (journaled, possibly partially applied).
     */
    MutationRecord mutate_file(const std::filesystem::path& path,
                               const std::string& action,
                               const Mutation& writer);

    MutationRecord mutate_directory(const std::filesystem::path& path,
                                    const std::string& action,
                                    const Mutation& builder);

    // Conveniences; each first creates any missing parent directory.
    MutationRecord write_file(const std::filesystem::path& path,
                              const std::string& content,
                              std::filesystem::perms perms = std::filesystem::perms(0644));
    MutationRecord create_symlink(const std::filesystem::path& link, const std::filesystem::path& target);
    MutationRecord create_directory(const std::filesystem::path& path,
                                    std::filesystem::perms perms = std::filesystem::perms(0755));
    // Replaces `destination` with a preserving copy of `source`.
    MutationRecord install_tree(const std::filesystem::path& source, const std::filesystem::path& destination);

    /**
     * @brief Creates every missing ancestor, outermost first.
     * @return DirCreated records for the ancestors inside an owned root.
     */
    std::vector<MutationRecord> ensure_parent_directories(const std::filesystem::path& path);

    bool is_owned(const std::filesystem::path& path) const;

    bool is_present(const std::filesystem::path& path) const { return backups_.is_present(path); }

private:
    MutationRecord mutate(MutationKind created_kind,
                          MutationKind modified_kind,
                          const std::filesystem::path& path,
                          const std::string& action,
                          const Mutation& mutation);
    void create_shared_parent(const std::filesystem::path& dir);

    const RunContext& context_;
    Journal& journal_;
    BackupStore& backups_;
    PrivilegeRouter& router_;
    std::vector<std::filesystem::path> owned_roots_;
};

#endif
