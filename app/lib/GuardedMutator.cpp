#include "GuardedMutator.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

GuardedMutator::GuardedMutator(const RunContext& context,
                               Journal& journal,
                               BackupStore& backups,
                               PrivilegeRouter& router,
                               std::vector<fs::path> owned_roots)
    : context_(context),
      journal_(journal),
      backups_(backups),
      router_(router),
      owned_roots_(std::move(owned_roots))
{
    for (auto& root : owned_roots_) {
        root = root.lexically_normal();
    }
}


bool GuardedMutator::is_owned(const fs::path& path) const
{
    return std::any_of(owned_roots_.begin(), owned_roots_.end(),
                       [&path](const fs::path& root) { return Utils::is_within(path, root); });
}


MutationRecord GuardedMutator::mutate_file(const fs::path& path, const std::string& action, const Mutation& writer)
{
    return mutate(MutationKind::FileCreated, MutationKind::FileModified, path, action, writer);
}


MutationRecord GuardedMutator::mutate_directory(const fs::path& path, const std::string& action, const Mutation& builder)
{
    return mutate(MutationKind::DirCreated, MutationKind::DirModified, path, action, builder);
}


MutationRecord GuardedMutator::mutate(MutationKind created_kind,
                                      MutationKind modified_kind,
                                      const fs::path& path,
                                      const std::string& action,
                                      const Mutation& mutation)
{
    auto logger = Logger::get_logger("core_logger");
    if (logger) {
        logger->debug("Intent: {} -> {}", action, path.string());
    }

    const BackupResult backup = backups_.snapshot(path);
    const MutationRecord record = backup.preserved()
        ? MutationRecord::modified(modified_kind, path, *backup.location)
        : MutationRecord::created(created_kind, path);

    journal_.append(record);

    FileOperations& ops = router_.operations_for(path);
    const bool elevated = router_.is_privileged(path);

    if (context_.dry_run()) {
        if (logger) {
            logger->info("[DRY-RUN] Would {}: {}{}", action, path.string(),
                         elevated ? fmt::format(" (via {})", ops.name()) : "");
        }
        return record;
    }

    try {
        mutation(ops, path);
    } catch (const std::exception& e) {
        if (logger) {
            logger->error("Failed to {}: {}", action, path.string());
            logger->error("  Reason: {}", e.what());
            logger->warn("  The journal keeps this entry; a reversal will treat it as possibly applied");
        }
        THROW_APP_ERROR_MSG(ErrorCodes::Code::MUTATION_FAILED,
                            fmt::format("Failed to {} '{}': {}", action, path.string(), e.what()),
                            fmt::format("{} {} ({})", to_string(record.kind()), path.string(), action));
    }

    if (logger) {
        logger->info("{}: {}{}", action, path.string(), elevated ? fmt::format(" (via {})", ops.name()) : "");
        logger->debug("  Completed as {}", to_string(record.kind()));
    }
    return record;
}


std::vector<MutationRecord> GuardedMutator::ensure_parent_directories(const fs::path& path)
{
    std::vector<fs::path> missing;
    for (fs::path parent = path.parent_path();
         !parent.empty() && parent != parent.root_path() && !backups_.is_present(parent);
         parent = parent.parent_path()) {
        missing.push_back(parent);
    }
    std::reverse(missing.begin(), missing.end());

    std::vector<MutationRecord> records;
    for (const auto& dir : missing) {
        if (!is_owned(dir)) {
            create_shared_parent(dir);
            continue;
        }
        records.push_back(mutate_directory(dir, "create directory",
            [](FileOperations& ops, const fs::path& target) {
                ops.create_directories(target);
            }));
    }
    return records;
}


void GuardedMutator::create_shared_parent(const fs::path& dir)
{
    auto logger = Logger::get_logger("core_logger");
    FileOperations& ops = router_.operations_for(dir);
    const std::string via = router_.is_privileged(dir) ? fmt::format(" (via {})", ops.name()) : "";

    if (context_.dry_run()) {
        backups_.simulate_directory(dir);
        if (logger) {
            logger->info("[DRY-RUN] Would create shared parent directory: {}{}", dir.string(), via);
        }
        return;
    }

    try {
        ops.create_directories(dir);
    } catch (const std::exception& e) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::MUTATION_FAILED,
                            fmt::format("Failed to create parent directory '{}': {}", dir.string(), e.what()),
                            fmt::format("mkdir -p {}", dir.string()));
    }
    if (logger) {
        logger->info("Created shared parent directory (kept on reversal): {}{}", dir.string(), via);
    }
}


MutationRecord GuardedMutator::write_file(const fs::path& path, const std::string& content, fs::perms perms)
{
    ensure_parent_directories(path);
    const std::string action = fmt::format("write {} byte(s), mode {}", content.size(), Utils::format_permissions(perms));
    return mutate_file(path, action, [&content, perms](FileOperations& ops, const fs::path& target) {
        ops.write_file(target, content, perms);
    });
}


MutationRecord GuardedMutator::create_symlink(const fs::path& link, const fs::path& target)
{
    ensure_parent_directories(link);
    return mutate_file(link, fmt::format("link to {}", target.string()),
        [&target](FileOperations& ops, const fs::path& link_path) {
            if (Utils::path_present(link_path) && !fs::is_symlink(fs::symlink_status(link_path))) {
                ops.remove_tree(link_path);
            }
            ops.create_symlink(target, link_path);
        });
}


MutationRecord GuardedMutator::create_directory(const fs::path& path, fs::perms perms)
{
    ensure_parent_directories(path);
    return mutate_directory(path, fmt::format("create directory, mode {}", Utils::format_permissions(perms)),
        [perms](FileOperations& ops, const fs::path& target) {
            ops.create_directories(target);
            ops.set_permissions(target, perms);
        });
}


MutationRecord GuardedMutator::install_tree(const fs::path& source, const fs::path& destination)
{
    ensure_parent_directories(destination);
    MutationRecord record = mutate_directory(destination, fmt::format("install tree from {}", source.string()),
        [&source](FileOperations& ops, const fs::path& target) {
            if (Utils::path_present(target)) {
                ops.remove_tree(target);
            }
            ops.copy_tree(source, target);
        });
    backups_.simulate_tree(source, destination);
    return record;
}
