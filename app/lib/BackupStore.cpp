#include "BackupStore.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;

BackupStore::BackupStore(const RunContext& context)
    : context_(context),
      run_dir_(context.backup_run_dir())
{
}


fs::path BackupStore::next_location(const fs::path& path) const
{
    return locate(path).first;
}


std::pair<fs::path, int> BackupStore::locate(const fs::path& path) const
{
    const fs::path mirrored = run_dir_ / path.lexically_normal().relative_path();
    const auto it = layers_.find(path.lexically_normal());
    int layer = (it == layers_.end()) ? 0 : it->second;

    auto candidate = [&mirrored](int index) {
        if (index == 0) {
            return mirrored;
        }
        fs::path layered = mirrored;
        layered += fmt::format(".~{}~", index);
        return layered;
    };

    // A leftover from an earlier process with the same stamp is never reused.
    while (!context_.dry_run() && Utils::path_present(candidate(layer))) {
        ++layer;
    }
    return {candidate(layer), layer};
}


bool BackupStore::is_present(const fs::path& path) const
{
    if (!context_.dry_run()) {
        return Utils::path_present(path);
    }
    const fs::path key = path.lexically_normal();
    if (simulated_present_.contains(key)) {
        return true;
    }
    for (const auto& root : replaced_roots_) {
        if (key != root && Utils::is_within(key, root)) {
            return false;
        }
    }
    return Utils::path_present(path);
}


void BackupStore::simulate_tree(const fs::path& source, const fs::path& destination)
{
    if (!context_.dry_run()) {
        return;
    }
    const fs::path root = destination.lexically_normal();
    replaced_roots_.push_back(root);
    simulated_present_.insert(root);

    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(source, ec))) {
        return;
    }
    for (auto it = fs::recursive_directory_iterator(source, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        simulated_present_.insert((root / it->path().lexically_relative(source)).lexically_normal());
    }
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Could not list '{}' for the dry-run plan: {}", source.string(), ec.message());
        }
    }
}


void BackupStore::simulate_directory(const fs::path& path)
{
    if (context_.dry_run()) {
        simulated_present_.insert(path.lexically_normal());
    }
}


BackupResult BackupStore::snapshot(const fs::path& path)
{
    auto logger = Logger::get_logger("core_logger");
    const fs::path key = path.lexically_normal();

    if (!is_present(path)) {
        if (logger) {
            logger->debug("No existing path to back up: {}", path.string());
        }
        if (context_.dry_run()) {
            simulated_present_.insert(key);
        }
        return BackupResult{std::nullopt, context_.dry_run()};
    }

    const auto [destination, layer] = locate(path);

    if (context_.dry_run()) {
        layers_[key] = layer + 1;
        if (logger) {
            logger->info("[DRY-RUN] Would back up: {} -> {}", path.string(), destination.string());
        }
        return BackupResult{destination, true};
    }

    try {
        fs::create_directories(destination.parent_path());
        Utils::copy_tree_preserving(path, destination);
    } catch (const fs::filesystem_error& e) {
        std::error_code cleanup_ec;
        if (Utils::path_present(destination)) {
            fs::remove_all(destination, cleanup_ec);
        }
        if (logger) {
            logger->error("Backup of '{}' failed: {}", path.string(), e.what());
            if (cleanup_ec) {
                logger->error("Could not remove partial backup '{}': {}", destination.string(), cleanup_ec.message());
            }
        }
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKUP_FAILED,
                            fmt::format("Could not back up '{}': {}", path.string(), e.what()),
                            fmt::format("snapshot {} -> {}", path.string(), destination.string()));
    }

    layers_[key] = layer + 1;
    if (logger) {
        logger->info("Backed up: {}", path.string());
        logger->debug("  -> {}", destination.string());
    }
    return BackupResult{destination, false};
}
