#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>

namespace Utils {

// True when something (file, directory, or link, even dangling) is at path.
bool path_present(const std::filesystem::path& path);

// Component-wise prefix test; a root contains itself.
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

/**
 * @brief Recursive copy in the manner of `cp -a`.
 *
 * Symlinks are recreated with their target text verbatim and never followed.
 * Permission bits and modification times of files and directories are
 * carried over. `to` must not exist yet.
 *
 * @throws std::filesystem::filesystem_error on any I/O failure, or when the
 *         tree contains a special file (fifo, socket, device).
 */
void copy_tree_preserving(const std::filesystem::path& from, const std::filesystem::path& to);

std::string format_permissions(std::filesystem::perms perms);

std::string home_directory();

} // namespace Utils

#endif
