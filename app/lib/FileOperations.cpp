#include "FileOperations.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

void DirectFileOperations::copy_tree(const fs::path& from, const fs::path& to)
{
    Utils::copy_tree_preserving(from, to);
}


void DirectFileOperations::remove_path(const fs::path& path)
{
    fs::remove(path);
}


void DirectFileOperations::remove_tree(const fs::path& path)
{
    fs::remove_all(path);
}


void DirectFileOperations::create_directories(const fs::path& path)
{
    fs::create_directories(path);
}


void DirectFileOperations::write_file(const fs::path& path, const std::string& content, fs::perms perms)
{
    // Replace a link instead of writing through it.
    if (fs::is_symlink(fs::symlink_status(path))) {
        fs::remove(path);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw fs::filesystem_error("cannot open for writing", path,
                                   std::make_error_code(std::errc::permission_denied));
    }
    out << content;
    out.close();
    if (!out) {
        throw fs::filesystem_error("write failed", path, std::make_error_code(std::errc::io_error));
    }
    fs::permissions(path, perms, fs::perm_options::replace);
}


void DirectFileOperations::create_symlink(const fs::path& target, const fs::path& link)
{
    if (fs::is_symlink(fs::symlink_status(link))) {
        fs::remove(link);
    }
    fs::create_symlink(target, link);
}


void DirectFileOperations::set_permissions(const fs::path& path, fs::perms perms)
{
    fs::permissions(path, perms, fs::perm_options::replace);
}


ElevatedFileOperations::ElevatedFileOperations(std::string elevation_command, CommandRunner& runner)
    : elevation_command_(std::move(elevation_command)),
      runner_(runner)
{
}


void ElevatedFileOperations::execute(std::vector<std::string> args, const std::optional<std::string>& stdin_data)
{
    args.insert(args.begin(), elevation_command_);
    const CommandResult result = runner_.run(args, stdin_data);
    if (!result.succeeded()) {
        std::string command_line;
        for (const auto& arg : args) {
            if (!command_line.empty()) {
                command_line += ' ';
            }
            command_line += arg;
        }
        THROW_APP_ERROR_MSG(ErrorCodes::Code::PRIVILEGED_COMMAND_FAILED,
                            fmt::format("Elevated command exited with status {}", result.exit_code),
                            command_line);
    }
}


void ElevatedFileOperations::copy_tree(const fs::path& from, const fs::path& to)
{
    execute({"cp", "-a", "--", from.string(), to.string()});
}


void ElevatedFileOperations::remove_path(const fs::path& path)
{
    execute({"rm", "-f", "--", path.string()});
}


void ElevatedFileOperations::remove_tree(const fs::path& path)
{
    execute({"rm", "-rf", "--", path.string()});
}


void ElevatedFileOperations::create_directories(const fs::path& path)
{
    execute({"mkdir", "-p", "--", path.string()});
}


void ElevatedFileOperations::write_file(const fs::path& path, const std::string& content, fs::perms perms)
{
    execute({"tee", "--", path.string()}, content);
    set_permissions(path, perms);
}


void ElevatedFileOperations::create_symlink(const fs::path& target, const fs::path& link)
{
    execute({"ln", "-sfn", "--", target.string(), link.string()});
}


void ElevatedFileOperations::set_permissions(const fs::path& path, fs::perms perms)
{
    execute({"chmod", Utils::format_permissions(perms), "--", path.string()});
}
