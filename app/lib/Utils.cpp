#include "Utils.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <system_error>
#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

void copy_entry(const fs::path& from, const fs::path& to);

void copy_directory(const fs::path& from, const fs::path& to)
{
    const fs::perms source_perms = fs::status(from).permissions();
    fs::create_directory(to, from);
    // Read-only sources still need a writable copy while it is filled.
    fs::permissions(to, fs::perms::owner_write | fs::perms::owner_exec, fs::perm_options::add);
    for (const auto& entry : fs::directory_iterator(from)) {
        copy_entry(entry.path(), to / entry.path().filename());
    }
    fs::permissions(to, source_perms, fs::perm_options::replace);
    fs::last_write_time(to, fs::last_write_time(from));
}

void copy_entry(const fs::path& from, const fs::path& to)
{
    const fs::file_status status = fs::symlink_status(from);
    switch (status.type()) {
        case fs::file_type::symlink:
            fs::create_symlink(fs::read_symlink(from), to);
            break;
        case fs::file_type::directory:
            copy_directory(from, to);
            break;
        case fs::file_type::regular:
            fs::copy_file(from, to, fs::copy_options::none);
            fs::permissions(to, status.permissions(), fs::perm_options::replace);
            fs::last_write_time(to, fs::last_write_time(from));
            break;
        case fs::file_type::not_found:
            throw fs::filesystem_error("source vanished during copy", from,
                                       std::make_error_code(std::errc::no_such_file_or_directory));
        default:
            throw fs::filesystem_error("cannot copy special file", from,
                                       std::make_error_code(std::errc::operation_not_supported));
    }
}

} // namespace


namespace Utils {

bool path_present(const fs::path& path)
{
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    return !ec && status.type() != fs::file_type::not_found;
}


bool is_within(const fs::path& path, const fs::path& root)
{
    const fs::path normal_path = path.lexically_normal();
    const fs::path normal_root = root.lexically_normal();

    auto path_it = normal_path.begin();
    for (auto root_it = normal_root.begin(); root_it != normal_root.end(); ++root_it) {
        // A trailing separator yields an empty final component.
        if (root_it->empty()) {
            continue;
        }
        if (path_it == normal_path.end() || *path_it != *root_it) {
            return false;
        }
        ++path_it;
    }
    return true;
}


void copy_tree_preserving(const fs::path& from, const fs::path& to)
{
    if (path_present(to)) {
        throw fs::filesystem_error("copy destination already exists", from, to,
                                   std::make_error_code(std::errc::file_exists));
    }
    copy_entry(from, to);
}


std::string format_permissions(fs::perms perms)
{
    return fmt::format("{:04o}", static_cast<unsigned>(perms & fs::perms::mask));
}


std::string home_directory()
{
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (const passwd* entry = ::getpwuid(::getuid()); entry && entry->pw_dir) {
        return entry->pw_dir;
    }
    return {};
}

} // namespace Utils
