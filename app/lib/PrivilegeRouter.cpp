#include "PrivilegeRouter.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

PrivilegeRouter::PrivilegeRouter(std::vector<std::filesystem::path> privileged_roots,
                                 std::unique_ptr<FileOperations> normal,
                                 std::unique_ptr<FileOperations> elevated)
    : privileged_roots_(std::move(privileged_roots)),
      normal_(std::move(normal)),
      elevated_(std::move(elevated))
{
    if (!normal_ || !elevated_) {
        throw std::invalid_argument("PrivilegeRouter needs both a normal and an elevated strategy");
    }
}


bool PrivilegeRouter::is_privileged(const std::filesystem::path& path) const
{
    return std::any_of(privileged_roots_.begin(), privileged_roots_.end(),
                       [&path](const std::filesystem::path& root) {
                           return Utils::is_within(path, root);
                       });
}


FileOperations& PrivilegeRouter::operations_for(const std::filesystem::path& path)
{
    FileOperations& selected = is_privileged(path) ? *elevated_ : *normal_;
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->trace("Using {} operations for '{}'", selected.name(), path.string());
    }
    return selected;
}
