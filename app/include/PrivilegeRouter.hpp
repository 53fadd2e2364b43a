#ifndef PRIVILEGE_ROUTER_HPP
#define PRIVILEGE_ROUTER_HPP

#include "FileOperations.hpp"

#include <filesystem>
#include <memory>
#include <vector>

/**
 * @brief Picks the elevated or normal strategy for each individual path.
 *
 * A path is privileged when a configured root is a component-wise prefix of
 * it (the root itself included). The decision is made per call and never
 * cached, so forward mutations and reversal share one rule.
 */
class PrivilegeRouter {
public:
    PrivilegeRouter(std::vector<std::filesystem::path> privileged_roots,
                    std::unique_ptr<FileOperations> normal,
                    std::unique_ptr<FileOperations> elevated);

    bool is_privileged(const std::filesystem::path& path) const;
    FileOperations& operations_for(const std::filesystem::path& path);

    const std::vector<std::filesystem::path>& privileged_roots() const { return privileged_roots_; }

private:
    std::vector<std::filesystem::path> privileged_roots_;
    std::unique_ptr<FileOperations> normal_;
    std::unique_ptr<FileOperations> elevated_;
};

#endif
