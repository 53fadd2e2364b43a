#ifndef FILE_OPERATIONS_HPP
#define FILE_OPERATIONS_HPP

#include "CommandRunner.hpp"

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Strategy for performing filesystem mutations.
 *
 * Implementations throw on failure; callers translate the failure into the
 * installer's error codes.
 */
class FileOperations {
public:
    virtual ~FileOperations() = default;

    virtual std::string name() const = 0;

    // `cp -a` semantics; `to` must not exist.
    virtual void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    // Removes a file or link. Fails on a non-empty directory.
    virtual void remove_path(const std::filesystem::path& path) = 0;
    virtual void remove_tree(const std::filesystem::path& path) = 0;
    virtual void create_directories(const std::filesystem::path& path) = 0;
    virtual void write_file(const std::filesystem::path& path,
                            const std::string& content,
                            std::filesystem::perms perms) = 0;
    // Replaces an existing link at `link`.
    virtual void create_symlink(const std::filesystem::path& target, const std::filesystem::path& link) = 0;
    virtual void set_permissions(const std::filesystem::path& path, std::filesystem::perms perms) = 0;
};

class DirectFileOperations : public FileOperations {
public:
    std::string name() const override { return "direct"; }

    void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void remove_path(const std::filesystem::path& path) override;
    void remove_tree(const std::filesystem::path& path) override;
    void create_directories(const std::filesystem::path& path) override;
    void write_file(const std::filesystem::path& path,
                    const std::string& content,
                    std::filesystem::perms perms) override;
    void create_symlink(const std::filesystem::path& target, const std::filesystem::path& link) override;
    void set_permissions(const std::filesystem::path& path, std::filesystem::perms perms) override;
};

/**
 * @brief Runs each operation as `<elevation command> <coreutil> ...`.
 *
 * A non-zero exit throws ErrorCodes::AppException PRIVILEGED_COMMAND_FAILED.
 */
class ElevatedFileOperations : public FileOperations {
public:
    ElevatedFileOperations(std::string elevation_command, CommandRunner& runner);

    std::string name() const override { return elevation_command_; }

    void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void remove_path(const std::filesystem::path& path) override;
    void remove_tree(const std::filesystem::path& path) override;
    void create_directories(const std::filesystem::path& path) override;
    void write_file(const std::filesystem::path& path,
                    const std::string& content,
                    std::filesystem::perms perms) override;
    void create_symlink(const std::filesystem::path& target, const std::filesystem::path& link) override;
    void set_permissions(const std::filesystem::path& path, std::filesystem::perms perms) override;

private:
    void execute(std::vector<std::string> args, const std::optional<std::string>& stdin_data = std::nullopt);

    std::string elevation_command_;
    CommandRunner& runner_;
};

#endif
