/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, captured logs, fakes).
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "BackupStore.hpp"
#include "CommandRunner.hpp"
#include "FileOperations.hpp"
#include "GuardedMutator.hpp"
#include "Journal.hpp"
#include "PrivilegeRouter.hpp"
#include "RunContext.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("fedora-installer-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Registers ring-buffer backed loggers under the production names.
 *
 * Components log through Logger::get_logger, so tests observe their output
 * by replacing the registered loggers for the lifetime of this object.
 */
class CapturedLog {
public:
    CapturedLog()
        : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(4096)) {
        sink_->set_pattern("%v");
        for (const char* name : {"core_logger", "journal_logger"}) {
            spdlog::drop(name);
            auto logger = std::make_shared<spdlog::logger>(name, sink_);
            logger->set_level(spdlog::level::trace);
            spdlog::register_logger(logger);
        }
    }

    ~CapturedLog() {
        spdlog::drop("core_logger");
        spdlog::drop("journal_logger");
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    std::vector<std::string> lines() const {
        std::vector<std::string> result = sink_->last_formatted();
        for (auto& line : result) {
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
        }
        return result;
    }

    // Lines starting with `prefix`, in emission order.
    std::vector<std::string> lines_starting_with(std::string_view prefix) const {
        std::vector<std::string> result;
        for (auto& line : lines()) {
            if (line.starts_with(prefix)) {
                result.push_back(std::move(line));
            }
        }
        return result;
    }

    bool contains(std::string_view text) const {
        for (const auto& line : lines()) {
            if (line.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

/**
 * @brief CommandRunner fake that records every invocation.
 */
class RecordingCommandRunner : public CommandRunner {
public:
    struct Invocation {
        std::vector<std::string> argv;
        std::optional<std::string> stdin_data;
    };

    CommandResult run(const std::vector<std::string>& argv,
                      const std::optional<std::string>& stdin_data = std::nullopt) override {
        invocations.push_back(Invocation{argv, stdin_data});
        CommandResult result;
        result.exit_code = exit_code;
        return result;
    }

    int exit_code{0};
    std::vector<Invocation> invocations;
};

/**
 * @brief FileOperations decorator that logs each call and then performs it directly.
 */
class RecordingFileOperations : public FileOperations {
public:
    explicit RecordingFileOperations(std::string label) : label_(std::move(label)) {}

    std::string name() const override { return label_; }

    void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to) override {
        record("copy_tree", to);
        direct_.copy_tree(from, to);
    }
    void remove_path(const std::filesystem::path& path) override {
        record("remove_path", path);
        direct_.remove_path(path);
    }
    void remove_tree(const std::filesystem::path& path) override {
        record("remove_tree", path);
        direct_.remove_tree(path);
    }
    void create_directories(const std::filesystem::path& path) override {
        record("create_directories", path);
        direct_.create_directories(path);
    }
    void write_file(const std::filesystem::path& path,
                    const std::string& content,
                    std::filesystem::perms perms) override {
        record("write_file", path);
        direct_.write_file(path, content, perms);
    }
    void create_symlink(const std::filesystem::path& target, const std::filesystem::path& link) override {
        record("create_symlink", link);
        direct_.create_symlink(target, link);
    }
    void set_permissions(const std::filesystem::path& path, std::filesystem::perms perms) override {
        record("set_permissions", path);
        direct_.set_permissions(path, perms);
    }

    // "operation path" entries in call order.
    std::vector<std::string> calls;

private:
    void record(const char* operation, const std::filesystem::path& path) {
        calls.push_back(std::string(operation) + " " + path.string());
    }

    std::string label_;
    DirectFileOperations direct_;
};

/**
 * @brief Wires a complete mutation pipeline inside a temporary directory.
 *
 * `root()` stands in for the filesystem being installed into and is owned
 * by the mutator, so missing parents below it are journaled; anything below
 * `system_root()` is routed to the "elevated" recording strategy.
 */
class MutationHarness {
public:
    explicit MutationHarness(bool dry_run = false, std::string run_stamp = "20250101-120000")
        : state_dir_(temp_.path() / "state"),
          context_(dry_run, false, state_dir_, std::move(run_stamp)),
          journal_(context_),
          backups_(context_),
          router_(make_router(temp_.path() / "fs" / "system", normal_, elevated_)),
          mutator_(context_, journal_, backups_, router_, {temp_.path() / "fs"}) {
        std::filesystem::create_directories(root());
    }

    MutationHarness(const MutationHarness&) = delete;
    MutationHarness& operator=(const MutationHarness&) = delete;

    std::filesystem::path root() const { return temp_.path() / "fs"; }
    std::filesystem::path system_root() const { return root() / "system"; }
    const std::filesystem::path& state_dir() const { return state_dir_; }

    const RunContext& context() const { return context_; }
    Journal& journal() { return journal_; }
    BackupStore& backups() { return backups_; }
    PrivilegeRouter& router() { return router_; }
    GuardedMutator& mutator() { return mutator_; }
    RecordingFileOperations& normal_ops() { return *normal_; }
    RecordingFileOperations& elevated_ops() { return *elevated_; }

private:
    static PrivilegeRouter make_router(const std::filesystem::path& system_root,
                                       RecordingFileOperations*& normal,
                                       RecordingFileOperations*& elevated) {
        auto normal_ops = std::make_unique<RecordingFileOperations>("direct");
        auto elevated_ops = std::make_unique<RecordingFileOperations>("sudo");
        normal = normal_ops.get();
        elevated = elevated_ops.get();
        return PrivilegeRouter({system_root}, std::move(normal_ops), std::move(elevated_ops));
    }

    TempDir temp_;
    std::filesystem::path state_dir_;
    RunContext context_;
    Journal journal_;
    BackupStore backups_;
    RecordingFileOperations* normal_{nullptr};
    RecordingFileOperations* elevated_{nullptr};
    PrivilegeRouter router_;
    GuardedMutator mutator_;
};

/**
 * @brief Snapshot of a directory tree: relative path -> kind and content.
 *
 * Used to compare filesystem states before an install and after a reversal.
 */
inline std::vector<std::string> describe_tree(const std::filesystem::path& root) {
    namespace fs = std::filesystem;
    std::vector<std::string> entries;
    if (!fs::exists(fs::symlink_status(root))) {
        return entries;
    }
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        const auto rel = it->path().lexically_relative(root).string();
        const auto status = fs::symlink_status(it->path());
        std::ostringstream line;
        if (fs::is_symlink(status)) {
            line << "L " << rel << " -> " << fs::read_symlink(it->path()).string();
        } else if (fs::is_directory(status)) {
            line << "D " << rel << " " << std::oct << static_cast<unsigned>(status.permissions());
        } else {
            line << "F " << rel << " " << std::oct << static_cast<unsigned>(status.permissions())
                 << " " << read_text_file(it->path());
        }
        entries.push_back(line.str());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}
