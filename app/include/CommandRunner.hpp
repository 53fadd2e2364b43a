#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <optional>
#include <string>
#include <vector>

struct CommandResult {
    int exit_code{-1};
    bool signaled{false};

    bool succeeded() const { return !signaled && exit_code == 0; }
};

// Runs an external program; seam for the elevated file operations.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @param argv Program followed by its arguments; argv[0] is looked up in PATH.
     * @param stdin_data Piped to the child's standard input when set.
     */
    virtual CommandResult run(const std::vector<std::string>& argv,
                              const std::optional<std::string>& stdin_data = std::nullopt) = 0;
};

// fork/exec implementation. The child's stdout goes to /dev/null.
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv,
                      const std::optional<std::string>& stdin_data = std::nullopt) override;
};

#endif
