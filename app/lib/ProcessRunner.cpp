#include "CommandRunner.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::vector<char*> to_argv(std::vector<std::string>& storage)
{
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv_ptrs.push_back(arg.data());
    }
    argv_ptrs.push_back(nullptr);
    return argv_ptrs;
}

void write_all(int fd, const std::string& data)
{
    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            // The child exited early; its exit status reports the failure.
            return;
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

} // namespace


CommandResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 const std::optional<std::string>& stdin_data)
{
    if (argv.empty()) {
        throw std::invalid_argument("ProcessRunner::run needs a program name");
    }

    int stdin_pipe[2] = {-1, -1};
    if (stdin_data && ::pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<std::string> arg_storage = argv;
    std::vector<char*> argv_ptrs = to_argv(arg_storage);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int saved = errno;
        if (stdin_data) {
            ::close(stdin_pipe[0]);
            ::close(stdin_pipe[1]);
        }
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        if (stdin_data) {
            ::dup2(stdin_pipe[0], STDIN_FILENO);
        }
        const int dev_null = ::open("/dev/null", O_WRONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDOUT_FILENO);
        }
        ::execvp(argv_ptrs[0], argv_ptrs.data());
        std::perror("execvp failed");
        ::_exit(127);
    }

    if (stdin_data) {
        ::close(stdin_pipe[0]);
        // A child that stops reading must not kill the installer.
        std::signal(SIGPIPE, SIG_IGN);
        write_all(stdin_pipe[1], *stdin_data);
        ::close(stdin_pipe[1]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    CommandResult result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->trace("Command '{}' exited with {}", argv.front(), result.exit_code);
    }
    return result;
}
