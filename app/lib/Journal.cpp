#include "Journal.hpp"
#include "AppException.hpp"
#include "Logger.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

[[noreturn]] void write_failed(const std::filesystem::path& path, const std::string& step, int error)
{
    THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_WRITE_FAILED,
                    fmt::format("{} '{}': {}", step, path.string(), std::strerror(error)));
}

// Makes a freshly created directory entry durable.
void sync_directory(const std::filesystem::path& dir)
{
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        write_failed(dir, "open directory", errno);
    }
    const int rc = ::fsync(fd);
    const int saved = errno;
    ::close(fd);
    if (rc != 0) {
        write_failed(dir, "fsync directory", saved);
    }
}

/**
 * @brief Cuts an unterminated final line left by an append that never returned.
 *
 * Records are journaled before their mutation runs, so a torn line has no
 * mutation behind it. Returns the number of bytes dropped.
 */
std::size_t drop_torn_tail(int fd, const std::filesystem::path& path)
{
    struct stat info {};
    if (::fstat(fd, &info) != 0) {
        write_failed(path, "stat", errno);
    }
    const off_t size = info.st_size;
    if (size == 0) {
        return 0;
    }

    char buffer[4096];
    off_t end = size;
    off_t keep = 0;
    bool last_byte = true;
    while (end > 0) {
        const off_t start = end > static_cast<off_t>(sizeof(buffer)) ? end - static_cast<off_t>(sizeof(buffer)) : 0;
        const ssize_t count = ::pread(fd, buffer, static_cast<std::size_t>(end - start), start);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            write_failed(path, "read", errno);
        }
        if (count == 0) {
            break;
        }
        if (last_byte) {
            if (buffer[count - 1] == '\n') {
                return 0;
            }
            last_byte = false;
        }
        for (ssize_t i = count - 1; i >= 0; --i) {
            if (buffer[i] == '\n') {
                keep = start + i + 1;
                break;
            }
        }
        if (keep > 0) {
            break;
        }
        end = start;
    }

    if (::ftruncate(fd, keep) != 0) {
        write_failed(path, "truncate", errno);
    }
    return static_cast<std::size_t>(size - keep);
}

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace


Journal::Journal(const RunContext& context)
    : Journal(context, context.journal_path())
{
}


Journal::Journal(const RunContext& context, std::filesystem::path path)
    : context_(context),
      path_(std::move(path))
{
}


void Journal::append(const MutationRecord& record)
{
    const std::string line = encode_record(record);
    auto logger = Logger::get_logger("journal_logger");

    if (context_.dry_run()) {
        simulated_.push_back(record);
        if (logger) {
            logger->debug("[DRY-RUN] Would journal: {}", line);
        }
        return;
    }

    write_line(line + "\n");
    if (logger) {
        logger->debug("Journaled: {}", line);
    }
}


void Journal::write_line(const std::string& line)
{
    std::error_code ec;
    const bool is_new = !std::filesystem::exists(path_, ec);
    if (is_new) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            write_failed(path_.parent_path(), "create directory", ec.value());
        }
    }

    const int fd = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        write_failed(path_, "open", errno);
    }

    std::size_t dropped = 0;
    try {
        dropped = drop_torn_tail(fd, path_);
    } catch (const ErrorCodes::AppException&) {
        ::close(fd);
        throw;
    }
    if (dropped > 0) {
        if (auto logger = Logger::get_logger("journal_logger")) {
            logger->warn("Dropped {} byte(s) of an interrupted entry at the end of '{}'", dropped, path_.string());
        }
    }

    const char* data = line.data();
    std::size_t remaining = line.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            ::close(fd);
            write_failed(path_, "write", saved);
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) != 0) {
        const int saved = errno;
        ::close(fd);
        write_failed(path_, "fsync", saved);
    }
    if (::close(fd) != 0) {
        write_failed(path_, "close", errno);
    }

    if (is_new) {
        sync_directory(path_.parent_path());
    }
}


std::vector<MutationRecord> Journal::read_all() const
{
    if (!exists()) {
        THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_NOT_FOUND, fmt::format("journal '{}'", path_.string()));
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_READ_FAILED, fmt::format("journal '{}'", path_.string()));
    }

    std::vector<MutationRecord> records;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }
        // No newline: the append was interrupted and its mutation never ran.
        if (in.eof()) {
            if (auto logger = Logger::get_logger("journal_logger")) {
                logger->warn("Ignoring interrupted entry at line {} of '{}': {}",
                             line_number, path_.string(), line);
            }
            break;
        }
        records.push_back(decode_record(line, line_number));
    }
    if (in.bad()) {
        THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_READ_FAILED,
                        fmt::format("journal '{}' after line {}", path_.string(), line_number));
    }

    if (auto logger = Logger::get_logger("journal_logger")) {
        logger->debug("Loaded {} journal record(s) from '{}'", records.size(), path_.string());
    }
    return records;
}


bool Journal::exists() const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}


void Journal::ensure_created()
{
    if (context_.dry_run() || exists()) {
        return;
    }
    write_line("");
    if (auto logger = Logger::get_logger("journal_logger")) {
        logger->debug("Created journal '{}'", path_.string());
    }
}
