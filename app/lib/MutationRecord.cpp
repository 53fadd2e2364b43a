#include "MutationRecord.hpp"
#include "AppException.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace {
constexpr char kFieldSeparator = '|';

std::vector<std::string_view> split_fields(std::string_view line)
{
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto pos = line.find(kFieldSeparator, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

void ensure_encodable(const std::filesystem::path& path)
{
    const std::string text = path.string();
    if (text.empty() || !path.is_absolute()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::PATH_INVALID,
                            "Journal paths must be absolute",
                            fmt::format("path '{}'", text));
    }
    if (text.find_first_of("|\n\r") != std::string::npos) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::PATH_INVALID,
                            "Journal paths must not contain '|' or line breaks",
                            fmt::format("path '{}'", text));
    }
}

[[noreturn]] void corrupted(std::size_t line_number, const std::string& reason)
{
    THROW_APP_ERROR_MSG(ErrorCodes::Code::JOURNAL_CORRUPTED,
                        fmt::format("Malformed journal entry: {}", reason),
                        fmt::format("line {}", line_number));
}
}


const char* journal_token(MutationKind kind)
{
    switch (kind) {
        case MutationKind::FileCreated: return "CREATED";
        case MutationKind::DirCreated: return "CREATED_DIR";
        case MutationKind::FileModified: return "MODIFIED";
        case MutationKind::DirModified: return "MODIFIED_DIR";
    }
    return "UNKNOWN";
}


std::optional<MutationKind> kind_from_token(std::string_view token)
{
    if (token == "CREATED") return MutationKind::FileCreated;
    if (token == "CREATED_DIR") return MutationKind::DirCreated;
    if (token == "MODIFIED") return MutationKind::FileModified;
    if (token == "MODIFIED_DIR") return MutationKind::DirModified;
    return std::nullopt;
}


MutationRecord::MutationRecord(MutationKind kind,
                               std::filesystem::path target,
                               std::optional<std::filesystem::path> backup)
    : kind_(kind),
      target_path_(std::move(target)),
      backup_path_(std::move(backup))
{
}


MutationRecord MutationRecord::created(MutationKind kind, std::filesystem::path target)
{
    if (!is_created_kind(kind)) {
        throw std::invalid_argument("created() requires FileCreated or DirCreated, got " + to_string(kind));
    }
    return MutationRecord(kind, std::move(target), std::nullopt);
}


MutationRecord MutationRecord::modified(MutationKind kind,
                                        std::filesystem::path target,
                                        std::filesystem::path backup)
{
    if (is_created_kind(kind)) {
        throw std::invalid_argument("modified() requires FileModified or DirModified, got " + to_string(kind));
    }
    if (backup.empty()) {
        throw std::invalid_argument("modified record for '" + target.string() + "' needs a backup path");
    }
    return MutationRecord(kind, std::move(target), std::move(backup));
}


std::string encode_record(const MutationRecord& record)
{
    ensure_encodable(record.target_path());
    if (!record.backup_path()) {
        return fmt::format("{}{}{}", journal_token(record.kind()), kFieldSeparator,
                           record.target_path().string());
    }
    ensure_encodable(*record.backup_path());
    return fmt::format("{}{}{}{}{}", journal_token(record.kind()), kFieldSeparator,
                       record.target_path().string(), kFieldSeparator,
                       record.backup_path()->string());
}


MutationRecord decode_record(std::string_view line, std::size_t line_number)
{
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    const auto fields = split_fields(line);
    if (fields.size() < 2 || fields.size() > 3) {
        corrupted(line_number, fmt::format("expected 2 or 3 fields, found {}", fields.size()));
    }

    const auto kind = kind_from_token(fields[0]);
    if (!kind) {
        corrupted(line_number, fmt::format("unknown kind '{}'", fields[0]));
    }
    if (fields[1].empty()) {
        corrupted(line_number, "empty target path");
    }

    const std::filesystem::path target{std::string(fields[1])};
    const bool has_backup = fields.size() == 3 && !fields[2].empty();

    if (is_created_kind(*kind)) {
        if (has_backup) {
            corrupted(line_number, fmt::format("{} entry must not carry a backup", fields[0]));
        }
        return MutationRecord::created(*kind, target);
    }
    if (!has_backup) {
        corrupted(line_number, fmt::format("{} entry is missing its backup path", fields[0]));
    }
    return MutationRecord::modified(*kind, target, std::filesystem::path{std::string(fields[2])});
}
