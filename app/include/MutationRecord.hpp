#ifndef MUTATION_RECORD_HPP
#define MUTATION_RECORD_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

enum class MutationKind {
    FileCreated,
    DirCreated,
    FileModified,
    DirModified
};

inline bool is_created_kind(MutationKind kind) {
    return kind == MutationKind::FileCreated || kind == MutationKind::DirCreated;
}

inline bool is_directory_kind(MutationKind kind) {
    return kind == MutationKind::DirCreated || kind == MutationKind::DirModified;
}

inline std::string to_string(MutationKind kind) {
    switch (kind) {
        case MutationKind::FileCreated: return "FileCreated";
        case MutationKind::DirCreated: return "DirCreated";
        case MutationKind::FileModified: return "FileModified";
        case MutationKind::DirModified: return "DirModified";
        default: return "Unknown";
    }
}

// Tokens written to the journal file.
const char* journal_token(MutationKind kind);
std::optional<MutationKind> kind_from_token(std::string_view token);

/**
 * @brief One journaled filesystem change.
 *
 * A created record never carries a backup; a modified record always does.
 * Records are immutable once built.
 */
class MutationRecord {
public:
    static MutationRecord created(MutationKind kind, std::filesystem::path target);
    static MutationRecord modified(MutationKind kind,
                                   std::filesystem::path target,
                                   std::filesystem::path backup);

    MutationKind kind() const { return kind_; }
    const std::filesystem::path& target_path() const { return target_path_; }
    const std::optional<std::filesystem::path>& backup_path() const { return backup_path_; }

    bool operator==(const MutationRecord& other) const = default;

private:
    MutationRecord(MutationKind kind,
                   std::filesystem::path target,
                   std::optional<std::filesystem::path> backup);

    MutationKind kind_;
    std::filesystem::path target_path_;
    std::optional<std::filesystem::path> backup_path_;
};

/**
 * @brief Encode a record as one journal line (no trailing newline).
 * @throws ErrorCodes::AppException PATH_INVALID when a path is relative or
 *         contains the field separator or a line break.
 */
std::string encode_record(const MutationRecord& record);

/**
 * @brief Decode one journal line.
 * @param line_number Reported in the error context.
 * @throws ErrorCodes::AppException JOURNAL_CORRUPTED on malformed input.
 */
MutationRecord decode_record(std::string_view line, std::size_t line_number);

#endif
