// Normalized remote filesystem entries shared by every transfer backend.
// An entry is either a file or a directory; fields the backend cannot
// report stay empty (std::nullopt) instead of holding a sentinel value.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace termxfer {

// POSIX permission triple, each value in 0..7.
struct UnixPex {
    std::uint8_t user = 0;
    std::uint8_t group = 0;
    std::uint8_t others = 0;

    bool operator==(const UnixPex& o) const {
        return user == o.user && group == o.group && others == o.others;
    }
    bool operator!=(const UnixPex& o) const { return !(*this == o); }
};

struct FsFile {
    std::string   name;        // final component of abs_path
    std::string   abs_path;    // absolute in the remote namespace
    std::uint64_t size = 0;    // bytes
    std::optional<std::string> ftype;  // extension, without the dot
    std::uint64_t last_change_time = 0;  // epoch (seconds)
    std::uint64_t last_access_time = 0;
    std::uint64_t creation_time = 0;
    bool          readonly = false;
    bool          is_symlink = false;  // set even when the target is unreadable
    std::optional<std::string>   symlink;
    std::optional<std::uint32_t> user;
    std::optional<std::uint32_t> group;
    std::optional<UnixPex>       unix_pex;
};

struct FsDirectory {
    std::string   name;
    std::string   abs_path;
    std::uint64_t last_change_time = 0;
    std::uint64_t last_access_time = 0;
    std::uint64_t creation_time = 0;
    bool          readonly = false;
    bool          is_symlink = false;
    std::optional<std::string>   symlink;
    std::optional<std::uint32_t> user;
    std::optional<std::uint32_t> group;
    std::optional<UnixPex>       unix_pex;
};

using FsEntry = std::variant<FsFile, FsDirectory>;

inline bool isDirectory(const FsEntry& e) {
    return std::holds_alternative<FsDirectory>(e);
}

inline const std::string& entryName(const FsEntry& e) {
    return std::visit([](const auto& v) -> const std::string& { return v.name; }, e);
}

inline const std::string& entryPath(const FsEntry& e) {
    return std::visit([](const auto& v) -> const std::string& { return v.abs_path; }, e);
}

inline bool isSymlink(const FsEntry& e) {
    return std::visit([](const auto& v) { return v.is_symlink; }, e);
}

inline const std::optional<std::string>& entrySymlink(const FsEntry& e) {
    return std::visit(
        [](const auto& v) -> const std::optional<std::string>& { return v.symlink; }, e);
}

inline const std::optional<UnixPex>& entryPex(const FsEntry& e) {
    return std::visit(
        [](const auto& v) -> const std::optional<UnixPex>& { return v.unix_pex; }, e);
}

inline std::uint64_t entryMtime(const FsEntry& e) {
    return std::visit([](const auto& v) { return v.last_change_time; }, e);
}

} // namespace termxfer
