// Lexical helpers for remote (POSIX style) paths. None of these touch the
// remote side; canonicalization against the server is FileTransfer's job.
#pragma once
#include <optional>
#include <string>

namespace termxfer {

inline bool isAbsolutePath(const std::string& p) {
    return !p.empty() && p.front() == '/';
}

// base + p; an absolute p is returned as is.
std::string joinPath(const std::string& base, const std::string& p);

// Collapses "//", "." and ".." without consulting the server.
std::string normalizePath(const std::string& p);

// Final component ("" for "/" or an empty path). Trailing slashes ignored.
std::string baseName(const std::string& p);

// Everything before the final component ("/" for top level entries).
std::string parentPath(const std::string& p);

// Extension of a file name, without the dot. Hidden files like ".profile"
// and names ending with a dot have none.
std::optional<std::string> extensionOf(const std::string& name);

} // namespace termxfer
