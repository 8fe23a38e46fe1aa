// Maps raw transport listings into FsEntry values.
#pragma once
#include "FsTypes.hpp"
#include "RemoteSession.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace termxfer {

// Owner/group/other triple of a POSIX mode. No mode, no triple: 0 is a valid
// permission and must stay distinguishable from "unknown".
std::optional<UnixPex> pexFromMode(std::optional<std::uint32_t> mode);

// Resolves a symlink target; std::nullopt when it cannot be read.
using LinkReader = std::function<std::optional<std::string>(const std::string& path)>;

FsEntry normalizeEntry(const RawEntry& raw, const LinkReader& readLink);

// One FsEntry per raw entry, same order. Per-entry failures (unreadable link,
// missing fields) degrade the entry, they never drop it.
std::vector<FsEntry> normalizeListing(const std::vector<RawEntry>& raw,
                                      RemoteSession& session);

} // namespace termxfer
