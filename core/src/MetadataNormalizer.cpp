#include "termxfer/MetadataNormalizer.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtils.hpp"

namespace termxfer {

std::optional<UnixPex> pexFromMode(std::optional<std::uint32_t> mode) {
    if (!mode) return std::nullopt;
    UnixPex p;
    p.user = static_cast<std::uint8_t>((*mode >> 6) & 0x7);
    p.group = static_cast<std::uint8_t>((*mode >> 3) & 0x7);
    p.others = static_cast<std::uint8_t>(*mode & 0x7);
    return p;
}

template <typename T>
static void fillCommon(T& out, const RawEntry& raw, std::optional<std::string> link) {
    out.name = baseName(raw.path);
    out.abs_path = raw.path;
    // Missing timestamps stay at epoch; never "now".
    out.last_change_time = raw.mtime.value_or(0);
    out.last_access_time = raw.atime.value_or(0);
    out.creation_time = 0;
    out.readonly = false;
    out.is_symlink = raw.is_symlink;
    out.symlink = std::move(link);
    out.user = raw.uid;
    out.group = raw.gid;
    out.unix_pex = pexFromMode(raw.mode);
}

FsEntry normalizeEntry(const RawEntry& raw, const LinkReader& readLink) {
    std::optional<std::string> link;
    if (raw.is_symlink) {
        if (raw.link_target) {
            link = raw.link_target;
        } else if (readLink) {
            link = readLink(raw.path);
        }
    }
    if (raw.is_dir) {
        FsDirectory d;
        fillCommon(d, raw, std::move(link));
        return d;
    }
    FsFile f;
    fillCommon(f, raw, std::move(link));
    f.size = raw.size.value_or(0);
    f.ftype = extensionOf(f.name);
    return f;
}

std::vector<FsEntry> normalizeListing(const std::vector<RawEntry>& raw,
                                      RemoteSession& session) {
    const LinkReader reader = [&session](const std::string& path) -> std::optional<std::string> {
        std::string target;
        std::string err;
        if (!session.readlink(path, target, err)) {
            LOGI("readlink failed for %s: %s", redact(path), err.c_str());
            return std::nullopt;
        }
        return target;
    };
    std::vector<FsEntry> out;
    out.reserve(raw.size());
    for (const auto& r : raw) out.push_back(normalizeEntry(r, reader));
    return out;
}

} // namespace termxfer
