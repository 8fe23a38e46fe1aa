#include "termxfer/PathUtils.hpp"
#include <vector>

namespace termxfer {

std::string joinPath(const std::string& base, const std::string& p) {
    if (isAbsolutePath(p)) return p;
    if (p.empty()) return base.empty() ? std::string("/") : base;
    if (base.empty()) return std::string("/") + p;
    if (base.back() == '/') return base + p;
    return base + "/" + p;
}

std::string normalizePath(const std::string& p) {
    const bool absolute = isAbsolutePath(p);
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= p.size()) {
        std::size_t j = p.find('/', i);
        if (j == std::string::npos) j = p.size();
        std::string seg = p.substr(i, j - i);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back(seg);
            }
        } else {
            parts.push_back(std::move(seg));
        }
        i = j + 1;
    }
    std::string out = absolute ? "/" : "";
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k) out += '/';
        out += parts[k];
    }
    if (out.empty()) out = ".";
    return out;
}

static std::string stripTrailingSlashes(const std::string& p) {
    std::string s = p;
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::string baseName(const std::string& p) {
    const std::string s = stripTrailingSlashes(p);
    if (s.empty() || s == "/") return {};
    const auto pos = s.rfind('/');
    return pos == std::string::npos ? s : s.substr(pos + 1);
}

std::string parentPath(const std::string& p) {
    const std::string s = stripTrailingSlashes(p);
    const auto pos = s.rfind('/');
    if (pos == std::string::npos) return {};
    if (pos == 0) return "/";
    return s.substr(0, pos);
}

std::optional<std::string> extensionOf(const std::string& name) {
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
        return std::nullopt;
    return name.substr(dot + 1);
}

} // namespace termxfer
