#include "termxfer/ListingParser.hpp"
#include "termxfer/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>

namespace termxfer {

namespace {

// Digits only, no sign or blanks. std::nullopt above max.
std::optional<std::uint64_t> parseBounded(const std::string& s, std::uint64_t max,
                                          int base = 10) {
    if (s.empty()) return std::nullopt;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        if (base == 8 && c > '7') return std::nullopt;
    }
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), nullptr, base);
    if (errno == ERANGE || v > max) return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

std::optional<std::uint32_t> parseUnsigned(const std::string& s, int base = 10) {
    const auto v = parseBounded(s, std::numeric_limits<std::uint32_t>::max(), base);
    if (!v) return std::nullopt;
    return static_cast<std::uint32_t>(*v);
}

std::optional<std::uint64_t> parseSize(const std::string& s) {
    return parseBounded(s, std::numeric_limits<std::uint64_t>::max());
}

int monthIndex(const std::string& m) {
    static const char* kMonths[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                    "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string low = m;
    std::transform(low.begin(), low.end(), low.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (int i = 0; i < 12; ++i) {
        if (low == kMonths[i]) return i;
    }
    return -1;
}

std::optional<std::uint64_t> toEpoch(std::tm& tm) {
    const std::time_t t = timegm(&tm);
    if (t < 0) return std::nullopt;
    return static_cast<std::uint64_t>(t);
}

// "Nov  5 16:32" or "Nov  5  2019"
std::optional<std::uint64_t> parseLsDate(const std::string& text, std::time_t now) {
    static const std::regex re(R"(^([A-Za-z]{3})\s+(\d{1,2})\s+(?:(\d{1,2}):(\d{2})|(\d{4}))$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) return std::nullopt;
    const int month = monthIndex(m[1].str());
    if (month < 0) return std::nullopt;

    std::tm tm{};
    tm.tm_mon = month;
    tm.tm_mday = std::stoi(m[2].str());
    if (m[5].matched) {
        tm.tm_year = std::stoi(m[5].str()) - 1900;
        return toEpoch(tm);
    }
    // Recent files: the year is omitted and is the current one, unless that
    // would put the date in the future.
    std::tm nowTm{};
    gmtime_r(&now, &nowTm);
    tm.tm_year = nowTm.tm_year;
    tm.tm_hour = std::stoi(m[3].str());
    tm.tm_min = std::stoi(m[4].str());
    std::tm probe = tm;
    const std::time_t t = timegm(&probe);
    if (t > now + 86400) tm.tm_year -= 1;
    return toEpoch(tm);
}

} // namespace

std::optional<std::uint32_t> modeFromPermString(const std::string& perms) {
    if (perms.size() != 9) return std::nullopt;
    std::uint32_t mode = 0;
    for (int cls = 0; cls < 3; ++cls) {
        const char r = perms[cls * 3];
        const char w = perms[cls * 3 + 1];
        const char x = perms[cls * 3 + 2];
        if ((r != 'r' && r != '-') || (w != 'w' && w != '-')) return std::nullopt;
        std::uint32_t bits = 0;
        if (r == 'r') bits |= 4;
        if (w == 'w') bits |= 2;
        const std::uint32_t special = cls == 0 ? 04000 : (cls == 1 ? 02000 : 01000);
        switch (x) {
        case 'x':
            bits |= 1;
            break;
        case '-':
            break;
        case 's':
        case 't':
            bits |= 1;
            mode |= special;
            break;
        case 'S':
        case 'T':
            mode |= special;
            break;
        default:
            return std::nullopt;
        }
        mode |= bits << ((2 - cls) * 3);
    }
    return mode;
}

bool parseLsLine(const std::string& line, const std::string& dir, RawEntry& out,
                 std::time_t now) {
    static const std::regex re(
        R"(^([\-bcdlps])([\-rwxsStT]{9})[\.\+@]?\s+\d+\s+(\S+)\s+(\S+)\s+(\d+)\s+([A-Za-z]{3}\s+\d{1,2}\s+(?:\d{1,2}:\d{2}|\d{4}))\s(.+)$)");
    std::string l = line;
    while (!l.empty() && (l.back() == '\r' || l.back() == '\n')) l.pop_back();
    std::smatch m;
    if (!std::regex_match(l, m, re)) return false;

    std::string name = m[7].str();
    // ls pads the name column with a single separator; extra spaces belong
    // to the name only after the first one.
    if (!name.empty() && name.front() == ' ') name.erase(0, name.find_first_not_of(' '));

    RawEntry r;
    const char type = m[1].str()[0];
    r.is_dir = type == 'd';
    r.is_symlink = type == 'l';
    if (r.is_symlink) {
        const auto arrow = name.find(" -> ");
        if (arrow != std::string::npos) {
            r.link_target = name.substr(arrow + 4);
            name = name.substr(0, arrow);
        }
    }
    if (name.empty() || name == "." || name == "..") return false;

    r.path = joinPath(dir, name);
    std::uint32_t typeBits = 0100000;
    if (r.is_dir) typeBits = 040000;
    if (r.is_symlink) typeBits = 0120000;
    if (auto mode = modeFromPermString(m[2].str())) r.mode = *mode | typeBits;
    r.uid = parseUnsigned(m[3].str());
    r.gid = parseUnsigned(m[4].str());
    r.size = parseSize(m[5].str());
    r.mtime = parseLsDate(m[6].str(), now);
    out = std::move(r);
    return true;
}

std::optional<std::uint64_t> parseMlsdTime(const std::string& value) {
    if (value.size() < 14) return std::nullopt;
    for (std::size_t i = 0; i < 14; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = std::stoi(value.substr(0, 4)) - 1900;
    tm.tm_mon = std::stoi(value.substr(4, 2)) - 1;
    tm.tm_mday = std::stoi(value.substr(6, 2));
    tm.tm_hour = std::stoi(value.substr(8, 2));
    tm.tm_min = std::stoi(value.substr(10, 2));
    tm.tm_sec = std::stoi(value.substr(12, 2));
    return toEpoch(tm);
}

bool parseMlsdLine(const std::string& line, const std::string& dir, RawEntry& out) {
    std::string l = line;
    while (!l.empty() && (l.back() == '\r' || l.back() == '\n')) l.pop_back();
    const auto sep = l.find(' ');
    if (sep == std::string::npos || sep + 1 >= l.size()) return false;
    const std::string facts = l.substr(0, sep);
    const std::string name = l.substr(sep + 1);

    RawEntry r;
    bool typed = false;
    std::size_t i = 0;
    while (i < facts.size()) {
        std::size_t j = facts.find(';', i);
        if (j == std::string::npos) j = facts.size();
        const std::string fact = facts.substr(i, j - i);
        i = j + 1;
        const auto eq = fact.find('=');
        if (eq == std::string::npos) continue;
        std::string key = fact.substr(0, eq);
        const std::string value = fact.substr(eq + 1);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key == "type") {
            std::string v = value;
            std::transform(v.begin(), v.end(), v.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (v == "cdir" || v == "pdir") return false;
            typed = true;
            r.is_dir = v == "dir";
            if (v == "os.unix=symlink" || v.rfind("os.unix=slink", 0) == 0) {
                r.is_symlink = true;
                const auto colon = value.find(':');
                if (colon != std::string::npos && colon + 1 < value.size())
                    r.link_target = value.substr(colon + 1);
            }
        } else if (key == "size" || key == "sizd") {
            r.size = parseSize(value);
        } else if (key == "modify") {
            r.mtime = parseMlsdTime(value);
        } else if (key == "unix.mode") {
            r.mode = parseUnsigned(value, 8);
        } else if (key == "unix.uid" || key == "unix.owner") {
            r.uid = parseUnsigned(value);
        } else if (key == "unix.gid" || key == "unix.group") {
            r.gid = parseUnsigned(value);
        }
    }
    if (!typed || name.empty() || name == "." || name == "..") return false;
    r.path = joinPath(dir, name);
    out = std::move(r);
    return true;
}

std::optional<std::uint16_t> parsePasvPort(const std::string& reply) {
    static const std::regex re(R"(\((\d+),(\d+),(\d+),(\d+),(\d+),(\d+)\))");
    std::smatch m;
    if (!std::regex_search(reply, m, re)) return std::nullopt;
    std::uint64_t octets[6];
    for (int i = 0; i < 6; ++i) {
        const auto v = parseBounded(m[i + 1].str(), 255);
        if (!v) return std::nullopt;
        octets[i] = *v;
    }
    const std::uint64_t port = octets[4] * 256 + octets[5];
    if (port == 0) return std::nullopt;
    return static_cast<std::uint16_t>(port);
}

} // namespace termxfer
