// Text listing parsers for transports without structured attributes:
// POSIX "ls -l" lines (SCP over a shell, FTP LIST), RFC 3659 MLSD facts
// and the FTP PASV reply.
#pragma once
#include "RemoteSession.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace termxfer {

// Permission bits of a "rwxr-x---" style string (9 chars, setuid/setgid/
// sticky letters included). std::nullopt when malformed.
std::optional<std::uint32_t> modeFromPermString(const std::string& perms);

// One "ls -l" line into out (path = dir joined with the name). Returns false
// for lines that are not entries ("total N", ".", "..", garbage).
// now decides the year of recent dates printed as "Mon DD HH:MM".
bool parseLsLine(const std::string& line, const std::string& dir, RawEntry& out,
                 std::time_t now = std::time(nullptr));

// One MLSD line ("fact=value;...; name"). Returns false for cdir/pdir
// entries and malformed lines.
bool parseMlsdLine(const std::string& line, const std::string& dir, RawEntry& out);

// "YYYYMMDDHHMMSS[.sss]" (UTC) into epoch seconds.
std::optional<std::uint64_t> parseMlsdTime(const std::string& value);

// Data port of a "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)" reply.
// std::nullopt when a field is above 255 or the port is 0.
std::optional<std::uint16_t> parsePasvPort(const std::string& reply);

} // namespace termxfer
