// Listing parser, metadata normalization and path helper tests (run via CTest).
#include "termxfer/ListingParser.hpp"
#include "termxfer/MetadataNormalizer.hpp"
#include "termxfer/PathUtils.hpp"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using termxfer::RawEntry;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

// 2024-03-10 12:00:00 UTC
constexpr std::time_t kNow = 1710072000;

void test_ls_file_and_dir(TestContext &t) {
    RawEntry r;
    t.check(termxfer::parseLsLine(
                "-rw-r--r--    1 1000     1000        34567 Nov  5  2019 photo.jpg", "/srv",
                r, kNow),
            "regular file line should parse");
    t.check(r.path == "/srv/photo.jpg", "path should join the listed dir and the name");
    t.check(!r.is_dir && !r.is_symlink, "'-' type should be a plain file");
    t.check(r.mode == std::optional<std::uint32_t>(0100644), "mode should carry type and permissions");
    t.check(r.uid == std::optional<std::uint32_t>(1000) &&
                r.gid == std::optional<std::uint32_t>(1000),
            "numeric owner and group should be kept");
    t.check(r.size == std::optional<std::uint64_t>(34567), "size should be parsed");
    t.check(r.mtime == std::optional<std::uint64_t>(1572912000),
            "dates with a year should be taken at midnight UTC");

    RawEntry d;
    t.check(termxfer::parseLsLine("drwxr-x---    2 alice    staff        4096 Mar 10 08:00 build",
                                  "/", d, kNow),
            "directory line should parse");
    t.check(d.path == "/build" && d.is_dir, "'d' type should be a directory");
    t.check(d.mode == std::optional<std::uint32_t>(040750), "directory mode should be 040750");
    t.check(!d.uid && !d.gid, "symbolic owner names should leave uid/gid unknown");
    t.check(d.mtime == std::optional<std::uint64_t>(1710057600),
            "recent dates should use the current year");

    RawEntry acl;
    t.check(termxfer::parseLsLine("-rw-r--r--+ 1 0 0 12 Mar 10 08:00 acl.txt", "/tmp", acl, kNow),
            "ACL marker after the permissions should be accepted");
}

void test_ls_special_lines(TestContext &t) {
    RawEntry r;
    t.check(!termxfer::parseLsLine("total 48", "/", r, kNow), "'total' line should be skipped");
    t.check(!termxfer::parseLsLine("drwxr-xr-x 2 0 0 4096 Mar 10 08:00 .", "/", r, kNow),
            "'.' should be skipped");
    t.check(!termxfer::parseLsLine("drwxr-xr-x 9 0 0 4096 Mar 10 08:00 ..", "/", r, kNow),
            "'..' should be skipped");
    t.check(!termxfer::parseLsLine("not a listing line", "/", r, kNow),
            "garbage should be rejected");

    t.check(termxfer::parseLsLine("-rw-r--r-- 1 0 0 12 Mar 10 08:00 my file.txt\r", "/data", r,
                                  kNow),
            "names with spaces should parse");
    t.check(r.path == "/data/my file.txt", "name should keep its inner spaces and lose the CR");

    t.check(termxfer::parseLsLine("lrwxrwxrwx 1 0 0 6 Mar 10 08:00 latest -> v1.2.3", "/opt",
                                  r, kNow),
            "symlink line should parse");
    t.check(r.is_symlink && r.path == "/opt/latest", "link name should stop before the arrow");
    t.check(r.link_target == std::optional<std::string>("v1.2.3"),
            "link target should follow the arrow");
    t.check(r.mode == std::optional<std::uint32_t>(0120777), "link mode should be 0120777");
}

void test_ls_year_inference(TestContext &t) {
    RawEntry r;
    t.check(termxfer::parseLsLine("-rw-r--r-- 1 0 0 1 Dec 31 23:59 old", "/", r, kNow),
            "December line should parse");
    t.check(r.mtime == std::optional<std::uint64_t>(1704067140),
            "dates that would be in the future belong to the previous year");

    t.check(termxfer::parseLsLine("-rw-r--r-- 1 0 0 1 Mar 11 11:00 skew", "/", r, kNow),
            "next-day line should parse");
    t.check(r.mtime == std::optional<std::uint64_t>(1710154800),
            "a small clock skew should keep the current year");
}

void test_perm_strings(TestContext &t) {
    t.check(termxfer::modeFromPermString("rwxr-xr-x") == std::optional<std::uint32_t>(0755),
            "rwxr-xr-x should be 0755");
    t.check(termxfer::modeFromPermString("rwsr-xr-x") == std::optional<std::uint32_t>(04755),
            "lowercase s should set setuid and execute");
    t.check(termxfer::modeFromPermString("rw-r-Sr--") == std::optional<std::uint32_t>(02644),
            "uppercase S should set setgid without execute");
    t.check(termxfer::modeFromPermString("rwxrwxrwt") == std::optional<std::uint32_t>(01777),
            "t should set the sticky bit");
    t.check(termxfer::modeFromPermString("---------") == std::optional<std::uint32_t>(0),
            "no permissions should be 0");
    t.check(!termxfer::modeFromPermString("rwx"), "short strings should be rejected");
    t.check(!termxfer::modeFromPermString("rwxqwxrwx"), "unknown letters should be rejected");
}

void test_mlsd(TestContext &t) {
    RawEntry r;
    t.check(termxfer::parseMlsdLine(
                "type=file;size=1024;modify=20210203040506;UNIX.mode=0644;UNIX.uid=1000;"
                "UNIX.gid=100; report.pdf",
                "/pub", r),
            "MLSD file line should parse");
    t.check(r.path == "/pub/report.pdf" && !r.is_dir, "MLSD file should be a file");
    t.check(r.size == std::optional<std::uint64_t>(1024), "size fact should be parsed");
    t.check(r.mtime == std::optional<std::uint64_t>(1612325106), "modify fact should be UTC");
    t.check(r.mode == std::optional<std::uint32_t>(0644), "UNIX.mode should be octal");
    t.check(r.uid == std::optional<std::uint32_t>(1000) &&
                r.gid == std::optional<std::uint32_t>(100),
            "UNIX.uid and UNIX.gid should be parsed");

    t.check(termxfer::parseMlsdLine("Type=dir;Modify=20210203040506; with space", "/pub", r),
            "MLSD dir line should parse");
    t.check(r.is_dir && r.path == "/pub/with space", "dir name may contain spaces");
    t.check(!r.size, "size should stay unknown when not reported");

    t.check(!termxfer::parseMlsdLine("type=cdir;modify=20210203040506; .", "/pub", r),
            "cdir should be skipped");
    t.check(!termxfer::parseMlsdLine("type=pdir; ..", "/pub", r), "pdir should be skipped");
    t.check(!termxfer::parseMlsdLine("size=10; untyped", "/pub", r),
            "entries without a type fact should be rejected");

    t.check(termxfer::parseMlsdLine("type=OS.unix=slink:/etc/target;size=abc; link", "/pub", r),
            "slink line should parse");
    t.check(r.is_symlink && r.link_target == std::optional<std::string>("/etc/target"),
            "slink target should be taken from the type fact");
    t.check(!r.size, "non-numeric size should be ignored");

    t.check(termxfer::parseMlsdTime("20210203040506.123") ==
                std::optional<std::uint64_t>(1612325106),
            "fractional seconds should be ignored");
    t.check(!termxfer::parseMlsdTime("2021-02-03"), "malformed time should be rejected");
}

void test_oversized_numbers(TestContext &t) {
    RawEntry r;
    t.check(termxfer::parseMlsdLine("type=file;size=1;unix.uid=99999999999999999999; a.txt",
                                    "/pub", r),
            "huge uid should not reject the entry");
    t.check(!r.uid && r.size == std::optional<std::uint64_t>(1),
            "huge uid should stay unknown and keep the other facts");

    t.check(termxfer::parseMlsdLine("type=file;unix.uid=4294967296;unix.gid=4294967295; b.txt",
                                    "/pub", r),
            "uid past 32 bits should parse the line");
    t.check(!r.uid, "uid past 32 bits should not wrap to 0");
    t.check(r.gid == std::optional<std::uint32_t>(4294967295u), "largest gid should be kept");

    t.check(termxfer::parseMlsdLine("type=file;size=999999999999999999999; c.txt", "/pub", r),
            "huge size fact should parse the line");
    t.check(!r.size, "size past 64 bits should stay unknown");
    t.check(termxfer::parseMlsdLine("type=file;UNIX.mode=77777777777777777777777; d.txt", "/pub",
                                    r) &&
                !r.mode,
            "huge mode should stay unknown");

    t.check(termxfer::parseLsLine(
                "-rw-r--r-- 1 0 99999999999 123456789012345678901 Mar 10 08:00 big.iso", "/",
                r, kNow),
            "ls line with a 21-digit size should parse");
    t.check(r.path == "/big.iso" && !r.size, "21-digit size should stay unknown");
    t.check(r.uid == std::optional<std::uint32_t>(0) && !r.gid,
            "out of range gid should stay unknown");
}

void test_pasv_reply(TestContext &t) {
    t.check(termxfer::parsePasvPort("Entering Passive Mode (192,168,1,2,195,80).") ==
                std::optional<std::uint16_t>(50000),
            "PASV port should be p1*256+p2");
    t.check(termxfer::parsePasvPort("Entering Passive Mode (10,0,0,1,255,255)") ==
                std::optional<std::uint16_t>(65535),
            "largest PASV port should be accepted");
    t.check(!termxfer::parsePasvPort("Entering Passive Mode (10,0,0,1,256,0)"),
            "port octet over 255 should be rejected");
    t.check(!termxfer::parsePasvPort("Entering Passive Mode (10,0,0,999,4,1)"),
            "address octet over 255 should be rejected");
    t.check(!termxfer::parsePasvPort("Entering Passive Mode (1,2,3,4,5,99999999999999999999999)"),
            "huge PASV field should be rejected without throwing");
    t.check(!termxfer::parsePasvPort("Entering Passive Mode (10,0,0,1,0,0)"),
            "port 0 should be rejected");
    t.check(!termxfer::parsePasvPort("Entering Passive Mode"), "missing tuple should be rejected");
}

void test_normalize_entry(TestContext &t) {
    RawEntry raw;
    raw.path = "/srv/archive.tar.gz";
    raw.size = 42;
    raw.mode = 0100640;
    raw.mtime = 1600000000;
    raw.uid = 7;
    const auto file = termxfer::normalizeEntry(raw, {});
    const auto *f = std::get_if<termxfer::FsFile>(&file);
    t.check(f != nullptr, "non-directory raw entry should become a file");
    if (f) {
        t.check(f->name == "archive.tar.gz" && f->abs_path == raw.path,
                "name and path should come from the raw path");
        t.check(f->ftype == std::optional<std::string>("gz"), "ftype should be the last extension");
        t.check(f->unix_pex == termxfer::UnixPex{6, 4, 0}, "type bits should not leak into pex");
        t.check(f->last_access_time == 0 && f->creation_time == 0,
                "unknown times should stay at epoch");
        t.check(!f->readonly, "readonly should not be inferred");
        t.check(!f->group.has_value(), "unknown group should stay empty");
    }

    RawEntry link;
    link.path = "/srv/current";
    link.is_dir = true;
    link.is_symlink = true;
    int calls = 0;
    const auto dir = termxfer::normalizeEntry(link, [&calls](const std::string &p) {
        ++calls;
        return p == "/srv/current" ? std::optional<std::string>("releases/7") : std::nullopt;
    });
    t.check(termxfer::isDirectory(dir), "link to a directory should become a directory");
    t.check(calls == 1, "link reader should be asked once");
    t.check(termxfer::entrySymlink(dir) == std::optional<std::string>("releases/7"),
            "link target should come from the reader");

    link.link_target = "releases/8";
    calls = 0;
    const auto known = termxfer::normalizeEntry(link, [&calls](const std::string &) {
        ++calls;
        return std::optional<std::string>();
    });
    t.check(calls == 0 && termxfer::entrySymlink(known) == std::optional<std::string>("releases/8"),
            "a target already in the listing should be used as is");

    t.check(!termxfer::pexFromMode(std::nullopt), "no mode should give no pex");
    t.check(termxfer::pexFromMode(0) == std::optional<termxfer::UnixPex>(termxfer::UnixPex{}),
            "mode 0 should give (0,0,0)");
}

void test_path_utils(TestContext &t) {
    t.check(termxfer::joinPath("/home/alice", "docs") == "/home/alice/docs", "join relative");
    t.check(termxfer::joinPath("/", "etc") == "/etc", "join at root");
    t.check(termxfer::joinPath("/home/alice", "/etc") == "/etc", "join absolute");
    t.check(termxfer::joinPath("/tmp/", "x") == "/tmp/x", "join with trailing slash");

    t.check(termxfer::normalizePath("/a//b/./c/../d") == "/a/b/d", "normalize collapses segments");
    t.check(termxfer::normalizePath("/..") == "/", "'..' stops at the root");
    t.check(termxfer::normalizePath("a/../..") == "..", "relative paths keep leading '..'");

    t.check(termxfer::baseName("/a/b/") == "b", "baseName ignores trailing slashes");
    t.check(termxfer::baseName("/").empty(), "root has no base name");
    t.check(termxfer::parentPath("/a") == "/", "top level parent is the root");
    t.check(termxfer::parentPath("/a/b/c") == "/a/b", "parent of a nested path");

    t.check(termxfer::extensionOf("photo.JPG") == std::optional<std::string>("JPG"),
            "extension keeps its case");
    t.check(!termxfer::extensionOf(".profile"), "hidden files have no extension");
    t.check(!termxfer::extensionOf("Makefile"), "names without dot have no extension");
    t.check(!termxfer::extensionOf("trailing."), "a trailing dot is no extension");
}

} // namespace

int main() {
    TestContext t;
    test_ls_file_and_dir(t);
    test_ls_special_lines(t);
    test_ls_year_inference(t);
    test_perm_strings(t);
    test_mlsd(t);
    test_oversized_numbers(t);
    test_pasv_reply(t);
    test_normalize_entry(t);
    test_path_utils(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] termxfer_listing_tests\n";
    return EXIT_SUCCESS;
}
