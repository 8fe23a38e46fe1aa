// Credential vault, configuration and address parsing tests (run via CTest).
#include "AppConfig.hpp"
#include "BookmarksClient.hpp"
#include "RemoteAddress.hpp"

#include <QByteArray>
#include <QCoreApplication>
#include <QTemporaryDir>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using termxfer::FileTransferProtocol;

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

struct VaultPaths {
    QString bookmarks;
    QString key;
};

VaultPaths pathsIn(const QTemporaryDir &dir) {
    return {dir.filePath(QStringLiteral("cfg/bookmarks.ini")),
            dir.filePath(QStringLiteral("cfg/.bookmarks.key"))};
}

std::string readText(const QString &path) {
    std::ifstream in(path.toStdString(), std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool writeText(const QString &path, const std::string &data) {
    std::ofstream out(path.toStdString(), std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return false;
    out << data;
    return static_cast<bool>(out);
}

bool ownerOnly(const QString &path) {
    std::error_code ec;
    const auto perms = fs::status(path.toStdString(), ec).permissions();
    if (ec)
        return false;
    return (perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none;
}

void test_open_creates_files(TestContext &t) {
    QTemporaryDir dir;
    t.check(dir.isValid(), "temp dir should be created");
    const auto p = pathsIn(dir);
    VaultError err;
    auto vault = BookmarksClient::open(p.bookmarks, p.key, 16, err);
    t.check(vault != nullptr, "open should create a missing vault: " + err.toString().toStdString());
    if (!vault)
        return;
    t.check(fs::exists(p.bookmarks.toStdString()), "bookmarks file should be created");
    t.check(fs::file_size(p.key.toStdString()) == BookmarksClient::kKeyLength,
            "key file should hold 32 bytes");
    t.check(ownerOnly(p.key), "key file should be readable by its owner only");
    t.check(ownerOnly(p.bookmarks), "bookmarks file should be readable by its owner only");
    t.check(vault->bookmarkNames().empty() && vault->recentNames().empty(),
            "a new vault should be empty");

    const std::string keyBefore = readText(p.key);
    auto again = BookmarksClient::open(p.bookmarks, p.key, 16, err);
    t.check(again != nullptr, "reopen should succeed");
    t.check(readText(p.key) == keyBefore, "reopen should keep the existing key");
}

void test_encrypt_roundtrip(TestContext &t) {
    QTemporaryDir dir;
    const auto p = pathsIn(dir);
    VaultError err;
    auto vault = BookmarksClient::open(p.bookmarks, p.key, 16, err);
    if (!vault) {
        t.check(false, "open should succeed before encryption test");
        return;
    }
    std::string enc1;
    std::string enc2;
    std::string plain;
    t.check(vault->encryptPassword("hunter2", enc1, err), "encrypt should succeed");
    t.check(vault->encryptPassword("hunter2", enc2, err), "second encrypt should succeed");
    t.check(enc1 != enc2, "every encryption should use a fresh IV");
    t.check(enc1.find("hunter2") == std::string::npos, "ciphertext should not leak the secret");
    t.check(vault->decryptPassword(enc1, plain, err) && plain == "hunter2",
            "decrypt should return the original password");
    t.check(vault->encryptPassword("", enc1, err) && vault->decryptPassword(enc1, plain, err) &&
                plain.empty(),
            "empty passwords should round trip");

    t.check(!vault->decryptPassword("not base64 !!", plain, err) &&
                err.kind == VaultErrorKind::SerializationError,
            "invalid base64 should report SerializationError");
    t.check(!vault->decryptPassword("AAAA", plain, err) &&
                err.kind == VaultErrorKind::SerializationError,
            "truncated blob should report SerializationError");

    t.check(vault->encryptPassword("hunter2", enc1, err), "encrypt should succeed");
    QByteArray blob = QByteArray::fromBase64(QByteArray::fromStdString(enc1));
    blob[BookmarksClient::kIvLength] = static_cast<char>(blob[BookmarksClient::kIvLength] ^ 0x01);
    t.check(!vault->decryptPassword(blob.toBase64().toStdString(), plain, err) &&
                err.kind == VaultErrorKind::CryptoError,
            "tampered ciphertext should report CryptoError");
}

void test_bookmarks_persist(TestContext &t) {
    QTemporaryDir dir;
    const auto p = pathsIn(dir);
    VaultError err;
    {
        auto vault = BookmarksClient::open(p.bookmarks, p.key, 16, err);
        if (!vault) {
            t.check(false, "open should succeed before persistence test");
            return;
        }
        t.check(vault->addBookmark("prod", "prod.example.org", 2222, FileTransferProtocol::Sftp,
                                   "deploy", std::string("s3cret"), err),
                "addBookmark with password should succeed");
        t.check(vault->addBookmark("mirror", "ftp.example.org", 21, FileTransferProtocol::Ftp,
                                   "anonymous", std::nullopt, err),
                "addBookmark without password should succeed");
        t.check(!vault->addBookmark("", "x", 22, FileTransferProtocol::Scp, "u", std::nullopt,
                                    err) &&
                    err.kind == VaultErrorKind::SyntaxError,
                "empty bookmark name should report SyntaxError");
        t.check(vault->writeBookmarks(err), "writeBookmarks should succeed");
    }
    t.check(readText(p.bookmarks).find("s3cret") == std::string::npos,
            "saved passwords should not be stored in clear");

    auto vault = BookmarksClient::open(p.bookmarks, p.key, 16, err);
    t.check(vault != nullptr, "reopen should succeed");
    if (!vault)
        return;
    t.check(vault->bookmarkNames() == std::vector<std::string>{"prod", "mirror"},
            "bookmarks should keep their order");
    const auto prod = vault->getBookmark("prod", err);
    t.check(prod.has_value(), "prod bookmark should load");
    if (prod) {
        t.check(prod->address == "prod.example.org" && prod->port == 2222 &&
                    prod->protocol == FileTransferProtocol::Sftp && prod->username == "deploy",
                "bookmark fields should survive a reopen");
        t.check(prod->password == std::optional<std::string>("s3cret"),
                "saved password should decrypt after a reopen");
    }
    const auto mirror = vault->getBookmark("mirror", err);
    t.check(mirror && mirror->protocol == FileTransferProtocol::Ftp && !mirror->password,
            "bookmark without password should stay without one");
    t.check(!vault->getBookmark("nope", err), "unknown bookmark should not be found");

    t.check(vault->delBookmark("prod") && !vault->delBookmark("prod"),
            "delBookmark should remove once");
    t.check(vault->bookmarkNames() == std::vector<std::string>{"mirror"},
            "only mirror should remain");
}

void test_bad_bookmarks_file(TestContext &t) {
    QTemporaryDir dir;
    const auto p = pathsIn(dir);
    VaultError err;
    auto vault = BookmarksClient::open(p.bookmarks, p.key, 16, err);
    if (!vault) {
        t.check(false, "open should succeed before syntax test");
        return;
    }

    t.check(writeText(p.bookmarks, "[bookmarks]\n1\\name=web\n1\\address=example.org\n"
                                   "1\\port=70000\n1\\protocol=sftp\nsize=1\n"),
            "bad port file should be written");
    t.check(!vault->readBookmarks(err) && err.kind == VaultErrorKind::SyntaxError,
            "out of range port should report SyntaxError");

    t.check(writeText(p.bookmarks, "[bookmarks]\n1\\name=web\n1\\address=example.org\n"
                                   "1\\port=22\n1\\protocol=gopher\nsize=1\n"),
            "bad protocol file should be written");
    t.check(!vault->readBookmarks(err) && err.kind == VaultErrorKind::SyntaxError,
            "unknown protocol should report SyntaxError");

    t.check(writeText(p.bookmarks, "[bookmarks]\n1\\name=a\n1\\address=h\n1\\port=22\n"
                                   "1\\protocol=scp\n2\\name=a\n2\\address=h\n2\\port=22\n"
                                   "2\\protocol=scp\nsize=2\n"),
            "duplicate name file should be written");
    t.check(!vault->readBookmarks(err) && err.kind == VaultErrorKind::SyntaxError,
            "duplicate names should report SyntaxError");

    t.check(writeText(p.bookmarks, "[bookmarks]\n1\\name=ok\n1\\address=h\n1\\port=2121\n"
                                   "1\\protocol=FTP\nsize=1\n"),
            "valid file should be written");
    t.check(vault->readBookmarks(err), "valid file should load");
    const auto ok = vault->getBookmark("ok", err);
    t.check(ok && ok->protocol == FileTransferProtocol::Ftp && ok->port == 2121,
            "protocol names in the file should be case-insensitive");

    fs::remove(p.bookmarks.toStdString());
    t.check(!vault->readBookmarks(err) && err.kind == VaultErrorKind::IoError,
            "missing bookmarks file should report IoError");
}

void test_bad_key_and_paths(TestContext &t) {
    QTemporaryDir dir;
    const auto p = pathsIn(dir);
    VaultError err;
    fs::create_directories(fs::path(p.key.toStdString()).parent_path());
    t.check(writeText(p.key, "short key"), "short key should be written");
    t.check(!BookmarksClient::open(p.bookmarks, p.key, 16, err) &&
                err.kind == VaultErrorKind::SerializationError,
            "wrong key length should report SerializationError");

    QTemporaryDir other;
    const QString blocker = other.filePath(QStringLiteral("blocker"));
    t.check(writeText(blocker, "x"), "blocking file should be written");
    t.check(!BookmarksClient::open(blocker + QStringLiteral("/bookmarks.ini"),
                                   blocker + QStringLiteral("/.bookmarks.key"), 16, err) &&
                err.kind == VaultErrorKind::IoError,
            "a parent that is a regular file should report IoError");

    t.check(VaultError{VaultErrorKind::CryptoError, QStringLiteral("bad tag")}
                    .toString()
                    .contains(QStringLiteral("bad tag")),
            "error text should carry the message");
}

void test_recents(TestContext &t) {
    QTemporaryDir dir;
    const auto p = pathsIn(dir);
    VaultError err;
    auto vault = BookmarksClient::open(p.bookmarks, p.key, 2, err);
    if (!vault) {
        t.check(false, "open should succeed before recents test");
        return;
    }
    vault->addRecent("a.example.org", 22, FileTransferProtocol::Sftp, "alice");
    vault->addRecent("b.example.org", 22, FileTransferProtocol::Scp, "bob");
    vault->addRecent("a.example.org", 22, FileTransferProtocol::Sftp, "alice");
    t.check(vault->recentNames().size() == 2, "same host should be recorded once");
    const auto newest = vault->getRecent(vault->recentNames().back());
    t.check(newest && newest->address == "a.example.org",
            "a repeated host should move to the newest position");
    t.check(newest && !newest->password, "recents should never carry a password");

    vault->addRecent("c.example.org", 21, FileTransferProtocol::Ftp, "carol");
    const auto names = vault->recentNames();
    t.check(names.size() == 2, "recents should be bounded");
    const auto oldest = names.empty() ? std::nullopt : vault->getRecent(names.front());
    t.check(oldest && oldest->address == "a.example.org",
            "the oldest entry should be dropped first");

    t.check(vault->writeBookmarks(err), "writeBookmarks should succeed");
    auto reopened = BookmarksClient::open(p.bookmarks, p.key, 2, err);
    t.check(reopened && reopened->recentNames() == names, "recents should persist");
    t.check(reopened && reopened->delRecent(names.front()) &&
                reopened->recentNames().size() == 1,
            "delRecent should remove an entry");
}

void test_remote_address(TestContext &t) {
    RemoteAddress a;
    std::string err;
    t.check(parseRemoteAddress("example.org", a, err), "bare host should parse");
    t.check(a.protocol == FileTransferProtocol::Sftp && a.port == 22 && !a.username &&
                !a.wrkdir,
            "bare host should default to sftp on port 22");

    t.check(parseRemoteAddress("ftp://bob@files.example.org:2121:/pub", a, err),
            "full address should parse");
    t.check(a.protocol == FileTransferProtocol::Ftp && a.host == "files.example.org" &&
                a.port == 2121 && a.username == std::optional<std::string>("bob") &&
                a.wrkdir == std::optional<std::string>("/pub"),
            "every part of a full address should be kept");

    t.check(parseRemoteAddress("ftp://mirror", a, err) && a.port == 21,
            "ftp should default to port 21");
    t.check(parseRemoteAddress("user@corp@host", a, err) &&
                a.username == std::optional<std::string>("user@corp") && a.host == "host",
            "the user name ends at the last '@'");
    t.check(parseRemoteAddress("[::1]:2222", a, err) && a.host == "::1" && a.port == 2222,
            "bracketed IPv6 hosts should parse");
    t.check(parseRemoteAddress("host:/var/www", a, err) && a.port == 22 &&
                a.wrkdir == std::optional<std::string>("/var/www"),
            "a non-numeric tail should be the working directory");

    t.check(!parseRemoteAddress("host:0", a, err), "port 0 should be rejected");
    t.check(!parseRemoteAddress("host:70000", a, err), "port 70000 should be rejected");
    t.check(!parseRemoteAddress("host:123456789012345678901234", a, err),
            "huge ports should be rejected");
    t.check(!parseRemoteAddress("gopher://host", a, err), "unknown protocol should be rejected");
    t.check(!parseRemoteAddress("@host", a, err), "empty user should be rejected");
    t.check(!parseRemoteAddress("[::1", a, err), "unterminated IPv6 should be rejected");
    t.check(!parseRemoteAddress("user@", a, err), "missing host should be rejected");
}

void test_policy_names(TestContext &t) {
    bool ok = false;
    t.check(AppConfig::parsePolicy(QStringLiteral(" Strict "), &ok) ==
                    termxfer::KnownHostsPolicy::Strict &&
                ok,
            "strict should parse");
    t.check(AppConfig::parsePolicy(QStringLiteral("off"), &ok) ==
                    termxfer::KnownHostsPolicy::Off &&
                ok,
            "off should parse");
    t.check(AppConfig::parsePolicy(QStringLiteral("sometimes"), &ok) ==
                    termxfer::KnownHostsPolicy::AcceptNew &&
                !ok,
            "unknown policy should fall back to accept-new");
    t.check(AppConfig::policyName(termxfer::KnownHostsPolicy::AcceptNew) ==
                QStringLiteral("accept-new"),
            "accept-new name");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_open_creates_files(t);
    test_encrypt_roundtrip(t);
    test_bookmarks_persist(t);
    test_bad_bookmarks_file(t);
    test_bad_key_and_paths(t);
    test_recents(t);
    test_remote_address(t);
    test_policy_names(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] termxfer_vault_tests\n";
    return EXIT_SUCCESS;
}
