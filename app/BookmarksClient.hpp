// Credential vault: named bookmarks and recent hosts persisted as INI, with
// saved passwords encrypted by a local AES-256 key.
#pragma once
#include "termxfer/TransferTypes.hpp"
#include <QString>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class VaultErrorKind {
    IoError,            // a file could not be read or written
    SerializationError, // data could not be encoded or decoded
    SyntaxError,        // the bookmarks file holds invalid values
    CryptoError         // key generation, encryption or decryption failed
};

struct VaultError {
    VaultErrorKind kind = VaultErrorKind::IoError;
    QString msg;

    QString toString() const;
};

// Persisted form; password holds base64(IV | ciphertext | tag).
struct Bookmark {
    std::string address;
    std::uint16_t port = 22;
    termxfer::FileTransferProtocol protocol = termxfer::FileTransferProtocol::Sftp;
    std::string username;
    std::optional<std::string> password;
};

// Decrypted connection arguments.
struct HostArgs {
    std::string address;
    std::uint16_t port = 22;
    termxfer::FileTransferProtocol protocol = termxfer::FileTransferProtocol::Sftp;
    std::string username;
    std::optional<std::string> password;
};

// Collections keep insertion order (recents: oldest first).
struct UserHosts {
    std::vector<std::pair<std::string, Bookmark>> bookmarks;
    std::vector<std::pair<std::string, Bookmark>> recents;
};

class BookmarksClient {
public:
    static constexpr int kKeyLength = 32;
    static constexpr int kIvLength = 12;
    static constexpr int kTagLength = 16;

    // Creates a missing bookmarks file (empty) and a missing key file, then
    // loads both. Returns nullptr and fills err on failure.
    static std::unique_ptr<BookmarksClient> open(const QString &bookmarksFile,
                                                 const QString &keyFile,
                                                 int recentsSize, VaultError &err);

    BookmarksClient(const BookmarksClient &) = delete;
    BookmarksClient &operator=(const BookmarksClient &) = delete;

    // Builds a bookmark; a given password is encrypted with the vault key.
    bool makeBookmark(const std::string &address, std::uint16_t port,
                      termxfer::FileTransferProtocol protocol,
                      const std::string &username,
                      const std::optional<std::string> &password, Bookmark &out,
                      VaultError &err) const;

    // Adds or replaces the bookmark called name (in memory only).
    bool addBookmark(const std::string &name, const std::string &address,
                     std::uint16_t port, termxfer::FileTransferProtocol protocol,
                     const std::string &username,
                     const std::optional<std::string> &password, VaultError &err);
    bool delBookmark(const std::string &name);
    // Decrypts the saved password, if any.
    std::optional<HostArgs> getBookmark(const std::string &name, VaultError &err) const;
    std::vector<std::string> bookmarkNames() const;

    // Remembers a host without its password. An existing entry for the same
    // host is moved to the newest position; the oldest entries are dropped
    // beyond the configured size.
    void addRecent(const std::string &address, std::uint16_t port,
                   termxfer::FileTransferProtocol protocol, const std::string &username);
    bool delRecent(const std::string &name);
    std::optional<HostArgs> getRecent(const std::string &name) const;
    std::vector<std::string> recentNames() const;

    bool readBookmarks(VaultError &err);
    // Overwrites the bookmarks file with the in-memory collections.
    bool writeBookmarks(VaultError &err) const;

    bool encryptPassword(const std::string &plain, std::string &out, VaultError &err) const;
    bool decryptPassword(const std::string &encoded, std::string &out, VaultError &err) const;

    const UserHosts &hosts() const { return hosts_; }
    const QString &bookmarksFile() const { return bookmarksFile_; }
    const QString &keyFile() const { return keyFile_; }

private:
    BookmarksClient(const QString &bookmarksFile, const QString &keyFile, int recentsSize);

    bool generateKey(VaultError &err);
    bool readKey(VaultError &err);

    UserHosts hosts_;
    QString bookmarksFile_;
    QString keyFile_;
    int recentsSize_;
    std::vector<unsigned char> key_;
};
