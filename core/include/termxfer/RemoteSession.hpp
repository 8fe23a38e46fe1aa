// Abstract transport for one protocol. Concrete implementations (libssh2 SFTP,
// libssh2 SCP, plain FTP, in-memory mock) must respect this API so that
// FileTransfer stays independent from the wire protocol.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace termxfer {

// Directory entry as reported by the transport, before normalization.
struct RawEntry {
    std::string path;          // absolute remote path
    bool is_dir = false;
    bool is_symlink = false;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> atime;  // epoch (seconds)
    std::optional<std::uint64_t> mtime;
    std::optional<std::uint32_t> mode;   // POSIX bits (permissions, maybe type)
    std::optional<std::uint32_t> uid;
    std::optional<std::uint32_t> gid;
    std::optional<std::string>   link_target; // when the listing already carries it
};

// Open remote file used for streamed reads or writes.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Bytes read, 0 at end of file, -1 on failure (err filled).
    virtual std::int64_t read(char* buf, std::size_t len, std::string& err) = 0;

    // Bytes written (may be short), -1 on failure.
    virtual std::int64_t write(const char* buf, std::size_t len, std::string& err) = 0;

    // Moves to the end and reports the position (the file size).
    virtual bool seekEnd(std::uint64_t& pos, std::string& err) = 0;
    virtual bool rewind(std::string& err) = 0;

    // Flushes and releases the handle; for streamed protocols this also
    // collects the server confirmation of the transfer.
    virtual bool close(std::string& err) = 0;
};

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual FileTransferProtocol protocol() const = 0;
    // True when openWrite must be given the exact length of the body.
    virtual bool needsUploadSize() const { return false; }

    // Connection stages, called in this order by FileTransfer::connect.
    virtual bool tcpConnect(const std::string& host, std::uint16_t port,
                            std::string& err) = 0;
    virtual bool handshake(const SessionOptions& opt, std::string& err) = 0;
    virtual bool authenticate(const SessionOptions& opt, std::string& err) = 0;
    virtual bool openSubsystem(std::string& err) = 0;

    // Login directory of the authenticated user.
    virtual bool homeDirectory(std::string& out, std::string& err) = 0;

    // Graceful close; reset() releases everything without talking to the peer.
    virtual bool close(std::string& err) = 0;
    virtual void reset() = 0;

    // Canonical absolute path; fails when the path does not exist.
    virtual bool realpath(const std::string& path, std::string& out,
                          std::string& err) = 0;

    virtual bool readdir(const std::string& dir, std::vector<RawEntry>& out,
                         std::string& err) = 0;

    virtual bool readlink(const std::string& path, std::string& out,
                          std::string& err) = 0;

    virtual std::unique_ptr<RemoteFile> openRead(const std::string& path,
                                                 std::string& err) = 0;

    // Creates or truncates. size is the expected length (0 if unknown);
    // exact when needsUploadSize() is true.
    virtual std::unique_ptr<RemoteFile> openWrite(const std::string& path,
                                                  std::uint64_t size,
                                                  std::string& err) = 0;

    virtual bool unlink(const std::string& path, std::string& err) = 0;
    virtual bool rmdir(const std::string& path, std::string& err) = 0;
    virtual bool mkdir(const std::string& path, unsigned int mode,
                       std::string& err) = 0;
};

// One transport per protocol.
std::unique_ptr<RemoteSession> makeRemoteSession(FileTransferProtocol protocol);

} // namespace termxfer
