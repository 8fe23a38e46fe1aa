// Protocol independent file transfer API used by the front end. One instance
// owns one RemoteSession and the working directory of that connection.
// Operations are blocking and must not run concurrently on one instance.
#pragma once
#include "FsTypes.hpp"
#include "RemoteSession.hpp"
#include "TransferTypes.hpp"
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace termxfer {

class FileTransfer {
public:
    explicit FileTransfer(FileTransferProtocol protocol);
    explicit FileTransfer(std::unique_ptr<RemoteSession> session);
    ~FileTransfer();

    FileTransfer(const FileTransfer&) = delete;
    FileTransfer& operator=(const FileTransfer&) = delete;

    FileTransferProtocol protocol() const { return session_->protocol(); }
    ConnectionState state() const { return state_; }
    bool isConnected() const { return state_ == ConnectionState::Ready; }

    // Connect, authenticate and seed the working directory with the login
    // directory. On failure nothing of the attempt is kept.
    bool connect(const SessionOptions& opt, TransferError& err);
    bool disconnect(TransferError& err);

    bool pwd(std::string& out, TransferError& err) const;
    bool changeDir(const std::string& dir, std::string& out, TransferError& err);

    bool listDir(const std::string& path, std::vector<FsEntry>& out,
                 TransferError& err);

    // Looks the entry up in its parent listing.
    bool stat(const std::string& path, FsEntry& out, TransferError& err);

    bool mkdir(const std::string& dir, TransferError& err);

    // Files and symlinks are unlinked; directories are emptied depth first
    // and then removed. The first failure aborts and is returned unchanged.
    bool remove(const FsEntry& entry, TransferError& err);

    // Upload the content of local to remoteName (created or truncated).
    bool send(std::FILE* local, const std::string& remoteName, TransferError& err,
              const ProgressCB& progress = {});

    // Download remoteName into local, written from its current position.
    bool receive(const std::string& remoteName, std::FILE* local, TransferError& err,
                 const ProgressCB& progress = {});

    // Strict: relative paths are canonicalized by the server and must exist.
    bool resolveStrict(const std::string& path, std::string& out,
                       TransferError& err) const;
    // Best effort: falls back to the lexical join when the target is absent.
    bool resolveBestEffort(const std::string& path, std::string& out,
                           TransferError& err) const;

private:
    bool requireSession(TransferError& err) const;
    void dropConnection();

    std::unique_ptr<RemoteSession> session_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string wrkdir_;
};

} // namespace termxfer
