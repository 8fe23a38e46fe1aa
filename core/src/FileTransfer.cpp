#include "termxfer/FileTransfer.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/MetadataNormalizer.hpp"
#include "termxfer/PathUtils.hpp"
#include "termxfer/TransferEngine.hpp"

namespace termxfer {

FileTransfer::FileTransfer(FileTransferProtocol protocol)
    : session_(makeRemoteSession(protocol)) {}

FileTransfer::FileTransfer(std::unique_ptr<RemoteSession> session)
    : session_(std::move(session)) {}

FileTransfer::~FileTransfer() {
    if (state_ != ConnectionState::Disconnected) session_->reset();
}

void FileTransfer::dropConnection() {
    session_->reset();
    wrkdir_.clear();
    state_ = ConnectionState::Disconnected;
}

bool FileTransfer::requireSession(TransferError& err) const {
    if (state_ != ConnectionState::Ready) {
        err = {TransferErrorKind::UninitializedSession, "Not connected"};
        return false;
    }
    return true;
}

bool FileTransfer::connect(const SessionOptions& opt, TransferError& err) {
    if (state_ != ConnectionState::Disconnected) {
        err = {TransferErrorKind::ConnectionError, "Already connected"};
        return false;
    }
    LOGI("connecting to %s:%u (%s)", redact(opt.host), static_cast<unsigned>(opt.port),
         protocolName(session_->protocol()));

    std::string e;
    state_ = ConnectionState::Connecting;
    if (!session_->tcpConnect(opt.host, opt.port, e)) {
        dropConnection();
        err = {TransferErrorKind::BadAddress, e};
        return false;
    }
    if (!session_->handshake(opt, e)) {
        dropConnection();
        err = {TransferErrorKind::ConnectionError, e};
        return false;
    }
    state_ = ConnectionState::Authenticating;
    if (!session_->authenticate(opt, e)) {
        dropConnection();
        err = {TransferErrorKind::AuthenticationFailed, e};
        return false;
    }
    if (!session_->openSubsystem(e)) {
        dropConnection();
        err = {TransferErrorKind::ProtocolError, e};
        return false;
    }
    std::string home;
    if (!session_->homeDirectory(home, e)) {
        dropConnection();
        err = {TransferErrorKind::ProtocolError, e};
        return false;
    }
    wrkdir_ = home;
    state_ = ConnectionState::Ready;
    LOGI("connected, working directory %s", redact(wrkdir_));
    return true;
}

bool FileTransfer::disconnect(TransferError& err) {
    if (!requireSession(err)) return false;
    std::string e;
    if (!session_->close(e)) {
        // The transport is unusable after a failed close; do not keep it.
        LOGE("disconnect failed: %s", e.c_str());
        dropConnection();
        err = {TransferErrorKind::ConnectionError, e};
        return false;
    }
    wrkdir_.clear();
    state_ = ConnectionState::Disconnected;
    return true;
}

bool FileTransfer::pwd(std::string& out, TransferError& err) const {
    if (!requireSession(err)) return false;
    out = wrkdir_;
    return true;
}

bool FileTransfer::resolveStrict(const std::string& path, std::string& out,
                                 TransferError& err) const {
    if (!requireSession(err)) return false;
    if (isAbsolutePath(path)) {
        out = path;
        return true;
    }
    const std::string joined = joinPath(wrkdir_, path);
    std::string e;
    if (!session_->realpath(joined, out, e)) {
        err = {TransferErrorKind::NoSuchFileOrDirectory, joined};
        return false;
    }
    return true;
}

// The lexical fallback may hide an invalid destination; the following
// create/open call is what reports it.
bool FileTransfer::resolveBestEffort(const std::string& path, std::string& out,
                                     TransferError& err) const {
    if (!requireSession(err)) return false;
    if (isAbsolutePath(path)) {
        out = path;
        return true;
    }
    const std::string joined = joinPath(wrkdir_, path);
    std::string e;
    if (!session_->realpath(joined, out, e)) out = joined;
    return true;
}

bool FileTransfer::changeDir(const std::string& dir, std::string& out,
                             TransferError& err) {
    std::string resolved;
    if (!resolveStrict(dir, resolved, err)) return false;
    wrkdir_ = resolved;
    out = wrkdir_;
    return true;
}

bool FileTransfer::listDir(const std::string& path, std::vector<FsEntry>& out,
                           TransferError& err) {
    std::string dir;
    if (!resolveStrict(path, dir, err)) return false;
    std::vector<RawEntry> raw;
    std::string e;
    if (!session_->readdir(dir, raw, e)) {
        err = {TransferErrorKind::DirStatFailed, e};
        return false;
    }
    out = normalizeListing(raw, *session_);
    return true;
}

bool FileTransfer::stat(const std::string& path, FsEntry& out, TransferError& err) {
    std::string abs;
    if (!resolveStrict(path, abs, err)) return false;
    abs = normalizePath(abs);
    const std::string name = baseName(abs);
    if (name.empty()) {
        // The root has no parent listing to look into.
        FsDirectory root;
        root.abs_path = "/";
        out = root;
        return true;
    }
    std::vector<FsEntry> siblings;
    if (!listDir(parentPath(abs), siblings, err)) {
        if (err.kind == TransferErrorKind::DirStatFailed)
            err = {TransferErrorKind::NoSuchFileOrDirectory, abs};
        return false;
    }
    for (auto& e : siblings) {
        if (entryName(e) == name) {
            out = std::move(e);
            return true;
        }
    }
    err = {TransferErrorKind::NoSuchFileOrDirectory, abs};
    return false;
}

bool FileTransfer::mkdir(const std::string& dir, TransferError& err) {
    std::string path;
    if (!resolveBestEffort(dir, path, err)) return false;
    std::string e;
    if (!session_->mkdir(path, 0755, e)) {
        err = {TransferErrorKind::FileCreateDenied, e};
        return false;
    }
    return true;
}

bool FileTransfer::remove(const FsEntry& entry, TransferError& err) {
    if (!requireSession(err)) return false;
    std::string e;
    // A link is removed itself, never followed into its target.
    if (!isDirectory(entry) || isSymlink(entry)) {
        if (!session_->unlink(entryPath(entry), e)) {
            err = {TransferErrorKind::FileReadonly, e};
            return false;
        }
        return true;
    }
    std::vector<FsEntry> children;
    if (!listDir(entryPath(entry), children, err)) return false;
    for (const auto& child : children) {
        if (!remove(child, err)) return false;
    }
    if (!session_->rmdir(entryPath(entry), e)) {
        err = {TransferErrorKind::FileReadonly, e};
        return false;
    }
    return true;
}

bool FileTransfer::send(std::FILE* local, const std::string& remoteName,
                        TransferError& err, const ProgressCB& progress) {
    if (!requireSession(err)) return false;
    std::string remotePath;
    if (!resolveBestEffort(remoteName, remotePath, err)) return false;

    std::uint64_t total = 0;
    LocalFilePtr spool;
    if (measureLocal(local, total)) {
        if (!rewindLocal(local, err)) return false;
    } else if (session_->needsUploadSize()) {
        if (!spoolLocal(local, spool, total, err)) return false;
        local = spool.get();
    }

    std::string e;
    auto rf = session_->openWrite(remotePath, total, e);
    if (!rf) {
        err = {TransferErrorKind::FileCreateDenied, e};
        return false;
    }
    if (!pumpToRemote(local, *rf, total, progress, err)) {
        std::string ignored;
        (void)rf->close(ignored);
        return false;
    }
    if (!rf->close(e)) {
        err = {TransferErrorKind::IoError, e};
        return false;
    }
    return true;
}

bool FileTransfer::receive(const std::string& remoteName, std::FILE* local,
                           TransferError& err, const ProgressCB& progress) {
    if (!requireSession(err)) return false;
    std::string remotePath;
    if (!resolveStrict(remoteName, remotePath, err)) return false;

    std::string e;
    auto rf = session_->openRead(remotePath, e);
    if (!rf) {
        err = {TransferErrorKind::NoSuchFileOrDirectory, e.empty() ? remotePath : e};
        return false;
    }
    const std::uint64_t total = measureRemote(*rf);
    if (!rewindRemote(*rf, err)) {
        std::string ignored;
        (void)rf->close(ignored);
        return false;
    }
    if (!pumpFromRemote(*rf, local, total, progress, err)) {
        std::string ignored;
        (void)rf->close(ignored);
        return false;
    }
    if (!rf->close(e)) {
        err = {TransferErrorKind::IoError, e};
        return false;
    }
    return true;
}

} // namespace termxfer
