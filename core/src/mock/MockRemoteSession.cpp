// Mock implementation: keeps a map of absolute paths to simulated nodes.
#include "termxfer/MockRemoteSession.hpp"
#include "termxfer/PathUtils.hpp"
#include <algorithm>
#include <cstring>

namespace termxfer {

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(MockRemoteSession& s, std::string path)
        : s_(s), path_(std::move(path)) {}

    std::int64_t read(char* buf, std::size_t len, std::string& err) override {
        auto it = s_.nodes_.find(path_);
        if (s_.failReads_ || it == s_.nodes_.end()) {
            err = "Mock read failure";
            return -1;
        }
        const std::string& data = it->second.data;
        if (pos_ >= data.size()) return 0;
        const std::size_t n = std::min(len, data.size() - pos_);
        std::memcpy(buf, data.data() + pos_, n);
        pos_ += n;
        return static_cast<std::int64_t>(n);
    }

    std::int64_t write(const char* buf, std::size_t len, std::string& err) override {
        auto it = s_.nodes_.find(path_);
        if (it == s_.nodes_.end()) {
            err = "Mock write on vanished file";
            return -1;
        }
        if (s_.writeLimit_) {
            if (written_ >= *s_.writeLimit_) {
                err = "Mock write failure";
                return -1;
            }
            len = std::min<std::size_t>(len, *s_.writeLimit_ - written_);
        }
        std::string& data = it->second.data;
        data.replace(pos_, std::min(len, data.size() > pos_ ? data.size() - pos_ : 0),
                     buf, len);
        pos_ += len;
        written_ += len;
        return static_cast<std::int64_t>(len);
    }

    bool seekEnd(std::uint64_t& pos, std::string& err) override {
        auto it = s_.nodes_.find(path_);
        if (s_.failSeeks_ || it == s_.nodes_.end()) {
            err = "Mock seek failure";
            return false;
        }
        pos_ = it->second.data.size();
        pos = pos_;
        return true;
    }

    bool rewind(std::string& err) override {
        (void)err;
        pos_ = 0;
        return true;
    }

    bool close(std::string& err) override {
        err.clear();
        return true;
    }

private:
    MockRemoteSession& s_;
    std::string path_;
    std::size_t pos_ = 0;
    std::uint64_t written_ = 0;
};

MockRemoteSession::MockRemoteSession() {
    addDir("/");
    addDir("/home");
    addDir("/home/alice", 0700);
    addDir("/home/alice/projects");
    addFile("/home/alice/projects/notes.md", "# notes\n");
    addFile("/home/alice/photo.jpg", std::string(34567, 'x'));
    addDir("/home/guest");
    addDir("/var");
    addDir("/var/log");
    addFile("/readme.txt", std::string(1280, 'r'));
}

void MockRemoteSession::addDir(const std::string& path, std::optional<std::uint32_t> mode) {
    Node n;
    n.is_dir = true;
    n.mode = mode;
    n.uid = 1000;
    n.gid = 1000;
    n.mtime = 1600000000;
    n.atime = 1600000000;
    nodes_[path] = n;
}

void MockRemoteSession::addFile(const std::string& path, const std::string& data,
                                std::optional<std::uint32_t> mode) {
    Node n;
    n.data = data;
    n.mode = mode;
    n.uid = 1000;
    n.gid = 1000;
    n.mtime = 1600000000;
    n.atime = 1600000000;
    nodes_[path] = n;
}

void MockRemoteSession::addSymlink(const std::string& path, std::optional<std::string> target,
                                   bool targetIsDir) {
    Node n;
    n.is_symlink = true;
    n.is_dir = targetIsDir;
    n.mode = 0777;
    n.link_target = std::move(target);
    nodes_[path] = n;
}

std::string MockRemoteSession::content(const std::string& path) const {
    auto it = nodes_.find(path);
    return it == nodes_.end() ? std::string() : it->second.data;
}

bool MockRemoteSession::requireConnected(std::string& err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool MockRemoteSession::tcpConnect(const std::string& host, std::uint16_t port,
                                   std::string& err) {
    (void)port;
    if (host.empty() || failAt_ == FailAt::Tcp) {
        err = "Could not connect to host/port";
        return false;
    }
    tcpOpen_ = true;
    return true;
}

bool MockRemoteSession::handshake(const SessionOptions& opt, std::string& err) {
    lastOpt_ = opt;
    if (!tcpOpen_ || failAt_ == FailAt::Handshake) {
        err = "Handshake failed";
        return false;
    }
    return true;
}

bool MockRemoteSession::authenticate(const SessionOptions& opt, std::string& err) {
    if (failAt_ == FailAt::Auth || !opt.username || opt.username->empty() ||
        (password_ && opt.password != password_)) {
        err = "Authentication rejected";
        return false;
    }
    return true;
}

bool MockRemoteSession::openSubsystem(std::string& err) {
    if (failAt_ == FailAt::Subsystem) {
        err = "Could not initialize subsystem";
        return false;
    }
    connected_ = true;
    return true;
}

bool MockRemoteSession::homeDirectory(std::string& out, std::string& err) {
    if (failAt_ == FailAt::Home) {
        err = "Could not resolve login directory";
        return false;
    }
    out = home_;
    return true;
}

bool MockRemoteSession::close(std::string& err) {
    if (!requireConnected(err)) return false;
    if (failAt_ == FailAt::Close) {
        err = "Disconnect failed";
        return false;
    }
    reset();
    return true;
}

void MockRemoteSession::reset() {
    connected_ = false;
    tcpOpen_ = false;
}

bool MockRemoteSession::realpath(const std::string& path, std::string& out,
                                 std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string canon = normalizePath(joinPath(home_, path));
    if (!exists(canon)) {
        err = "No such file: " + canon;
        return false;
    }
    out = canon;
    return true;
}

bool MockRemoteSession::readdir(const std::string& dir, std::vector<RawEntry>& out,
                                std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string d = normalizePath(dir);
    auto it = nodes_.find(d);
    if (it == nodes_.end() || !it->second.is_dir || it->second.is_symlink) {
        err = "opendir failed for: " + d;
        return false;
    }
    out.clear();
    for (const auto& kv : nodes_) {
        if (kv.first == "/" || parentPath(kv.first) != d) continue;
        const Node& n = kv.second;
        RawEntry r;
        r.path = kv.first;
        r.is_dir = n.is_dir;
        r.is_symlink = n.is_symlink;
        if (!n.is_dir) r.size = n.data.size();
        r.atime = n.atime;
        r.mtime = n.mtime;
        r.mode = n.mode;
        r.uid = n.uid;
        r.gid = n.gid;
        out.push_back(std::move(r));
    }
    return true;
}

bool MockRemoteSession::readlink(const std::string& path, std::string& out,
                                 std::string& err) {
    if (!requireConnected(err)) return false;
    auto it = nodes_.find(path);
    if (it == nodes_.end() || !it->second.is_symlink || !it->second.link_target) {
        err = "readlink failed for: " + path;
        return false;
    }
    out = *it->second.link_target;
    return true;
}

std::unique_ptr<RemoteFile> MockRemoteSession::openRead(const std::string& path,
                                                        std::string& err) {
    if (!requireConnected(err)) return nullptr;
    auto it = nodes_.find(path);
    if (it == nodes_.end() || it->second.is_dir) {
        err = "Could not open remote file for reading: " + path;
        return nullptr;
    }
    return std::make_unique<MockRemoteFile>(*this, path);
}

std::unique_ptr<RemoteFile> MockRemoteSession::openWrite(const std::string& path,
                                                         std::uint64_t size,
                                                         std::string& err) {
    if (!requireConnected(err)) return nullptr;
    lastUploadSize_ = size;
    auto parent = nodes_.find(parentPath(path));
    auto self = nodes_.find(path);
    if (parent == nodes_.end() || !parent->second.is_dir ||
        (self != nodes_.end() && self->second.is_dir) || locked_.count(path)) {
        err = "Could not open remote file for writing: " + path;
        return nullptr;
    }
    addFile(path, std::string());
    return std::make_unique<MockRemoteFile>(*this, path);
}

bool MockRemoteSession::unlink(const std::string& path, std::string& err) {
    if (!requireConnected(err)) return false;
    auto it = nodes_.find(path);
    if (it == nodes_.end() || (it->second.is_dir && !it->second.is_symlink) ||
        locked_.count(path)) {
        err = "unlink failed for: " + path;
        return false;
    }
    nodes_.erase(it);
    removed_.push_back(path);
    return true;
}

bool MockRemoteSession::rmdir(const std::string& path, std::string& err) {
    if (!requireConnected(err)) return false;
    auto it = nodes_.find(path);
    if (it == nodes_.end() || !it->second.is_dir || locked_.count(path)) {
        err = "rmdir failed for: " + path;
        return false;
    }
    for (const auto& kv : nodes_) {
        if (kv.first != "/" && parentPath(kv.first) == path) {
            err = "rmdir failed (directory not empty): " + path;
            return false;
        }
    }
    nodes_.erase(it);
    removed_.push_back(path);
    return true;
}

bool MockRemoteSession::mkdir(const std::string& path, unsigned int mode, std::string& err) {
    if (!requireConnected(err)) return false;
    auto parent = nodes_.find(parentPath(path));
    if (exists(path) || parent == nodes_.end() || !parent->second.is_dir) {
        err = "mkdir failed for: " + path;
        return false;
    }
    addDir(path, mode);
    return true;
}

} // namespace termxfer
