// Simulated transport backed by an in-memory tree, for tests without network.
// Failures of every stage can be injected.
#pragma once
#include "RemoteSession.hpp"
#include <map>
#include <set>

namespace termxfer {

class MockRemoteSession : public RemoteSession {
public:
    enum class FailAt {
        None,
        Tcp,
        Handshake,
        Auth,
        Subsystem,
        Home,
        Close
    };

    struct Node {
        bool is_dir = false;
        bool is_symlink = false;
        std::string data;
        std::optional<std::uint32_t> mode;
        std::optional<std::uint32_t> uid;
        std::optional<std::uint32_t> gid;
        std::optional<std::uint64_t> atime;
        std::optional<std::uint64_t> mtime;
        std::optional<std::string> link_target; // readlink result; unset = unreadable
    };

    MockRemoteSession();

    FileTransferProtocol protocol() const override { return FileTransferProtocol::Sftp; }
    bool needsUploadSize() const override { return needsUploadSize_; }

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err) override;
    bool handshake(const SessionOptions& opt, std::string& err) override;
    bool authenticate(const SessionOptions& opt, std::string& err) override;
    bool openSubsystem(std::string& err) override;
    bool homeDirectory(std::string& out, std::string& err) override;
    bool close(std::string& err) override;
    void reset() override;

    bool realpath(const std::string& path, std::string& out, std::string& err) override;
    bool readdir(const std::string& dir, std::vector<RawEntry>& out, std::string& err) override;
    bool readlink(const std::string& path, std::string& out, std::string& err) override;
    std::unique_ptr<RemoteFile> openRead(const std::string& path, std::string& err) override;
    std::unique_ptr<RemoteFile> openWrite(const std::string& path, std::uint64_t size,
                                          std::string& err) override;
    bool unlink(const std::string& path, std::string& err) override;
    bool rmdir(const std::string& path, std::string& err) override;
    bool mkdir(const std::string& path, unsigned int mode, std::string& err) override;

    // Test setup
    void failAt(FailAt stage) { failAt_ = stage; }
    void setPassword(const std::string& pw) { password_ = pw; }
    void setHome(const std::string& home) { home_ = home; }
    void addDir(const std::string& path, std::optional<std::uint32_t> mode = 0755);
    void addFile(const std::string& path, const std::string& data,
                 std::optional<std::uint32_t> mode = 0644);
    void addSymlink(const std::string& path, std::optional<std::string> target,
                    bool targetIsDir = false);
    void setNode(const std::string& path, const Node& node) { nodes_[path] = node; }
    // unlink/rmdir of path fails (permission denied).
    void lock(const std::string& path) { locked_.insert(path); }
    // Writes fail once this many bytes have been accepted by an open handle.
    void failWritesAfter(std::uint64_t bytes) { writeLimit_ = bytes; }
    void failReads() { failReads_ = true; }
    void failSeeks() { failSeeks_ = true; }
    // Behave like scp: openWrite wants the exact length.
    void requireUploadSize() { needsUploadSize_ = true; }

    // Inspection
    bool connected() const { return connected_; }
    bool exists(const std::string& path) const { return nodes_.count(path) != 0; }
    std::string content(const std::string& path) const;
    const std::vector<std::string>& removed() const { return removed_; }
    const SessionOptions& lastOptions() const { return lastOpt_; }
    std::optional<std::uint64_t> lastUploadSize() const { return lastUploadSize_; }

private:
    friend class MockRemoteFile;

    bool requireConnected(std::string& err) const;

    bool connected_ = false;
    bool tcpOpen_ = false;
    FailAt failAt_ = FailAt::None;
    std::optional<std::string> password_;
    std::string home_ = "/home/alice";
    SessionOptions lastOpt_{};

    // Mini simulated "remote FS": absolute path -> node
    std::map<std::string, Node> nodes_;
    std::set<std::string> locked_;
    std::vector<std::string> removed_;
    std::optional<std::uint64_t> writeLimit_;
    bool failReads_ = false;
    bool failSeeks_ = false;
    bool needsUploadSize_ = false;
    std::optional<std::uint64_t> lastUploadSize_;
};

} // namespace termxfer
