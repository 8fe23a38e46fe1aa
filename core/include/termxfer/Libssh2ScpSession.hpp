// SCP transport: file bodies move over scp channels, everything else runs
// as POSIX shell commands on exec channels.
#pragma once
#include "Libssh2Connection.hpp"
#include "RemoteSession.hpp"

namespace termxfer {

// Single-quotes a value for a POSIX shell command line.
std::string shellQuote(const std::string& value);

class Libssh2ScpSession : public RemoteSession {
public:
    Libssh2ScpSession() = default;
    ~Libssh2ScpSession() override;

    FileTransferProtocol protocol() const override { return FileTransferProtocol::Scp; }
    // The scp header carries the file length before the data.
    bool needsUploadSize() const override { return true; }

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err) override {
        return conn_.tcpConnect(host, port, err);
    }
    bool handshake(const SessionOptions& opt, std::string& err) override {
        return conn_.handshake(opt, err);
    }
    bool authenticate(const SessionOptions& opt, std::string& err) override {
        return conn_.authenticate(opt, err);
    }
    bool openSubsystem(std::string& err) override;
    bool homeDirectory(std::string& out, std::string& err) override;
    bool close(std::string& err) override { return conn_.disconnect(err); }
    void reset() override { conn_.reset(); }

    bool realpath(const std::string& path, std::string& out, std::string& err) override;
    bool readdir(const std::string& dir, std::vector<RawEntry>& out, std::string& err) override;
    bool readlink(const std::string& path, std::string& out, std::string& err) override;
    std::unique_ptr<RemoteFile> openRead(const std::string& path, std::string& err) override;
    std::unique_ptr<RemoteFile> openWrite(const std::string& path, std::uint64_t size,
                                          std::string& err) override;
    bool unlink(const std::string& path, std::string& err) override;
    bool rmdir(const std::string& path, std::string& err) override;
    bool mkdir(const std::string& path, unsigned int mode, std::string& err) override;

private:
    // Runs cmd on a fresh exec channel. Returns false only when the channel
    // itself failed; the command result is in status/out/errOut.
    bool exec(const std::string& cmd, int& status, std::string& out,
              std::string& errOut, std::string& err);
    // exec() that also treats a non-zero exit status as a failure.
    bool run(const std::string& cmd, std::string& out, std::string& err);

    Libssh2Connection conn_;
};

} // namespace termxfer
