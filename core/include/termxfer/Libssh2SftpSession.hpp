#pragma once
#include "Libssh2Connection.hpp"
#include "RemoteSession.hpp"

struct _LIBSSH2_SFTP;

namespace termxfer {

class Libssh2SftpSession : public RemoteSession {
public:
    Libssh2SftpSession() = default;
    ~Libssh2SftpSession() override;

    FileTransferProtocol protocol() const override { return FileTransferProtocol::Sftp; }

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

private:
    bool requireSftp(std::string& err) const;

    Libssh2Connection conn_;
    _LIBSSH2_SFTP* sftp_ = nullptr;
};

} // namespace termxfer
