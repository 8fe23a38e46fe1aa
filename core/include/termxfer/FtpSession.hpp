// Plain FTP transport (RFC 959 with RFC 3659 MLSD/SIZE) over POSIX sockets.
// Data connections are passive; transfers use binary mode.
#pragma once
#include "RemoteSession.hpp"
#include <string>

namespace termxfer {

class FtpDataFile;

class FtpSession : public RemoteSession {
public:
    FtpSession() = default;
    ~FtpSession() override;

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    FileTransferProtocol protocol() const override { return FileTransferProtocol::Ftp; }

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err) override;
    // Waits for the server greeting.
    bool handshake(const SessionOptions& opt, std::string& err) override;
    // USER/PASS; "anonymous" when no user name is given.
    bool authenticate(const SessionOptions& opt, std::string& err) override;
    // Switches to binary (TYPE I).
    bool openSubsystem(std::string& err) override;
    bool homeDirectory(std::string& out, std::string& err) override;
    bool close(std::string& err) override;
    void reset() override;

    bool realpath(const std::string& path, std::string& out, std::string& err) override;
    bool readdir(const std::string& dir, std::vector<RawEntry>& out, std::string& err) override;
    // FTP has no readlink; always fails.
    bool readlink(const std::string& path, std::string& out, std::string& err) override;
    std::unique_ptr<RemoteFile> openRead(const std::string& path, std::string& err) override;
    std::unique_ptr<RemoteFile> openWrite(const std::string& path, std::uint64_t size,
                                          std::string& err) override;
    bool unlink(const std::string& path, std::string& err) override;
    bool rmdir(const std::string& path, std::string& err) override;
    bool mkdir(const std::string& path, unsigned int mode, std::string& err) override;

private:
    friend class FtpDataFile;

    bool sendLine(const std::string& line, std::string& err);
    bool readLine(std::string& line, std::string& err);
    // Reads a full (possibly multi-line) reply.
    bool readReply(int& code, std::string& text, std::string& err);
    bool command(const std::string& line, int& code, std::string& text, std::string& err);
    bool currentDir(std::string& out, std::string& err);
    bool changeDir(const std::string& dir, std::string& err);
    // PASV, then connects the data socket. Returns the fd or -1.
    int openPassive(std::string& err);
    // Sends cmd expecting a data transfer (1xx); returns the data fd or -1.
    int startTransfer(const std::string& cmd, std::string& err, int* replyCode = nullptr);
    bool listWith(const std::string& verb, const std::string& dir, std::string& body,
                  int& code, std::string& err);

    int ctrl_ = -1;
    std::string host_;
    std::string rbuf_;
    bool mlsd_ = true;
};

} // namespace termxfer
