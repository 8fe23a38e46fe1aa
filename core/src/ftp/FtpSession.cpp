#include "termxfer/FtpSession.hpp"
#include "termxfer/ListingParser.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace termxfer {

namespace {

constexpr int kSocketTimeoutSec = 30;

int connectTcp(const std::string& host, std::uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return -1;
    }
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        struct timeval tv{};
        tv.tv_sec = kSocketTimeoutSec;
        ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            freeaddrinfo(res);
            return s;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to host/port";
    return -1;
}

bool sendAll(int fd, const char* data, std::size_t len, std::string& err) {
    while (len > 0) {
        const ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

bool readAll(int fd, std::string& out, std::string& err) {
    char buf[8192];
    for (;;) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0) {
            return true;
        } else if (errno != EINTR) {
            err = std::string("recv failed: ") + std::strerror(errno);
            return false;
        }
    }
}

// 257 "/some ""quoted"" dir" is current directory
bool parseQuotedPath(const std::string& text, std::string& out) {
    const auto open = text.find('"');
    if (open == std::string::npos) return false;
    out.clear();
    for (std::size_t i = open + 1; i < text.size(); ++i) {
        if (text[i] == '"') {
            if (i + 1 < text.size() && text[i + 1] == '"') {
                out += '"';
                ++i;
                continue;
            }
            return !out.empty();
        }
        out += text[i];
    }
    return false;
}

bool isPositive(int code) { return code >= 200 && code < 300; }
bool isPreliminary(int code) { return code >= 100 && code < 200; }

std::string replyError(const char* what, int code, const std::string& text) {
    return std::string(what) + " (" + std::to_string(code) + " " + text + ")";
}

} // namespace

// Data connection of a RETR/STOR in progress. close() collects the
// transfer completion reply on the control connection.
class FtpDataFile : public RemoteFile {
public:
    FtpDataFile(FtpSession& session, int fd, std::uint64_t size, bool writing)
        : session_(session), fd_(fd), size_(size), writing_(writing) {}
    ~FtpDataFile() override {
        if (fd_ != -1) ::close(fd_);
    }

    std::int64_t read(char* buf, std::size_t len, std::string& err) override {
        if (writing_) {
            err = "FTP upload stream is not readable";
            return -1;
        }
        for (;;) {
            const ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) {
                offset_ += static_cast<std::uint64_t>(n);
                return static_cast<std::int64_t>(n);
            }
            if (errno != EINTR) {
                err = std::string("FTP data read failed: ") + std::strerror(errno);
                return -1;
            }
        }
    }

    std::int64_t write(const char* buf, std::size_t len, std::string& err) override {
        if (!writing_) {
            err = "FTP download stream is not writable";
            return -1;
        }
        if (!sendAll(fd_, buf, len, err)) return -1;
        offset_ += len;
        return static_cast<std::int64_t>(len);
    }

    bool seekEnd(std::uint64_t& pos, std::string&) override {
        pos = writing_ ? offset_ : size_;
        return true;
    }

    bool rewind(std::string& err) override {
        if (offset_ != 0) {
            err = "FTP data streams cannot be rewound";
            return false;
        }
        return true;
    }

    bool close(std::string& err) override {
        if (fd_ == -1) return true;
        ::close(fd_);
        fd_ = -1;
        int code = 0;
        std::string text;
        if (!session_.readReply(code, text, err)) return false;
        if (!isPositive(code)) {
            err = replyError("Transfer not confirmed", code, text);
            return false;
        }
        return true;
    }

private:
    FtpSession& session_;
    int fd_;
    std::uint64_t size_;
    bool writing_;
    std::uint64_t offset_ = 0;
};

FtpSession::~FtpSession() {
    reset();
}

bool FtpSession::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    ctrl_ = connectTcp(host, port, err);
    if (ctrl_ == -1) return false;
    host_ = host;
    return true;
}

bool FtpSession::sendLine(const std::string& line, std::string& err) {
    if (ctrl_ == -1) {
        err = "Not connected";
        return false;
    }
    const std::string wire = line + "\r\n";
    return sendAll(ctrl_, wire.data(), wire.size(), err);
}

bool FtpSession::readLine(std::string& line, std::string& err) {
    for (;;) {
        const auto nl = rbuf_.find('\n');
        if (nl != std::string::npos) {
            line = rbuf_.substr(0, nl);
            rbuf_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[1024];
        const ssize_t n = ::recv(ctrl_, buf, sizeof(buf), 0);
        if (n == 0) {
            err = "Connection closed by server";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            err = std::string("recv failed: ") + std::strerror(errno);
            return false;
        }
        rbuf_.append(buf, static_cast<std::size_t>(n));
    }
}

bool FtpSession::readReply(int& code, std::string& text, std::string& err) {
    std::string line;
    if (!readLine(line, err)) return false;
    if (line.size() < 3 || !std::all_of(line.begin(), line.begin() + 3, [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        err = "Malformed FTP reply: " + line;
        return false;
    }
    code = std::stoi(line.substr(0, 3));
    text = line.size() > 4 ? line.substr(4) : std::string();
    if (line.size() > 3 && line[3] == '-') {
        // multi-line reply ends with "NNN " using the same code
        const std::string end = line.substr(0, 3) + " ";
        for (;;) {
            if (!readLine(line, err)) return false;
            if (line.compare(0, 4, end) == 0) {
                text += "\n" + line.substr(4);
                break;
            }
            text += "\n" + line;
        }
    }
    return true;
}

bool FtpSession::command(const std::string& line, int& code, std::string& text,
                         std::string& err) {
    if (!sendLine(line, err)) return false;
    return readReply(code, text, err);
}

bool FtpSession::handshake(const SessionOptions&, std::string& err) {
    int code = 0;
    std::string text;
    do {
        if (!readReply(code, text, err)) return false;
    } while (isPreliminary(code));
    if (code != 220) {
        err = replyError("Server refused the connection", code, text);
        return false;
    }
    return true;
}

bool FtpSession::authenticate(const SessionOptions& opt, std::string& err) {
    const std::string user =
        opt.username && !opt.username->empty() ? *opt.username : std::string("anonymous");
    int code = 0;
    std::string text;
    if (!command("USER " + user, code, text, err)) return false;
    if (code == 331 || code == 332) {
        const std::string pass = opt.password.value_or(std::string());
        if (!command("PASS " + pass, code, text, err)) return false;
    }
    if (code != 230 && code != 202) {
        err = replyError("Login rejected", code, text);
        return false;
    }
    return true;
}

bool FtpSession::openSubsystem(std::string& err) {
    int code = 0;
    std::string text;
    if (!command("TYPE I", code, text, err)) return false;
    if (!isPositive(code)) {
        err = replyError("Binary mode refused", code, text);
        return false;
    }
    return true;
}

bool FtpSession::currentDir(std::string& out, std::string& err) {
    int code = 0;
    std::string text;
    if (!command("PWD", code, text, err)) return false;
    if (code != 257 || !parseQuotedPath(text, out)) {
        err = replyError("PWD failed", code, text);
        return false;
    }
    return true;
}

bool FtpSession::changeDir(const std::string& dir, std::string& err) {
    int code = 0;
    std::string text;
    if (!command("CWD " + dir, code, text, err)) return false;
    if (!isPositive(code)) {
        err = replyError("CWD failed", code, text);
        return false;
    }
    return true;
}

bool FtpSession::homeDirectory(std::string& out, std::string& err) {
    return currentDir(out, err);
}

bool FtpSession::close(std::string& err) {
    int code = 0;
    std::string text;
    const bool sent = command("QUIT", code, text, err);
    reset();
    if (!sent) return false;
    if (code != 221 && !isPositive(code)) {
        err = replyError("QUIT failed", code, text);
        return false;
    }
    return true;
}

void FtpSession::reset() {
    if (ctrl_ != -1) {
        ::close(ctrl_);
        ctrl_ = -1;
    }
    rbuf_.clear();
    mlsd_ = true;
}

// CWD into the path and ask for PWD; files are checked through their parent
// directory and SIZE. The previous directory is restored afterwards.
bool FtpSession::realpath(const std::string& path, std::string& out, std::string& err) {
    std::string saved;
    if (!currentDir(saved, err)) return false;

    bool ok = false;
    std::string e;
    if (changeDir(path, e)) {
        ok = currentDir(out, err);
    } else {
        const std::string parent = parentPath(path);
        const std::string name = baseName(path);
        std::string parentAbs;
        if (!name.empty() && changeDir(parent.empty() ? "." : parent, e) &&
            currentDir(parentAbs, e)) {
            int code = 0;
            std::string text;
            if (command("SIZE " + name, code, text, e) && code == 213) {
                out = joinPath(parentAbs, name);
                ok = true;
            }
        }
        if (!ok) err = "No such file or directory: " + path;
    }

    std::string restoreErr;
    if (!changeDir(saved, restoreErr)) {
        err = "Could not restore working directory: " + restoreErr;
        return false;
    }
    return ok;
}

int FtpSession::openPassive(std::string& err) {
    int code = 0;
    std::string text;
    if (!command("PASV", code, text, err)) return -1;
    if (code != 227) {
        err = replyError("PASV failed", code, text);
        return -1;
    }
    const auto port = parsePasvPort(text);
    if (!port) {
        err = "Could not parse PASV reply: " + text;
        return -1;
    }
    // The advertised address is often private behind NAT; reuse the
    // control connection host.
    return connectTcp(host_, *port, err);
}

int FtpSession::startTransfer(const std::string& cmd, std::string& err, int* replyCode) {
    const int fd = openPassive(err);
    if (fd == -1) return -1;
    int code = 0;
    std::string text;
    if (!command(cmd, code, text, err)) {
        ::close(fd);
        return -1;
    }
    if (replyCode) *replyCode = code;
    if (!isPreliminary(code)) {
        ::close(fd);
        err = replyError("Transfer refused", code, text);
        return -1;
    }
    return fd;
}

bool FtpSession::listWith(const std::string& verb, const std::string& dir, std::string& body,
                          int& code, std::string& err) {
    code = 0;
    const int fd = startTransfer(verb + " " + dir, err, &code);
    if (fd == -1) return false;
    body.clear();
    const bool read = readAll(fd, body, err);
    ::close(fd);
    std::string text;
    std::string e;
    if (!readReply(code, text, e)) {
        err = e;
        return false;
    }
    if (!read) return false;
    if (!isPositive(code)) {
        err = replyError("Listing failed", code, text);
        return false;
    }
    return true;
}

bool FtpSession::readdir(const std::string& dir, std::vector<RawEntry>& out, std::string& err) {
    std::string body;
    int code = 0;
    bool useMlsd = mlsd_;
    if (useMlsd && !listWith("MLSD", dir, body, code, err)) {
        // 500/502: command not implemented, fall back to LIST
        if (code != 500 && code != 502) return false;
        LOGI("server lacks MLSD, using LIST");
        mlsd_ = false;
        useMlsd = false;
    }
    if (!useMlsd && !listWith("LIST -a", dir, body, code, err)) return false;

    out.clear();
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        RawEntry r;
        const bool parsed = useMlsd ? parseMlsdLine(line, dir, r) : parseLsLine(line, dir, r);
        if (parsed) out.push_back(std::move(r));
    }
    return true;
}

bool FtpSession::readlink(const std::string&, std::string&, std::string& err) {
    err = "readlink is not available over FTP";
    return false;
}

std::unique_ptr<RemoteFile> FtpSession::openRead(const std::string& path, std::string& err) {
    std::uint64_t size = 0;
    int code = 0;
    std::string text;
    if (!command("SIZE " + path, code, text, err)) return nullptr;
    if (code == 213) {
        try {
            size = std::stoull(text);
        } catch (const std::exception&) {
            size = 0;
        }
    } else if (code == 550) {
        err = replyError("No such file", code, text);
        return nullptr;
    }
    const int fd = startTransfer("RETR " + path, err);
    if (fd == -1) return nullptr;
    return std::make_unique<FtpDataFile>(*this, fd, size, false);
}

std::unique_ptr<RemoteFile> FtpSession::openWrite(const std::string& path, std::uint64_t size,
                                                  std::string& err) {
    const int fd = startTransfer("STOR " + path, err);
    if (fd == -1) return nullptr;
    return std::make_unique<FtpDataFile>(*this, fd, size, true);
}

bool FtpSession::unlink(const std::string& path, std::string& err) {
    int code = 0;
    std::string text;
    if (!command("DELE " + path, code, text, err)) return false;
    if (!isPositive(code)) {
        err = replyError("DELE failed", code, text);
        return false;
    }
    return true;
}

bool FtpSession::rmdir(const std::string& path, std::string& err) {
    int code = 0;
    std::string text;
    if (!command("RMD " + path, code, text, err)) return false;
    if (!isPositive(code)) {
        err = replyError("RMD failed", code, text);
        return false;
    }
    return true;
}

bool FtpSession::mkdir(const std::string& path, unsigned int, std::string& err) {
    int code = 0;
    std::string text;
    if (!command("MKD " + path, code, text, err)) return false;
    if (code != 257 && !isPositive(code)) {
        err = replyError("MKD failed", code, text);
        return false;
    }
    return true;
}

} // namespace termxfer
