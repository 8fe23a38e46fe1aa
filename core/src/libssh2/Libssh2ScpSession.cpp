#include "termxfer/Libssh2ScpSession.hpp"
#include "termxfer/ListingParser.hpp"
#include "termxfer/Log.hpp"
#include <libssh2.h>

#include <cstdio>
#include <sstream>
#include <sys/stat.h>

namespace termxfer {

namespace {

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    return s;
}

void finishChannel(LIBSSH2_CHANNEL* ch) {
    libssh2_channel_send_eof(ch);
    libssh2_channel_wait_eof(ch);
    libssh2_channel_wait_closed(ch);
}

// Incoming scp stream: exactly `size` bytes are file content, the peer then
// sends a status byte that is not part of the file.
class ScpReadFile : public RemoteFile {
public:
    ScpReadFile(LIBSSH2_CHANNEL* ch, std::uint64_t size) : ch_(ch), size_(size) {}
    ~ScpReadFile() override {
        if (ch_) libssh2_channel_free(ch_);
    }

    std::int64_t read(char* buf, std::size_t len, std::string& err) override {
        const std::uint64_t left = size_ - offset_;
        if (left == 0) return 0;
        if (len > left) len = static_cast<std::size_t>(left);
        const ssize_t n = libssh2_channel_read(ch_, buf, len);
        if (n < 0) {
            err = "scp read failed (" + std::to_string(n) + ")";
            return -1;
        }
        if (n == 0) {
            err = "scp stream ended early";
            return -1;
        }
        offset_ += static_cast<std::uint64_t>(n);
        return static_cast<std::int64_t>(n);
    }

    std::int64_t write(const char*, std::size_t, std::string& err) override {
        err = "scp read stream is not writable";
        return -1;
    }

    bool seekEnd(std::uint64_t& pos, std::string&) override {
        pos = size_;
        return true;
    }

    // The announced size is known without moving, so only an untouched
    // stream can be rewound.
    bool rewind(std::string& err) override {
        if (offset_ != 0) {
            err = "scp streams cannot be rewound";
            return false;
        }
        return true;
    }

    bool close(std::string&) override {
        if (!ch_) return true;
        finishChannel(ch_);
        libssh2_channel_free(ch_);
        ch_ = nullptr;
        return true;
    }

private:
    LIBSSH2_CHANNEL* ch_;
    std::uint64_t size_;
    std::uint64_t offset_ = 0;
};

class ScpWriteFile : public RemoteFile {
public:
    ScpWriteFile(LIBSSH2_CHANNEL* ch, std::uint64_t size) : ch_(ch), size_(size) {}
    ~ScpWriteFile() override {
        if (ch_) libssh2_channel_free(ch_);
    }

    std::int64_t read(char*, std::size_t, std::string& err) override {
        err = "scp write stream is not readable";
        return -1;
    }

    std::int64_t write(const char* buf, std::size_t len, std::string& err) override {
        if (written_ + len > size_) {
            err = "write exceeds the announced scp size";
            return -1;
        }
        const ssize_t n = libssh2_channel_write(ch_, buf, len);
        if (n < 0) {
            err = "scp write failed (" + std::to_string(n) + ")";
            return -1;
        }
        written_ += static_cast<std::uint64_t>(n);
        return static_cast<std::int64_t>(n);
    }

    bool seekEnd(std::uint64_t& pos, std::string&) override {
        pos = written_;
        return true;
    }

    bool rewind(std::string& err) override {
        if (written_ != 0) {
            err = "scp streams cannot be rewound";
            return false;
        }
        return true;
    }

    bool close(std::string& err) override {
        if (!ch_) return true;
        const bool complete = written_ == size_;
        finishChannel(ch_);
        libssh2_channel_free(ch_);
        ch_ = nullptr;
        if (!complete) {
            err = "scp upload incomplete: " + std::to_string(written_) + " of " +
                  std::to_string(size_) + " bytes";
            return false;
        }
        return true;
    }

private:
    LIBSSH2_CHANNEL* ch_;
    std::uint64_t size_;
    std::uint64_t written_ = 0;
};

} // namespace

std::string shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

Libssh2ScpSession::~Libssh2ScpSession() {
    reset();
}

bool Libssh2ScpSession::exec(const std::string& cmd, int& status, std::string& out,
                             std::string& errOut, std::string& err) {
    LIBSSH2_SESSION* session = conn_.session();
    if (!session) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session);
    if (!ch) {
        err = "Could not open exec channel: " + conn_.lastError();
        return false;
    }
    if (libssh2_channel_exec(ch, cmd.c_str()) != 0) {
        err = "Remote exec failed: " + conn_.lastError();
        libssh2_channel_free(ch);
        return false;
    }

    out.clear();
    errOut.clear();
    char buf[4096];
    for (;;) {
        const ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0) {
            err = "Reading command output failed: " + conn_.lastError();
            libssh2_channel_free(ch);
            return false;
        }
        break;
    }
    for (;;) {
        const ssize_t n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (n <= 0) break;
        errOut.append(buf, static_cast<std::size_t>(n));
    }

    libssh2_channel_close(ch);
    libssh2_channel_wait_closed(ch);
    status = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);
    return true;
}

bool Libssh2ScpSession::run(const std::string& cmd, std::string& out, std::string& err) {
    int status = 0;
    std::string errOut;
    if (!exec(cmd, status, out, errOut, err)) return false;
    if (status != 0) {
        errOut = trimmed(errOut);
        err = errOut.empty() ? "Remote command exited with status " + std::to_string(status)
                             : errOut;
        return false;
    }
    return true;
}

bool Libssh2ScpSession::openSubsystem(std::string& err) {
    // SCP has no subsystem; make sure the account can run commands at all.
    std::string out;
    if (!run("true", out, err)) {
        err = "Remote shell unavailable: " + err;
        return false;
    }
    return true;
}

bool Libssh2ScpSession::homeDirectory(std::string& out, std::string& err) {
    std::string raw;
    if (!run("pwd", raw, err)) return false;
    out = trimmed(raw);
    if (out.empty()) {
        err = "Empty working directory from remote shell";
        return false;
    }
    return true;
}

bool Libssh2ScpSession::realpath(const std::string& path, std::string& out, std::string& err) {
    const std::string p = shellQuote(path);
    std::ostringstream cmd;
    cmd << "if [ -d " << p << " ]; then cd " << p << " && pwd -P; "
        << "elif [ -e " << p << " ] || [ -L " << p << " ]; then "
        << "cd \"$(dirname " << p << ")\" && echo \"$(pwd -P)/$(basename " << p << ")\"; "
        << "else exit 1; fi";
    std::string raw;
    if (!run(cmd.str(), raw, err)) {
        if (err.rfind("Remote command exited", 0) == 0) err = "No such file or directory";
        return false;
    }
    out = trimmed(raw);
    // "$(pwd -P)/name" doubles the slash for entries of "/"
    if (out.size() > 1 && out[0] == '/' && out[1] == '/') out.erase(0, 1);
    return !out.empty();
}

bool Libssh2ScpSession::readdir(const std::string& dir, std::vector<RawEntry>& out,
                                std::string& err) {
    const std::string q = shellQuote(dir);
    std::string raw;
    if (!run("cd " + q + " && LC_ALL=C ls -lan", raw, err))
        return false;

    out.clear();
    std::istringstream lines(raw);
    std::string line;
    while (std::getline(lines, line)) {
        RawEntry r;
        if (!parseLsLine(line, dir, r)) continue;
        if (r.is_symlink) {
            int status = 1;
            std::string so, se, e;
            if (exec("[ -d " + shellQuote(r.path) + " ]", status, so, se, e)) {
                r.is_dir = status == 0;
            } else {
                LOGI("could not classify link target: %s", e.c_str());
            }
        }
        out.push_back(std::move(r));
    }
    return true;
}

bool Libssh2ScpSession::readlink(const std::string& path, std::string& out, std::string& err) {
    std::string raw;
    if (!run("readlink " + shellQuote(path), raw, err)) return false;
    out = trimmed(raw);
    return true;
}

std::unique_ptr<RemoteFile> Libssh2ScpSession::openRead(const std::string& path,
                                                        std::string& err) {
    LIBSSH2_SESSION* session = conn_.session();
    if (!session) {
        err = "Not connected";
        return nullptr;
    }
    libssh2_struct_stat st{};
    LIBSSH2_CHANNEL* ch = libssh2_scp_recv2(session, path.c_str(), &st);
    if (!ch) {
        err = "scp recv failed: " + conn_.lastError();
        return nullptr;
    }
    return std::make_unique<ScpReadFile>(ch, static_cast<std::uint64_t>(st.st_size));
}

std::unique_ptr<RemoteFile> Libssh2ScpSession::openWrite(const std::string& path,
                                                         std::uint64_t size,
                                                         std::string& err) {
    LIBSSH2_SESSION* session = conn_.session();
    if (!session) {
        err = "Not connected";
        return nullptr;
    }
    LIBSSH2_CHANNEL* ch = libssh2_scp_send64(session, path.c_str(), 0644,
                                             static_cast<libssh2_int64_t>(size), 0, 0);
    if (!ch) {
        err = "scp send failed: " + conn_.lastError();
        return nullptr;
    }
    return std::make_unique<ScpWriteFile>(ch, size);
}

bool Libssh2ScpSession::unlink(const std::string& path, std::string& err) {
    std::string out;
    return run("rm -f " + shellQuote(path), out, err);
}

bool Libssh2ScpSession::rmdir(const std::string& path, std::string& err) {
    std::string out;
    return run("rmdir " + shellQuote(path), out, err);
}

bool Libssh2ScpSession::mkdir(const std::string& path, unsigned int mode, std::string& err) {
    char octal[8];
    std::snprintf(octal, sizeof(octal), "%o", mode & 07777u);
    std::string out;
    return run(std::string("mkdir -m ") + octal + " " + shellQuote(path), out, err);
}

} // namespace termxfer
