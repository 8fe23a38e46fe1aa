// SFTP transport: subsystem channel on top of a Libssh2Connection.
#include "termxfer/Libssh2SftpSession.hpp"
#include "termxfer/PathUtils.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <vector>

namespace termxfer {

namespace {

std::string sftpErrorText(LIBSSH2_SFTP* sftp, const char* what) {
    std::string s(what);
    if (sftp) s += " (sftp error " + std::to_string(libssh2_sftp_last_error(sftp)) + ")";
    return s;
}

class SftpRemoteFile : public RemoteFile {
public:
    SftpRemoteFile(LIBSSH2_SFTP* sftp, LIBSSH2_SFTP_HANDLE* h) : sftp_(sftp), h_(h) {}
    ~SftpRemoteFile() override {
        if (h_) libssh2_sftp_close(h_);
    }

    std::int64_t read(char* buf, std::size_t len, std::string& err) override {
        const ssize_t n = libssh2_sftp_read(h_, buf, len);
        if (n < 0) {
            err = sftpErrorText(sftp_, "Remote read failed");
            return -1;
        }
        return static_cast<std::int64_t>(n);
    }

    std::int64_t write(const char* buf, std::size_t len, std::string& err) override {
        const ssize_t n = libssh2_sftp_write(h_, buf, len);
        if (n < 0) {
            err = sftpErrorText(sftp_, "Remote write failed");
            return -1;
        }
        return static_cast<std::int64_t>(n);
    }

    bool seekEnd(std::uint64_t& pos, std::string& err) override {
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_fstat(h_, &st) != 0 || !(st.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
            err = sftpErrorText(sftp_, "fstat failed");
            return false;
        }
        libssh2_sftp_seek64(h_, static_cast<libssh2_uint64_t>(st.filesize));
        pos = st.filesize;
        return true;
    }

    bool rewind(std::string& err) override {
        (void)err;
        libssh2_sftp_rewind(h_);
        return true;
    }

    bool close(std::string& err) override {
        if (!h_) return true;
        const int rc = libssh2_sftp_close(h_);
        h_ = nullptr;
        if (rc != 0) {
            err = sftpErrorText(sftp_, "Remote close failed");
            return false;
        }
        return true;
    }

private:
    LIBSSH2_SFTP* sftp_;
    LIBSSH2_SFTP_HANDLE* h_;
};

} // namespace

Libssh2SftpSession::~Libssh2SftpSession() {
    reset();
}

bool Libssh2SftpSession::requireSftp(std::string& err) const {
    if (!sftp_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool Libssh2SftpSession::openSubsystem(std::string& err) {
    sftp_ = libssh2_sftp_init(conn_.session());
    if (!sftp_) {
        err = "Could not initialize SFTP: " + conn_.lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::homeDirectory(std::string& out, std::string& err) {
    return realpath(".", out, err);
}

bool Libssh2SftpSession::close(std::string& err) {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    return conn_.disconnect(err);
}

void Libssh2SftpSession::reset() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    conn_.reset();
}

bool Libssh2SftpSession::realpath(const std::string& path, std::string& out, std::string& err) {
    if (!requireSftp(err)) return false;
    char buf[4096];
    const int rc = libssh2_sftp_realpath(sftp_, path.c_str(), buf, sizeof(buf));
    if (rc <= 0) {
        err = sftpErrorText(sftp_, "sftp_realpath failed");
        return false;
    }
    out.assign(buf, static_cast<std::size_t>(rc));
    return true;
}

bool Libssh2SftpSession::readdir(const std::string& dir, std::vector<RawEntry>& out,
                                 std::string& err) {
    if (!requireSftp(err)) return false;

    LIBSSH2_SFTP_HANDLE* dh = libssh2_sftp_opendir(sftp_, dir.c_str());
    if (!dh) {
        err = sftpErrorText(sftp_, "sftp_opendir failed");
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dh, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            std::string name(filename, static_cast<std::size_t>(rc));
            if (name == "." || name == "..") continue;
            RawEntry r;
            r.path = joinPath(dir, name);
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
                const auto type = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
                r.is_dir = type == LIBSSH2_SFTP_S_IFDIR;
                r.is_symlink = type == LIBSSH2_SFTP_S_IFLNK;
                r.mode = static_cast<std::uint32_t>(attrs.permissions);
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) r.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
                r.atime = attrs.atime;
                r.mtime = attrs.mtime;
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
                r.uid = static_cast<std::uint32_t>(attrs.uid);
                r.gid = static_cast<std::uint32_t>(attrs.gid);
            }
            if (r.is_symlink) {
                // Classify the link by what it points to, when reachable.
                LIBSSH2_SFTP_ATTRIBUTES target{};
                if (libssh2_sftp_stat(sftp_, r.path.c_str(), &target) == 0 &&
                    (target.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) {
                    r.is_dir = (target.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
                }
            }
            out.push_back(std::move(r));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = sftpErrorText(sftp_, "sftp_readdir_ex failed");
            libssh2_sftp_closedir(dh);
            return false;
        }
    }

    libssh2_sftp_closedir(dh);
    return true;
}

bool Libssh2SftpSession::readlink(const std::string& path, std::string& out, std::string& err) {
    if (!requireSftp(err)) return false;
    char buf[4096];
    const int rc = libssh2_sftp_readlink(sftp_, path.c_str(), buf, sizeof(buf));
    if (rc < 0) {
        err = sftpErrorText(sftp_, "sftp_readlink failed");
        return false;
    }
    out.assign(buf, static_cast<std::size_t>(rc));
    return true;
}

std::unique_ptr<RemoteFile> Libssh2SftpSession::openRead(const std::string& path,
                                                         std::string& err) {
    if (!requireSftp(err)) return nullptr;
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = sftpErrorText(sftp_, "Could not open remote file for reading");
        return nullptr;
    }
    return std::make_unique<SftpRemoteFile>(sftp_, h);
}

std::unique_ptr<RemoteFile> Libssh2SftpSession::openWrite(const std::string& path,
                                                          std::uint64_t size,
                                                          std::string& err) {
    (void)size;
    if (!requireSftp(err)) return nullptr;
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = sftpErrorText(sftp_, "Could not open remote file for writing");
        return nullptr;
    }
    return std::make_unique<SftpRemoteFile>(sftp_, h);
}

bool Libssh2SftpSession::unlink(const std::string& path, std::string& err) {
    if (!requireSftp(err)) return false;
    if (libssh2_sftp_unlink(sftp_, path.c_str()) != 0) {
        err = sftpErrorText(sftp_, "sftp_unlink failed");
        return false;
    }
    return true;
}

bool Libssh2SftpSession::rmdir(const std::string& path, std::string& err) {
    if (!requireSftp(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, path.c_str()) != 0) {
        err = sftpErrorText(sftp_, "sftp_rmdir failed (directory not empty?)");
        return false;
    }
    return true;
}

bool Libssh2SftpSession::mkdir(const std::string& path, unsigned int mode, std::string& err) {
    if (!requireSftp(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, path.c_str(), static_cast<long>(mode)) != 0) {
        err = sftpErrorText(sftp_, "sftp_mkdir failed");
        return false;
    }
    return true;
}

} // namespace termxfer
