// Chunk loops shared by send and receive: fixed buffer, short remote writes
// retried, progress after each successful write.
#include "termxfer/TransferEngine.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace termxfer {

static std::string errnoText(const char* what) {
    std::string s(what);
    if (errno != 0) {
        s += ": ";
        s += std::strerror(errno);
    }
    return s;
}

bool measureLocal(std::FILE* f, std::uint64_t& size) {
    size = 0;
    if (!f) return false;
    if (std::fseek(f, 0, SEEK_END) != 0) return false;
    const long sz = std::ftell(f);
    if (sz < 0) return false;
    size = static_cast<std::uint64_t>(sz);
    return true;
}

bool rewindLocal(std::FILE* f, TransferError& err) {
    errno = 0;
    if (!f || std::fseek(f, 0, SEEK_SET) != 0) {
        err = {TransferErrorKind::IoError, errnoText("Could not rewind local file")};
        return false;
    }
    return true;
}

bool spoolLocal(std::FILE* src, LocalFilePtr& spool, std::uint64_t& size, TransferError& err) {
    size = 0;
    errno = 0;
    LocalFilePtr tmp(std::tmpfile());
    if (!tmp) {
        err = {TransferErrorKind::IoError, errnoText("Could not create spool file")};
        return false;
    }
    std::vector<char> buf(kTransferChunkSize);
    while (true) {
        errno = 0;
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), src);
        if (n == 0) {
            if (std::ferror(src)) {
                err = {TransferErrorKind::IoError, errnoText("Local read failed")};
                return false;
            }
            break;
        }
        errno = 0;
        if (std::fwrite(buf.data(), 1, n, tmp.get()) != n) {
            err = {TransferErrorKind::IoError, errnoText("Could not write spool file")};
            return false;
        }
        size += n;
    }
    if (!rewindLocal(tmp.get(), err)) return false;
    spool = std::move(tmp);
    return true;
}

std::uint64_t measureRemote(RemoteFile& f) {
    std::uint64_t sz = 0;
    std::string e;
    if (!f.seekEnd(sz, e)) return 0;
    return sz;
}

bool rewindRemote(RemoteFile& f, TransferError& err) {
    std::string e;
    if (!f.rewind(e)) {
        err = {TransferErrorKind::IoError, e.empty() ? std::string("Could not rewind remote file") : e};
        return false;
    }
    return true;
}

bool pumpToRemote(std::FILE* src, RemoteFile& dst, std::uint64_t total,
                  const ProgressCB& progress, TransferError& err) {
    std::vector<char> buf(kTransferChunkSize);
    std::uint64_t done = 0;

    while (true) {
        errno = 0;
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), src);
        if (n == 0) {
            if (std::ferror(src)) {
                err = {TransferErrorKind::IoError, errnoText("Local read failed")};
                return false;
            }
            break; // EOF
        }
        const char* p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            std::string werr;
            const std::int64_t w = dst.write(p, remain, werr);
            if (w <= 0) {
                err = {TransferErrorKind::IoError,
                       werr.empty() ? std::string("Remote write failed") : werr};
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
        }
        done += n;
        if (progress) progress(done, total);
    }
    return true;
}

bool pumpFromRemote(RemoteFile& src, std::FILE* dst, std::uint64_t total,
                    const ProgressCB& progress, TransferError& err) {
    std::vector<char> buf(kTransferChunkSize);
    std::uint64_t done = 0;

    while (true) {
        std::string rerr;
        const std::int64_t n = src.read(buf.data(), buf.size(), rerr);
        if (n == 0) break; // EOF
        if (n < 0) {
            err = {TransferErrorKind::IoError,
                   rerr.empty() ? std::string("Remote read failed") : rerr};
            return false;
        }
        errno = 0;
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), dst) !=
            static_cast<std::size_t>(n)) {
            err = {TransferErrorKind::IoError, errnoText("Local write failed")};
            return false;
        }
        done += static_cast<std::uint64_t>(n);
        if (progress) progress(done, total);
    }
    errno = 0;
    if (std::fflush(dst) != 0) {
        err = {TransferErrorKind::IoError, errnoText("Local flush failed")};
        return false;
    }
    return true;
}

} // namespace termxfer
