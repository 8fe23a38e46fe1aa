// Chunked byte pump between a local stdio handle and an open RemoteFile.
#pragma once
#include "RemoteSession.hpp"
#include "TransferTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>

namespace termxfer {

constexpr std::size_t kTransferChunkSize = 64 * 1024;

struct LocalFileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};
using LocalFilePtr = std::unique_ptr<std::FILE, LocalFileCloser>;

// Size of a local file obtained by seeking to its end. Returns false and
// leaves size at 0 (unknown) when the handle is not seekable (pipes,
// terminals); nothing has been consumed then and no rewind is needed.
// Otherwise the caller rewinds with rewindLocal().
bool measureLocal(std::FILE* f, std::uint64_t& size);
bool rewindLocal(std::FILE* f, TransferError& err);

// Copies a non-seekable source into an anonymous temporary file, for
// transports that announce the size before the body. On success spool is
// positioned at offset 0 and size holds the byte count.
bool spoolLocal(std::FILE* src, LocalFilePtr& spool, std::uint64_t& size, TransferError& err);

// Same for the remote side.
std::uint64_t measureRemote(RemoteFile& f);
bool rewindRemote(RemoteFile& f, TransferError& err);

// Copies until the source reports end of input. progress is invoked after
// every successful chunk write with (bytes so far, total); never after a failure.
bool pumpToRemote(std::FILE* src, RemoteFile& dst, std::uint64_t total,
                  const ProgressCB& progress, TransferError& err);

bool pumpFromRemote(RemoteFile& src, std::FILE* dst, std::uint64_t total,
                    const ProgressCB& progress, TransferError& err);

} // namespace termxfer
