#include "termxfer/RemoteSession.hpp"
#include "termxfer/FtpSession.hpp"
#include "termxfer/Libssh2ScpSession.hpp"
#include "termxfer/Libssh2SftpSession.hpp"

namespace termxfer {

std::unique_ptr<RemoteSession> makeRemoteSession(FileTransferProtocol protocol) {
    switch (protocol) {
    case FileTransferProtocol::Sftp:
        return std::make_unique<Libssh2SftpSession>();
    case FileTransferProtocol::Scp:
        return std::make_unique<Libssh2ScpSession>();
    case FileTransferProtocol::Ftp:
        return std::make_unique<FtpSession>();
    }
    return nullptr;
}

} // namespace termxfer
