#include "termxfer/TransferTypes.hpp"
#include <algorithm>
#include <cctype>

namespace termxfer {

const char* protocolName(FileTransferProtocol p) {
    switch (p) {
    case FileTransferProtocol::Sftp:
        return "sftp";
    case FileTransferProtocol::Scp:
        return "scp";
    case FileTransferProtocol::Ftp:
        return "ftp";
    }
    return "unknown";
}

std::optional<FileTransferProtocol> protocolFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "sftp") return FileTransferProtocol::Sftp;
    if (n == "scp") return FileTransferProtocol::Scp;
    if (n == "ftp") return FileTransferProtocol::Ftp;
    return std::nullopt;
}

std::uint16_t defaultPort(FileTransferProtocol p) {
    switch (p) {
    case FileTransferProtocol::Sftp:
    case FileTransferProtocol::Scp:
        return 22;
    case FileTransferProtocol::Ftp:
        return 21;
    }
    return 22;
}

const char* errorKindName(TransferErrorKind k) {
    switch (k) {
    case TransferErrorKind::BadAddress:
        return "Bad address";
    case TransferErrorKind::ConnectionError:
        return "Connection error";
    case TransferErrorKind::AuthenticationFailed:
        return "Authentication failed";
    case TransferErrorKind::ProtocolError:
        return "Protocol error";
    case TransferErrorKind::UninitializedSession:
        return "Uninitialized session";
    case TransferErrorKind::NoSuchFileOrDirectory:
        return "No such file or directory";
    case TransferErrorKind::DirStatFailed:
        return "Could not stat directory";
    case TransferErrorKind::FileCreateDenied:
        return "Failed to create file";
    case TransferErrorKind::FileReadonly:
        return "File is readonly";
    case TransferErrorKind::IoError:
        return "IO error";
    }
    return "Unknown error";
}

std::string TransferError::toString() const {
    std::string out = errorKindName(kind);
    if (!msg.empty()) {
        out += ": ";
        out += msg;
    }
    return out;
}

} // namespace termxfer
