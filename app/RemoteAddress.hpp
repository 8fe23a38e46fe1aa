// Command line target: [protocol://][user@]host[:port][:wrkdir]
#pragma once
#include "termxfer/TransferTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct RemoteAddress {
    termxfer::FileTransferProtocol protocol = termxfer::FileTransferProtocol::Sftp;
    std::string host;
    std::uint16_t port = 22;
    std::optional<std::string> username;
    std::optional<std::string> wrkdir;
};

// Port defaults to the protocol's well known port. IPv6 hosts go in
// brackets ("[::1]:2222").
bool parseRemoteAddress(const std::string &text, RemoteAddress &out, std::string &err);
