// SSH plumbing shared by the libssh2 based sessions: TCP socket, handshake,
// known_hosts verification and user authentication.
#pragma once
#include "TransferTypes.hpp"
#include <cstdint>
#include <string>

// Forward declarations of the internal libssh2 types (with underscore)
struct _LIBSSH2_SESSION;

namespace termxfer {

class Libssh2Connection {
public:
    Libssh2Connection();
    ~Libssh2Connection();

    Libssh2Connection(const Libssh2Connection&) = delete;
    Libssh2Connection& operator=(const Libssh2Connection&) = delete;

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
    bool handshake(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);

    // Sends SSH_MSG_DISCONNECT, then releases everything.
    bool disconnect(std::string& err);
    void reset();

    _LIBSSH2_SESSION* session() const { return session_; }

    // Last libssh2 error message of the session, for diagnostics.
    std::string lastError() const;

private:
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authWithAgent(const std::string& user);

    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
};

} // namespace termxfer
