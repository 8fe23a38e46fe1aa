// Basic types shared between the front end and the core: protocols, session
// options, error kinds and progress reporting.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace termxfer {

enum class FileTransferProtocol {
    Sftp,
    Scp,
    Ftp
};

const char* protocolName(FileTransferProtocol p);

// Case-insensitive "sftp", "scp" or "ftp".
std::optional<FileTransferProtocol> protocolFromName(const std::string& name);

std::uint16_t defaultPort(FileTransferProtocol p);

// known_hosts validation policy for the server host key (SSH based protocols).
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Ready
};

enum class TransferErrorKind {
    BadAddress,             // host cannot be resolved or reached
    ConnectionError,        // session/handshake failure
    AuthenticationFailed,
    ProtocolError,          // post-handshake negotiation failure
    UninitializedSession,
    NoSuchFileOrDirectory,
    DirStatFailed,
    FileCreateDenied,
    FileReadonly,           // entry could not be removed
    IoError                 // msg carries the underlying cause
};

const char* errorKindName(TransferErrorKind k);

struct TransferError {
    TransferErrorKind kind = TransferErrorKind::IoError;
    std::string msg;

    TransferError() = default;
    TransferError(TransferErrorKind k, std::string m = {}) : kind(k), msg(std::move(m)) {}

    std::string toString() const;
};

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if the user provided input.
// If it returns false, the backend uses a heuristic (username/password) as a fallback.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;

    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject. Unset accepts.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Custom handling for keyboard-interactive (e.g., OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;
};

// (bytes transferred so far, total). total == 0 means unknown.
using ProgressCB = std::function<void(std::uint64_t done, std::uint64_t total)>;

} // namespace termxfer
