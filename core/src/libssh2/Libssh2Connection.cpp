// libssh2 connection: TCP socket with keepalive, SSH handshake, known_hosts
// validation and password / keyboard-interactive / key / agent auth.
#include "termxfer/Libssh2Connection.hpp"
#include "termxfer/Log.hpp"
#include <libssh2.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace termxfer {

// Global libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

// keyboard-interactive context: answer username and password according to the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: front end callback for prompts
};

static void setResponse(LIBSSH2_USERAUTH_KBDINT_RESPONSE& r, const char* text, size_t len) {
    r.text = nullptr;
    r.length = 0;
    if (!text || len == 0) return;
    // libssh2 frees the responses with its allocator (malloc by default)
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return;
    std::memcpy(buf, text, len);
    buf[len] = '\0';
    r.text = buf;
    r.length = static_cast<unsigned int>(len);
}

// keyboard-interactive callback: answers prompts with user/password based on text
static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    // Give the front end callback the first chance to answer.
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve(static_cast<size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char*>(prompts[i].text)
                                 : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, static_cast<size_t>(name_len)) : std::string();
        std::string ins = (instruction && instruction_len > 0)
                              ? std::string(instruction, static_cast<size_t>(instruction_len))
                              : std::string();
        if ((*(ctx->cb))(nm, ins, ptxts, answers) &&
            static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string& a = answers[static_cast<size_t>(i)];
                setResponse(responses[i], a.data(), a.size());
            }
            return;
        }
        // callback could not answer: fall back to the heuristic
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text),
                                               prompts[i].length)
                                 : std::string();
        for (char& c : prompt) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        // Simple heuristic: prompts mentioning "user" or "name" get the username
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        setResponse(responses[i], ans, ans ? std::strlen(ans) : 0);
    }
}

Libssh2Connection::Libssh2Connection() {
    if (!g_libssh2_inited) {
        if (libssh2_init(0) != 0) {
            LOGE("libssh2_init failed");
        }
        g_libssh2_inited = true;
    }
}

Libssh2Connection::~Libssh2Connection() {
    reset();
}

bool Libssh2Connection::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // No SO_RCVTIMEO/SO_SNDTIMEO during auth: it interferes with userauth on
        // some servers. libssh2_session_set_timeout handles timeouts instead.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = "Could not connect to host/port";
    return false;
}

bool Libssh2Connection::handshake(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastError();
        return false;
    }

    // Blocking mode and a sane timeout to avoid EAGAIN during auth
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    return verifyHostKey(opt, err);
}

static int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

static const char* hostKeyAlgName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
    default: return "UNKNOWN";
    }
}

static std::string hostKeyFingerprint(LIBSSH2_SESSION* session) {
    std::ostringstream oss;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256));
    const int len = 32;
    oss << "SHA256:";
#else
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA1));
    const int len = 20;
    oss << "SHA1:";
#endif
    if (!h) return {};
    for (int i = 0; i < len; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

bool Libssh2Connection::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain host key";
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: ask the user when a callback is available
        if (opt.hostkey_confirm_cb &&
            !opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgName(keytype),
                                    hostKeyFingerprint(session_))) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed by the user";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                                 hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add/write host in known_hosts";
            return false;
        }
        LOGI("added host key %s to known_hosts", hostKeyAlgName(keytype));
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host unknown in known_hosts";
    return false;
}

bool Libssh2Connection::authWithAgent(const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3; // conservative limit
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                prev = identity;
                ++tries;
                int arc = -1;
                for (;;) {
                    arc = libssh2_agent_userauth(agent, user.c_str(), identity);
                    if (arc != LIBSSH2_ERROR_EAGAIN) break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                if (arc == 0) {
                    authed = true;
                    break;
                }
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Preference order:
// 1) private key when given;
// 2) password, then keyboard-interactive if the server offers it, then agent;
// 3) without credentials, ssh-agent.
bool Libssh2Connection::authenticate(const SessionOptions& opt, std::string& err) {
    const std::string user = opt.username.value_or(std::string());

    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(),
                                                     nullptr, // public key derived from the private one
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err = "Key authentication failed: " + lastError();
            return false;
        }
        return true;
    }

    std::string authlist;
    auto loadAuthList = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, user.c_str(), static_cast<unsigned>(user.size()));
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (!opt.password.has_value()) {
        loadAuthList();
        if (libssh2_userauth_authenticated(session_)) return true; // "none" accepted
        if (hasMethod("publickey") && authWithAgent(user)) return true;
        err = "No credentials: key/agent/password not available";
        return false;
    }

    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(session_, user.c_str(), opt.password->c_str());
        if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc_pw == 0) return true;

    // The server hung up after the password attempt: nothing else can work.
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "Server closed the connection after the password attempt";
        return false;
    }

    loadAuthList();
    int rc_kbd = -1;
    if (hasMethod("keyboard-interactive")) {
        KbdIntCtx ctx{user.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        for (;;) {
            rc_kbd = libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbint_password_callback);
            if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
    }

    if (hasMethod("publickey") && authWithAgent(user)) return true;

    const std::string lastErr = lastError();
    err = std::string("Password/keyboard-interactive authentication failed") +
          (authlist.empty() ? std::string() : (" (methods: " + authlist + ")")) +
          (lastErr.empty() ? std::string() : (": " + lastErr)) +
          " [rc_pw=" + std::to_string(rc_pw) + ", rc_kbd=" + std::to_string(rc_kbd) + "]";
    return false;
}

std::string Libssh2Connection::lastError() const {
    if (!session_) return {};
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, static_cast<size_t>(emlen)) : std::string();
}

bool Libssh2Connection::disconnect(std::string& err) {
    bool ok = true;
    if (session_) {
        if (libssh2_session_disconnect(session_, "bye") != 0) {
            err = "SSH disconnect failed: " + lastError();
            ok = false;
        }
    }
    reset();
    return ok;
}

void Libssh2Connection::reset() {
    if (session_) {
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
}

} // namespace termxfer
