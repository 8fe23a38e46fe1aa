#include "RemoteAddress.hpp"
#include <cctype>

static bool allDigits(const std::string &s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

bool parseRemoteAddress(const std::string &text, RemoteAddress &out, std::string &err) {
    RemoteAddress r;
    std::string rest = text;

    const auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        const auto proto = termxfer::protocolFromName(rest.substr(0, scheme));
        if (!proto) {
            err = "Unknown protocol '" + rest.substr(0, scheme) + "'";
            return false;
        }
        r.protocol = *proto;
        rest = rest.substr(scheme + 3);
    }
    r.port = termxfer::defaultPort(r.protocol);

    const auto at = rest.rfind('@');
    if (at != std::string::npos) {
        if (at == 0) {
            err = "Empty user name";
            return false;
        }
        r.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    std::string tail;
    if (!rest.empty() && rest.front() == '[') {
        const auto close = rest.find(']');
        if (close == std::string::npos) {
            err = "Unterminated IPv6 address";
            return false;
        }
        r.host = rest.substr(1, close - 1);
        tail = rest.substr(close + 1);
        if (!tail.empty() && tail.front() != ':') {
            err = "Unexpected text after address";
            return false;
        }
    } else {
        const auto colon = rest.find(':');
        r.host = rest.substr(0, colon);
        if (colon != std::string::npos)
            tail = rest.substr(colon);
    }
    if (r.host.empty()) {
        err = "Missing host";
        return false;
    }

    // tail is "", ":port", ":port:wrkdir" or ":wrkdir"
    if (!tail.empty()) {
        tail.erase(0, 1);
        const auto colon = tail.find(':');
        const std::string first = tail.substr(0, colon);
        if (allDigits(first)) {
            const unsigned long port = first.size() > 5 ? 0 : std::stoul(first);
            if (port == 0 || port > 65535) {
                err = "Port out of range: " + first;
                return false;
            }
            r.port = static_cast<std::uint16_t>(port);
            if (colon != std::string::npos && colon + 1 < tail.size())
                r.wrkdir = tail.substr(colon + 1);
        } else if (!tail.empty()) {
            r.wrkdir = tail;
        }
    }
    out = std::move(r);
    return true;
}
