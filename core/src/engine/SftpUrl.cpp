// sftp:// URL encoding and parsing.
#include "sftpflow/SftpUrl.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace sftpflow {
namespace url {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string lower(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

} // namespace

std::string percentEncode(const std::string& s, const std::string& safe) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        const unsigned char c = (unsigned char)ch;
        if (isUnreserved(c) || safe.find(ch) != std::string::npos) {
            out += ch;
        } else {
            char b[4];
            std::snprintf(b, sizeof(b), "%%%02X", (unsigned)c);
            out += b;
        }
    }
    return out;
}

bool percentDecode(const std::string& s, std::string& out) {
    out.clear();
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out += s[i];
            continue;
        }
        if (i + 2 >= s.size()) return false;
        const int hi = hexValue(s[i + 1]);
        const int lo = hexValue(s[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out += (char)((hi << 4) | lo);
        i += 2;
    }
    return true;
}

std::string prefixFor(const ConnectionIdentity& id) {
    std::string login;
    if (!id.username.empty() && id.password && !id.password->empty()) {
        login = percentEncode(id.username, "") + ":" + percentEncode(*id.password, "") + "@";
    } else if (!id.username.empty()) {
        login = percentEncode(id.username, "") + "@";
    }
    std::string host = id.host;
    if (host.find(':') != std::string::npos) host = "[" + host + "]"; // IPv6 literal
    std::string port;
    if (id.port != 0 && id.port != 22) port = ":" + std::to_string(id.port);
    return "sftp://" + login + host + port + "/";
}

std::string locationFor(const std::string& prefix, const std::string& absolutePath) {
    std::string base = prefix;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string p = percentEncode(absolutePath);
    if (p.empty() || p.front() != '/') p = "/" + p;
    return base + p;
}

bool parse(const std::string& text, ParsedUrl& out, std::string& err) {
    out = ParsedUrl{};
    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        err = "Not a URL: " + text;
        return false;
    }
    out.scheme = lower(text.substr(0, schemeEnd));

    const std::string rest = text.substr(schemeEnd + 3);
    const auto pathStart = rest.find('/');
    std::string authority = pathStart == std::string::npos ? rest : rest.substr(0, pathStart);
    std::string rawPath = pathStart == std::string::npos ? std::string() : rest.substr(pathStart);
    // Drop query and fragment; SFTP paths never carry them
    const auto qpos = rawPath.find_first_of("?#");
    if (qpos != std::string::npos) rawPath.erase(qpos);

    // userinfo@hostport
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        const std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        const auto colon = userinfo.find(':');
        std::string user = colon == std::string::npos ? userinfo : userinfo.substr(0, colon);
        std::string decoded;
        if (!percentDecode(user, decoded)) {
            err = "Malformed username in URL: " + text;
            return false;
        }
        out.identity.username = decoded;
        if (colon != std::string::npos) {
            if (!percentDecode(userinfo.substr(colon + 1), decoded)) {
                err = "Malformed password in URL: " + text;
                return false;
            }
            if (!decoded.empty()) out.identity.password = decoded;
        }
    }

    std::string host = authority;
    std::string port;
    if (!host.empty() && host.front() == '[') {
        const auto close = host.find(']');
        if (close == std::string::npos) {
            err = "Malformed IPv6 host in URL: " + text;
            return false;
        }
        if (close + 1 < host.size()) {
            if (host[close + 1] != ':') {
                err = "Malformed host in URL: " + text;
                return false;
            }
            port = host.substr(close + 2);
        }
        host = host.substr(1, close - 1);
    } else {
        const auto colon = host.rfind(':');
        if (colon != std::string::npos) {
            port = host.substr(colon + 1);
            host = host.substr(0, colon);
        }
    }
    if (host.empty()) {
        err = "Missing host in URL: " + text;
        return false;
    }
    out.identity.host = lower(host);
    out.identity.port = 22;
    if (!port.empty()) {
        char* end = nullptr;
        const long v = std::strtol(port.c_str(), &end, 10);
        if (!end || *end != '\0' || v <= 0 || v > 65535) {
            err = "Invalid port in URL: " + text;
            return false;
        }
        out.identity.port = (std::uint16_t)v;
    }

    if (!percentDecode(rawPath, out.path)) {
        err = "Malformed path in URL: " + text;
        return false;
    }
    if (out.path.empty()) out.path = ".";
    return true;
}

} // namespace url
} // namespace sftpflow
