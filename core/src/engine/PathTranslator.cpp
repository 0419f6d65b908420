// Remote/local path translation.
#include "sftpflow/PathTranslator.hpp"

namespace sftpflow {
namespace path {

namespace {

bool isLocalSeparator(char c) {
#ifdef _WIN32
    return c == '\\' || c == '/';
#else
    return c == kLocalSeparator;
#endif
}

std::string::size_type lastLocalSeparator(const std::string& p) {
    for (std::string::size_type i = p.size(); i > 0; --i) {
        if (isLocalSeparator(p[i - 1])) return i - 1;
    }
    return std::string::npos;
}

} // namespace

std::vector<std::string> splitSegments(const std::string& p, char sep) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    for (;;) {
        const auto pos = p.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(p.substr(start));
            break;
        }
        out.push_back(p.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string joinSegments(const std::vector<std::string>& segments, char sep) {
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i) out += sep;
        out += segments[i];
    }
    return out;
}

std::string remoteJoin(const std::string& a, const std::string& b) {
    if (!b.empty() && b.front() == kRemoteSeparator) return b;
    if (a.empty() || a.back() == kRemoteSeparator) return a + b;
    return a + kRemoteSeparator + b;
}

std::string remoteBasename(const std::string& p) {
    const auto pos = p.rfind(kRemoteSeparator);
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string remoteDirname(const std::string& p) {
    const auto pos = p.rfind(kRemoteSeparator);
    if (pos == std::string::npos) return std::string();
    std::string head = p.substr(0, pos + 1);
    // Strip trailing separators unless the head is made of separators only
    if (head.find_first_not_of(kRemoteSeparator) != std::string::npos) {
        while (!head.empty() && head.back() == kRemoteSeparator) head.pop_back();
    }
    return head;
}

std::string remoteNormalize(const std::string& p) {
    if (p.empty()) return ".";
    const bool absolute = p.front() == kRemoteSeparator;
    std::vector<std::string> parts;
    for (const std::string& seg : splitSegments(p, kRemoteSeparator)) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
                continue;
            }
            if (absolute) continue; // ".." at the root stays at the root
        }
        parts.push_back(seg);
    }
    std::string out = joinSegments(parts, kRemoteSeparator);
    if (absolute) return "/" + out;
    return out.empty() ? "." : out;
}

bool remoteRelative(const std::string& p, const std::string& base, std::string& out) {
    if (base.empty() || base == ".") {
        out = p;
        return true;
    }
    if (base == "/") {
        if (p.empty() || p.front() != kRemoteSeparator) return false;
        out = p.substr(1);
        return true;
    }
    std::string prefix = base;
    if (prefix.back() != kRemoteSeparator) prefix += kRemoteSeparator;
    if (p.compare(0, prefix.size(), prefix) != 0) return false;
    out = p.substr(prefix.size());
    return true;
}

std::string remoteToLocal(const std::string& remote) {
    return joinSegments(splitSegments(remote, kRemoteSeparator), kLocalSeparator);
}

std::string localToRemote(const std::string& local) {
    return joinSegments(splitSegments(local, kLocalSeparator), kRemoteSeparator);
}

std::string localJoin(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    std::string rhs = b;
    while (!rhs.empty() && isLocalSeparator(rhs.front())) rhs.erase(0, 1);
    if (isLocalSeparator(a.back())) return a + rhs;
    return a + kLocalSeparator + rhs;
}

std::string localBasename(const std::string& p) {
    const auto pos = lastLocalSeparator(p);
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string localDirname(const std::string& p) {
    const auto pos = lastLocalSeparator(p);
    if (pos == std::string::npos) return std::string();
    if (pos == 0) return p.substr(0, 1);
    return p.substr(0, pos);
}

} // namespace path
} // namespace sftpflow
