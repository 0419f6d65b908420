// Path helpers for the two namespaces the engine works in: the remote one
// (always '/', POSIX string semantics) and the local one (native separator).
// All functions are pure string operations; nothing touches a filesystem.
#pragma once
#include <string>
#include <vector>

namespace sftpflow {
namespace path {

constexpr char kRemoteSeparator = '/';
#ifdef _WIN32
constexpr char kLocalSeparator = '\\';
#else
constexpr char kLocalSeparator = '/';
#endif

// Lossless split: empty segments are kept, so joinSegments(splitSegments(p)) == p.
std::vector<std::string> splitSegments(const std::string& p, char sep);
std::string joinSegments(const std::vector<std::string>& segments, char sep);

// POSIX join: an absolute right operand replaces the left one.
std::string remoteJoin(const std::string& a, const std::string& b);
std::string remoteBasename(const std::string& p);
std::string remoteDirname(const std::string& p);
// Collapse ".", ".." and repeated separators. Only applied where a caller asks for it.
std::string remoteNormalize(const std::string& p);
// Path of `p` relative to `base`. Returns false when `p` is not under `base`.
bool remoteRelative(const std::string& p, const std::string& base, std::string& out);

// Remote relative path to a local one, keeping every segment in order.
std::string remoteToLocal(const std::string& remote);
std::string localToRemote(const std::string& local);

// Local join always nests `b` under `a`.
std::string localJoin(const std::string& a, const std::string& b);
std::string localBasename(const std::string& p);
std::string localDirname(const std::string& p);

} // namespace path
} // namespace sftpflow
