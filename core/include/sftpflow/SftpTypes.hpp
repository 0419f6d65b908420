// Basic types shared by the SFTP backends, the transfer engine and the CLI.
// Kept as plain value structures so they can be copied, compared and grouped.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace sftpflow {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

// Kind of a node in the remote namespace.
enum class NodeKind {
    File,
    Directory,
    Unknown     // symlinks, devices, sockets, fifos, or missing type bits
};

// POSIX type bits (S_IFMT family) as sent by SFTP servers.
constexpr std::uint32_t kModeTypeMask = 0170000;
constexpr std::uint32_t kModeDirectory = 0040000;
constexpr std::uint32_t kModeRegular = 0100000;

inline NodeKind nodeKindFromMode(std::uint32_t mode) {
    switch (mode & kModeTypeMask) {
        case kModeDirectory: return NodeKind::Directory;
        case kModeRegular:   return NodeKind::File;
        default:             return NodeKind::Unknown;
    }
}

struct FileInfo {
    std::string   name;     // base name
    NodeKind      kind = NodeKind::Unknown;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)

    bool isDir() const { return kind == NodeKind::Directory; }
    bool isFile() const { return kind == NodeKind::File; }
};

// A node discovered while walking a remote tree. Never persisted.
struct RemoteNode {
    std::string path;   // remote namespace
    NodeKind    kind = NodeKind::Unknown;
};

// Endpoint and credentials. Two transfers may share a session only when
// their identities compare equal on every field.
struct ConnectionIdentity {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;
};

inline bool operator==(const ConnectionIdentity& a, const ConnectionIdentity& b) {
    return a.host == b.host && a.port == b.port && a.username == b.username &&
           a.password == b.password && a.private_key_path == b.private_key_path &&
           a.private_key_passphrase == b.private_key_passphrase;
}

inline bool operator!=(const ConnectionIdentity& a, const ConnectionIdentity& b) {
    return !(a == b);
}

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if it could answer.
// If it returns false, the backend falls back to username/password.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    ConnectionIdentity identity;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Custom handling for keyboard-interactive (e.g., OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;
};

// Coarse classification of the last failed SFTP call.
enum class SftpErrorCode {
    None,
    NoSuchFile,
    PermissionDenied,
    Failure,
    ConnectionLost,
    Other
};

} // namespace sftpflow
