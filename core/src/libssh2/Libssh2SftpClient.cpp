// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes TCP/SSH keepalive, known_hosts validation and several auth methods.
#include "sftpflow/Libssh2SftpClient.hpp"
#include "sftpflow/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <cstdio>
#include <sstream>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace sftpflow {

// Global libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: caller supplied answers
};

static void fillResponse(LIBSSH2_USERAUTH_KBDINT_RESPONSE& r, const char* text, size_t len) {
    r.text = nullptr;
    r.length = 0;
    if (!text || len == 0) return;
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return;
    std::memcpy(buf, text, len);
    buf[len] = '\0';
    r.text = buf;
    r.length = (unsigned int)len;
}

// Keyboard-interactive callback: respond to prompts with username/password based on the text
static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    // Give the caller a chance to answer the prompts first.
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve((size_t)num_prompts);
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        if ((*(ctx->cb))(nm, ins, ptxts, answers) && (int)answers.size() >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string& a = answers[(size_t)i];
                fillResponse(responses[i], a.data(), a.size());
            }
            return;
        }
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length)
                                 : std::string();
        for (char& c : prompt) c = (char)std::tolower((unsigned char)c);
        // Heuristic: prompts mentioning "user" or "name" want the username
        const bool wantUser = prompt.find("user") != std::string::npos || prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        fillResponse(responses[i], ans, ans ? std::strlen(ans) : 0);
    }
}

Libssh2SftpClient::Libssh2SftpClient() {
    if (!g_libssh2_inited) {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
        g_libssh2_inited = true;
    }
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

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
        // Timeouts are left to libssh2_session_set_timeout; SO_RCVTIMEO can
        // break userauth on some servers.
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
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    const ConnectionIdentity& id = opt.identity;
    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    // Effective path
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

    int alg = 0;
    std::string algName;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
            algName = "RSA";
            break;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
            algName = "DSA";
            break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
            algName = "ECDSA-256";
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
            algName = "ECDSA-384";
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
            algName = "ECDSA-521";
            break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
            algName = "ED25519";
            break;
#endif
        default:
            algName = "UNKNOWN";
            break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, id.host.c_str(), id.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, id.host.c_str(), id.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: ask the caller for confirmation
        std::string fpStr;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
        const int hashLen = 32;
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
        const char* hashName = "SHA256:";
#else
        const int hashLen = 20;
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1);
        const char* hashName = "SHA1:";
#endif
        if (h) {
            std::ostringstream oss;
            oss << hashName;
            for (int i = 0; i < hashLen; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        const bool confirmed = opt.hostkey_confirm_cb &&
                               opt.hostkey_confirm_cb(id.host, id.port, algName, fpStr);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        int addrc = libssh2_knownhost_addc(nh, id.host.c_str(), nullptr,
                                           hostkey, keylen,
                                           nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        LOGI("Added %s (%s) to %s", id.host.c_str(), algName.c_str(), khPath.c_str());
        return true;
    }

    libssh2_knownhost_free(nh);
    // AcceptNew tolerates nothing but NOTFOUND, which was handled above
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host not found in known_hosts";
    return false;
}

// Try up to three ssh-agent identities.
bool Libssh2SftpClient::agentAuth(const std::string& username) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                prev = identity;
                ++tries;
                int arc = -1;
                for (;;) {
                    arc = libssh2_agent_userauth(agent, username.c_str(), identity);
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

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    const ConnectionIdentity& id = opt.identity;
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed";
        return false;
    }

    // Blocking mode with a bounded timeout until the caller sets its own
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000);
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;

    // Authentication order:
    // 1) private key when given;
    // 2) password, then keyboard-interactive if the server offers it;
    // 3) ssh-agent as a last resort when publickey is allowed.
    if (id.private_key_path.has_value()) {
        const char* passphrase = id.private_key_passphrase ? id.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     id.username.c_str(),
                                                     nullptr,  // public key derived from the private key
                                                     id.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err = "Public key authentication failed";
            return false;
        }
    } else {
        std::string authlist;
        auto loadAuthList = [&]() {
            if (!authlist.empty()) return;
            char* methods = libssh2_userauth_list(session_, id.username.c_str(), (unsigned)id.username.size());
            authlist = methods ? std::string(methods) : std::string();
        };
        auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

        bool authed = false;
        if (id.password.has_value()) {
            int rc_pw = -1;
            for (;;) {
                rc_pw = libssh2_userauth_password(session_, id.username.c_str(), id.password->c_str());
                if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            // If the server closed after the password attempt, the rest would cascade-fail.
            if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
                rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
                rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
                err = "Server closed the connection after the password attempt";
                return false;
            }
            authed = (rc_pw == 0);

            if (!authed) {
                loadAuthList();
                if (hasMethod("keyboard-interactive")) {
                    KbdIntCtx ctx{id.username.c_str(), id.password->c_str(), &opt.keyboard_interactive_cb};
                    void** abs = libssh2_session_abstract(session_);
                    if (abs) *abs = &ctx;
                    int rc_kbd = -1;
                    for (;;) {
                        rc_kbd = libssh2_userauth_keyboard_interactive(session_, id.username.c_str(), kbint_password_callback);
                        if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                    if (abs) *abs = nullptr;
                    authed = (rc_kbd == 0);
                }
            }
        }

        if (!authed) {
            loadAuthList();
            if (hasMethod("publickey")) authed = agentAuth(id.username);
        }

        if (!authed) {
            char* emsgPtr = nullptr;
            int emlen = 0;
            (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
            std::string lastErr = (emsgPtr && emlen > 0) ? std::string(emsgPtr, (size_t)emlen) : std::string();
            err = id.password.has_value() ? "Password/keyboard-interactive authentication failed"
                                          : "No credentials: key, agent and password unavailable";
            if (!authlist.empty()) err += " (methods: " + authlist + ")";
            if (!lastErr.empty()) err += ": " + lastErr;
            return false;
        }
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(opt.identity.host, opt.identity.port, err)) return false;
    if (!sshHandshakeAuth(opt, err)) {
        // Release the half-open socket/session before reporting
        disconnect();
        return false;
    }

    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

void Libssh2SftpClient::setTimeout(std::chrono::milliseconds timeout) {
    if (session_) libssh2_session_set_timeout(session_, (long)timeout.count());
}

bool Libssh2SftpClient::requireConnected(std::string& err) {
    if (!connected_ || !sftp_) {
        lastCode_ = SftpErrorCode::ConnectionLost;
        err = "Not connected";
        return false;
    }
    return true;
}

std::string Libssh2SftpClient::failure(const std::string& what) {
    const int sessErr = session_ ? libssh2_session_last_errno(session_) : 0;
    if (sessErr == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        switch (libssh2_sftp_last_error(sftp_)) {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                lastCode_ = SftpErrorCode::NoSuchFile;
                return what + ": no such file";
            case LIBSSH2_FX_PERMISSION_DENIED:
                lastCode_ = SftpErrorCode::PermissionDenied;
                return what + ": permission denied";
            case LIBSSH2_FX_NO_CONNECTION:
            case LIBSSH2_FX_CONNECTION_LOST:
                lastCode_ = SftpErrorCode::ConnectionLost;
                return what + ": connection lost";
            case LIBSSH2_FX_FAILURE:
                lastCode_ = SftpErrorCode::Failure;
                return what + ": failure";
            default:
                lastCode_ = SftpErrorCode::Other;
                return what + ": SFTP status " + std::to_string(libssh2_sftp_last_error(sftp_));
        }
    }
    if (sessErr == LIBSSH2_ERROR_SOCKET_DISCONNECT || sessErr == LIBSSH2_ERROR_SOCKET_SEND ||
        sessErr == LIBSSH2_ERROR_SOCKET_RECV || sessErr == LIBSSH2_ERROR_TIMEOUT) {
        lastCode_ = SftpErrorCode::ConnectionLost;
    } else {
        lastCode_ = SftpErrorCode::Other;
    }
    char* emsgPtr = nullptr;
    int emlen = 0;
    if (session_) (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    if (emsgPtr && emlen > 0) return what + ": " + std::string(emsgPtr, (size_t)emlen);
    return what;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    if (!requireConnected(err)) return false;

    const std::string path = remote_path.empty() ? "." : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = failure("sftp_opendir failed for " + path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            // rc = name length
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
                fi.mode = attrs.permissions;
                fi.kind = nodeKindFromMode(attrs.permissions);
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = failure("sftp_readdir_ex failed for " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            std::string& err) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = failure("Could not open remote file for reading");
        return false;
    }

    FILE* lf = ::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        lastCode_ = SftpErrorCode::Other;
        err = "Could not open local file for writing: " + local;
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);

    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                lastCode_ = SftpErrorCode::Other;
                err = "Local write failed: " + local;
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return false;
            }
        } else if (n == 0) {
            break; // EOF
        } else {
            err = failure("Remote read failed");
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
    }

    if (std::fclose(lf) != 0) {
        libssh2_sftp_close(rh);
        lastCode_ = SftpErrorCode::Other;
        err = "Local write failed: " + local;
        return false;
    }
    libssh2_sftp_close(rh);
    lastCode_ = SftpErrorCode::None;
    return true;
}

bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            std::string& err) {
    if (!requireConnected(err)) return false;

    FILE* lf = ::fopen(local.c_str(), "rb");
    if (!lf) {
        lastCode_ = SftpErrorCode::Other;
        err = "Could not open local file for reading: " + local;
        return false;
    }

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = failure("Could not open remote file for writing");
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);

    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            char* p = buf.data();
            size_t remain = n;
            while (remain > 0) {
                ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    err = failure("Remote write failed");
                    libssh2_sftp_close(wh);
                    std::fclose(lf);
                    return false;
                }
                remain = remain - (size_t)w;
                p = p + w;
            }
        } else {
            if (std::ferror(lf)) {
                lastCode_ = SftpErrorCode::Other;
                err = "Local read failed: " + local;
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    lastCode_ = SftpErrorCode::None;
    return true;
}

bool Libssh2SftpClient::statImpl(const std::string& remote_path, int statType,
                                 FileInfo& info, std::string& err) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        statType, &st);
    if (rc != 0) {
        const std::string msg = failure("stat failed for " + remote_path);
        if (lastCode_ == SftpErrorCode::NoSuchFile || lastCode_ == SftpErrorCode::Failure) {
            err.clear();
            return false; // does not exist
        }
        err = msg;
        return false;
    }
    info.name.clear();
    info.kind = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? nodeKindFromMode(st.permissions) : NodeKind::Unknown;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)st.mtime : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? st.permissions : 0;
    return true;
}

bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               std::string& err) {
    isDir = false;
    FileInfo info{};
    if (!statImpl(remote_path, LIBSSH2_SFTP_STAT, info, err)) return false;
    isDir = info.isDir();
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    return statImpl(remote_path, LIBSSH2_SFTP_STAT, info, err);
}

bool Libssh2SftpClient::lstat(const std::string& remote_path,
                              FileInfo& info,
                              std::string& err) {
    return statImpl(remote_path, LIBSSH2_SFTP_LSTAT, info, err);
}

bool Libssh2SftpClient::normalize(const std::string& remote_path,
                                  std::string& out,
                                  std::string& err) {
    if (!requireConnected(err)) return false;
    char target[4096];
    int rc = libssh2_sftp_symlink_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                     target, sizeof(target), LIBSSH2_SFTP_REALPATH);
    if (rc < 0) {
        err = failure("realpath failed for " + remote_path);
        return false;
    }
    out.assign(target, (size_t)rc);
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              std::string& err,
                              unsigned int mode) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        err = failure("sftp_mkdir failed for " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   std::string& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = failure("sftp_unlink failed for " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  std::string& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = failure("sftp_rmdir failed for " + remote_dir);
        return false;
    }
    return true;
}

std::unique_ptr<SftpClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                 std::string& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace sftpflow
