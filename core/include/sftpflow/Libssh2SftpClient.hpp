// SftpClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sftpflow {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void setTimeout(std::chrono::milliseconds timeout) override;

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err) override;

    bool put(const std::string& local,
             const std::string& remote,
             std::string& err) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              std::string& err) override;

    bool lstat(const std::string& remote_path,
               FileInfo& info,
               std::string& err) override;

    bool normalize(const std::string& remote_path,
                   std::string& out,
                   std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    SftpErrorCode lastErrorCode() const override { return lastCode_; }

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                  std::string& err) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same
    SftpErrorCode lastCode_ = SftpErrorCode::None;

    // TCP connection + SSH handshake and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
    bool sshHandshakeAuth(const SessionOptions& opt, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool agentAuth(const std::string& username);
    // Shared stat/lstat path. Returns false with empty err when missing.
    bool statImpl(const std::string& remote_path, int statType, FileInfo& info, std::string& err);
    // Record the SFTP status of the last failed call and describe it.
    std::string failure(const std::string& what);
    bool requireConnected(std::string& err);
};

} // namespace sftpflow
