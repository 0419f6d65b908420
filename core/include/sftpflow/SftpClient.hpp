// Abstract interface for SFTP sessions. Concrete backends (libssh2, mock)
// implement it so the transfer engine stays independent of the transport.
#pragma once
#include "SftpTypes.hpp"
#include <chrono>
#include <memory>

namespace sftpflow {

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect. disconnect() is a no-op when not connected.
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Upper bound for every blocking call on the open session.
    virtual void setTimeout(std::chrono::milliseconds timeout) = 0;

    // Remote directory listing in server order ("." and ".." excluded).
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Download a remote file to local (create/truncate).
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err) = 0;

    // Upload a local file to remote (create/truncate).
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err) = 0;

    // Check existence following links (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Detailed metadata. Returns true if it exists; err stays empty when it does not.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Same as stat() without following a final symbolic link.
    virtual bool lstat(const std::string& remote_path,
                       FileInfo& info,
                       std::string& err) = 0;

    // Server-side canonical absolute path (realpath).
    virtual bool normalize(const std::string& remote_path,
                           std::string& out,
                           std::string& err) = 0;

    // Remote file/folder operations
    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    // Classification of the most recent failure on this session.
    virtual SftpErrorCode lastErrorCode() const = 0;

    // Create a new connection of the same type with the given options.
    virtual std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                          std::string& err) = 0;

    // Helpers built on the primitives above.
    bool lexists(const std::string& remote_path, std::string& err);
    bool isFile(const std::string& remote_path);
    bool isDirectory(const std::string& remote_path);
    // Create remote_dir and every missing parent.
    bool makeDirectories(const std::string& remote_dir, std::string& err);
};

} // namespace sftpflow
