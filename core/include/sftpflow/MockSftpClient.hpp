// Simulated SFTP client backed by an in-memory tree, for tests and dry runs
// without network. Several clients can share one MockRemote, the way several
// sessions share one server.
#pragma once
#include "SftpClient.hpp"
#include <map>
#include <memory>
#include <set>

namespace sftpflow {

struct MockRemote {
    struct Node {
        NodeKind kind = NodeKind::File;
        std::string data;
    };

    // Absolute, normalized paths. "/" always exists.
    std::map<std::string, Node> nodes = { { "/", { NodeKind::Directory, {} } } };
    std::string home = "/";

    // Failure injection
    int failConnects = 0;                 // upcoming connects to reject; -1 rejects all
    std::string connectError = "Connection refused";
    std::set<std::string> failList;
    std::set<std::string> failGet;
    std::size_t partialBytesOnFailedGet = 0;
    std::set<std::string> failPut;
    SftpErrorCode failPutCode = SftpErrorCode::Failure;
    std::set<std::string> failStat;
    std::set<std::string> failNormalize;
    std::set<std::string> failRemove;
    std::set<std::string> failRemoveDir;
    std::set<std::string> failMkdir;

    // Counters
    int connectAttempts = 0;
    int connects = 0;
    int disconnects = 0;
    int gets = 0;
    int puts = 0;
    std::chrono::milliseconds lastTimeout{0};

    // Parents are created as directories when missing.
    void addDir(const std::string& path);
    void addFile(const std::string& path, const std::string& data);
    void addSpecial(const std::string& path);   // symlink/device-like node
    bool has(const std::string& path) const;
    NodeKind kindOf(const std::string& path) const;
    std::string contents(const std::string& path) const;

    std::string resolve(const std::string& path) const;
};

class MockSftpClient : public SftpClient {
public:
    MockSftpClient() : remote_(std::make_shared<MockRemote>()) {}
    explicit MockSftpClient(std::shared_ptr<MockRemote> remote) : remote_(std::move(remote)) {}
    ~MockSftpClient() override { disconnect(); }

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void setTimeout(std::chrono::milliseconds timeout) override { remote_->lastTimeout = timeout; }

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
               std::string& err) override {
        return stat(remote_path, info, err); // the mock has no links to follow
    }

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

    const SessionOptions& lastOptions() const { return lastOpt_; }

private:
    bool fail(SftpErrorCode code, const std::string& msg, std::string& err);
    bool requireConnected(std::string& err);

    std::shared_ptr<MockRemote> remote_;
    bool connected_ = false;
    SessionOptions lastOpt_{};
    SftpErrorCode lastCode_ = SftpErrorCode::None;
};

} // namespace sftpflow
