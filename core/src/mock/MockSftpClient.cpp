// Mock implementation: an in-memory tree keyed by absolute path.
#include "sftpflow/MockSftpClient.hpp"
#include "sftpflow/PathTranslator.hpp"
#include <algorithm>
#include <cstdio>

namespace sftpflow {

std::string MockRemote::resolve(const std::string& path) const {
    return path::remoteNormalize(path::remoteJoin(home, path.empty() ? "." : path));
}

void MockRemote::addDir(const std::string& path) {
    const std::string p = resolve(path);
    if (p != "/") addDir(path::remoteDirname(p));
    nodes[p].kind = NodeKind::Directory;
}

void MockRemote::addFile(const std::string& path, const std::string& data) {
    const std::string p = resolve(path);
    addDir(path::remoteDirname(p));
    nodes[p] = Node{NodeKind::File, data};
}

void MockRemote::addSpecial(const std::string& path) {
    const std::string p = resolve(path);
    addDir(path::remoteDirname(p));
    nodes[p] = Node{NodeKind::Unknown, {}};
}

bool MockRemote::has(const std::string& path) const {
    return nodes.count(resolve(path)) > 0;
}

NodeKind MockRemote::kindOf(const std::string& path) const {
    auto it = nodes.find(resolve(path));
    return it == nodes.end() ? NodeKind::Unknown : it->second.kind;
}

std::string MockRemote::contents(const std::string& path) const {
    auto it = nodes.find(resolve(path));
    return it == nodes.end() ? std::string() : it->second.data;
}

bool MockSftpClient::connect(const SessionOptions& opt, std::string& err) {
    ++remote_->connectAttempts;
    if (opt.identity.host.empty() || opt.identity.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (remote_->failConnects != 0) {
        if (remote_->failConnects > 0) --remote_->failConnects;
        err = remote_->connectError;
        return false;
    }
    connected_ = true;
    lastOpt_ = opt;
    ++remote_->connects;
    return true;
}

void MockSftpClient::disconnect() {
    if (!connected_) return;
    connected_ = false;
    ++remote_->disconnects;
}

std::unique_ptr<SftpClient> MockSftpClient::newConnectionLike(const SessionOptions& opt,
                                                              std::string& err) {
    auto p = std::make_unique<MockSftpClient>(remote_);
    if (!p->connect(opt, err)) return nullptr;
    return p;
}

bool MockSftpClient::fail(SftpErrorCode code, const std::string& msg, std::string& err) {
    lastCode_ = code;
    err = msg;
    return false;
}

bool MockSftpClient::requireConnected(std::string& err) {
    if (connected_) return true;
    return fail(SftpErrorCode::ConnectionLost, "Not connected", err);
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string p = remote_->resolve(remote_path);
    if (remote_->failList.count(p)) return fail(SftpErrorCode::Failure, "Injected listing failure: " + p, err);
    auto it = remote_->nodes.find(p);
    if (it == remote_->nodes.end()) return fail(SftpErrorCode::NoSuchFile, "No such directory: " + p, err);
    if (it->second.kind != NodeKind::Directory) return fail(SftpErrorCode::Failure, "Not a directory: " + p, err);

    out.clear();
    for (const auto& kv : remote_->nodes) {
        if (kv.first == p || path::remoteDirname(kv.first) != p) continue;
        FileInfo fi{};
        fi.name = path::remoteBasename(kv.first);
        fi.kind = kv.second.kind;
        fi.size = kv.second.data.size();
        out.push_back(std::move(fi));
    }
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::string& err) {
    if (!requireConnected(err)) return false;
    ++remote_->gets;
    const std::string p = remote_->resolve(remote);
    auto it = remote_->nodes.find(p);
    if (it == remote_->nodes.end()) return fail(SftpErrorCode::NoSuchFile, "No such file: " + p, err);
    if (it->second.kind != NodeKind::File) return fail(SftpErrorCode::Failure, "Not a regular file: " + p, err);

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) return fail(SftpErrorCode::Other, "Could not open local file for writing: " + local, err);
    const std::string& data = it->second.data;
    const bool injected = remote_->failGet.count(p) > 0;
    const std::size_t n = injected ? std::min(remote_->partialBytesOnFailedGet, data.size()) : data.size();
    const bool wrote = std::fwrite(data.data(), 1, n, lf) == n;
    std::fclose(lf);
    if (injected) return fail(SftpErrorCode::ConnectionLost, "Injected read failure: " + p, err);
    if (!wrote) return fail(SftpErrorCode::Other, "Local write failed: " + local, err);
    lastCode_ = SftpErrorCode::None;
    return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         std::string& err) {
    if (!requireConnected(err)) return false;
    ++remote_->puts;
    const std::string p = remote_->resolve(remote);
    if (remote_->failPut.count(p)) return fail(remote_->failPutCode, "Injected write failure: " + p, err);
    const std::string parent = path::remoteDirname(p);
    auto pit = remote_->nodes.find(parent);
    if (pit == remote_->nodes.end() || pit->second.kind != NodeKind::Directory) {
        return fail(SftpErrorCode::NoSuchFile, "No such directory: " + parent, err);
    }

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) return fail(SftpErrorCode::Other, "Could not open local file for reading: " + local, err);
    std::string data;
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), lf)) > 0) data.append(buf, n);
    const bool readErr = std::ferror(lf) != 0;
    std::fclose(lf);
    if (readErr) return fail(SftpErrorCode::Other, "Local read failed: " + local, err);

    remote_->nodes[p] = MockRemote::Node{NodeKind::File, data};
    lastCode_ = SftpErrorCode::None;
    return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            std::string& err) {
    isDir = false;
    FileInfo info{};
    if (!stat(remote_path, info, err)) return false;
    isDir = info.isDir();
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string p = remote_->resolve(remote_path);
    if (remote_->failStat.count(p)) return fail(SftpErrorCode::ConnectionLost, "Injected stat failure: " + p, err);
    auto it = remote_->nodes.find(p);
    if (it == remote_->nodes.end()) {
        lastCode_ = SftpErrorCode::NoSuchFile;
        err.clear();
        return false; // does not exist
    }
    info = FileInfo{};
    info.name = path::remoteBasename(p);
    info.kind = it->second.kind;
    info.size = it->second.data.size();
    return true;
}

bool MockSftpClient::normalize(const std::string& remote_path,
                               std::string& out,
                               std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string p = remote_->resolve(remote_path);
    if (remote_->failNormalize.count(p)) return fail(SftpErrorCode::Failure, "Injected realpath failure: " + p, err);
    out = p;
    return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int mode) {
    (void)mode;
    if (!requireConnected(err)) return false;
    const std::string p = remote_->resolve(remote_dir);
    if (remote_->failMkdir.count(p)) return fail(SftpErrorCode::PermissionDenied, "Injected mkdir failure: " + p, err);
    if (remote_->nodes.count(p)) return fail(SftpErrorCode::Failure, "Already exists: " + p, err);
    auto pit = remote_->nodes.find(path::remoteDirname(p));
    if (pit == remote_->nodes.end() || pit->second.kind != NodeKind::Directory) {
        return fail(SftpErrorCode::NoSuchFile, "No such directory: " + path::remoteDirname(p), err);
    }
    remote_->nodes[p] = MockRemote::Node{NodeKind::Directory, {}};
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string p = remote_->resolve(remote_path);
    if (remote_->failRemove.count(p)) return fail(SftpErrorCode::PermissionDenied, "Injected unlink failure: " + p, err);
    auto it = remote_->nodes.find(p);
    if (it == remote_->nodes.end()) return fail(SftpErrorCode::NoSuchFile, "No such file: " + p, err);
    if (it->second.kind == NodeKind::Directory) return fail(SftpErrorCode::Failure, "Is a directory: " + p, err);
    remote_->nodes.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string p = remote_->resolve(remote_dir);
    if (remote_->failRemoveDir.count(p)) return fail(SftpErrorCode::PermissionDenied, "Injected rmdir failure: " + p, err);
    auto it = remote_->nodes.find(p);
    if (it == remote_->nodes.end()) return fail(SftpErrorCode::NoSuchFile, "No such directory: " + p, err);
    if (it->second.kind != NodeKind::Directory || p == "/") return fail(SftpErrorCode::Failure, "Cannot remove: " + p, err);
    for (const auto& kv : remote_->nodes) {
        if (kv.first != p && path::remoteDirname(kv.first) == p) {
            return fail(SftpErrorCode::Failure, "Directory not empty: " + p, err);
        }
    }
    remote_->nodes.erase(it);
    return true;
}

} // namespace sftpflow
