// Backend-independent helpers of SftpClient.
#include "sftpflow/SftpClient.hpp"
#include "sftpflow/PathTranslator.hpp"

namespace sftpflow {

bool SftpClient::lexists(const std::string& remote_path, std::string& err) {
    FileInfo info{};
    err.clear();
    return lstat(remote_path, info, err);
}

bool SftpClient::isFile(const std::string& remote_path) {
    FileInfo info{};
    std::string err;
    return stat(remote_path, info, err) && info.isFile();
}

bool SftpClient::isDirectory(const std::string& remote_path) {
    FileInfo info{};
    std::string err;
    return stat(remote_path, info, err) && info.isDir();
}

bool SftpClient::makeDirectories(const std::string& remote_dir, std::string& err) {
    if (remote_dir.empty()) return true;
    // Walk the path from the top, creating each missing level
    std::string cur = remote_dir.front() == '/' ? "/" : "";
    for (const std::string& part : path::splitSegments(remote_dir, '/')) {
        if (part.empty() || part == ".") continue;
        cur = cur.empty() ? part : path::remoteJoin(cur, part);
        bool isDir = false;
        std::string e;
        if (exists(cur, isDir, e)) {
            if (!isDir) {
                err = "Not a directory: " + cur;
                return false;
            }
            continue;
        }
        if (!e.empty()) {
            err = e;
            return false;
        }
        if (!mkdir(cur, err, 0755)) return false;
    }
    return true;
}

} // namespace sftpflow
