// Remote listing pipeline.
#include "sftpflow/Lister.hpp"
#include "sftpflow/Log.hpp"
#include "sftpflow/PathTranslator.hpp"
#include "sftpflow/SftpUrl.hpp"
#include "sftpflow/TreeWalker.hpp"

namespace sftpflow {

namespace {

bool fileSize(SftpClient& session, const std::string& p, std::int64_t& size, Error& err) {
    FileInfo info{};
    std::string serr;
    if (!session.lstat(p, info, serr)) {
        err.set(ErrorKind::Traversal, serr.empty() ? ("No such file: " + p) : serr);
        return false;
    }
    size = (std::int64_t)info.size;
    return true;
}

} // namespace

bool Lister::nodeSize(SftpClient& session, const RemoteNode& node,
                      std::int64_t& size, Error& err) {
    if (node.kind != NodeKind::Directory) return fileSize(session, node.path, size, err);

    std::int64_t total = 0;
    auto addFile = [&](const RemoteNode& n, Error& e) {
        std::int64_t s = 0;
        if (!fileSize(session, n.path, s, e)) return false;
        total += s;
        return true;
    };
    auto ignore = [](const RemoteNode&, Error&) { return true; };
    TreeWalker walker(session);
    if (!walker.walk(node.path, addFile, ignore, ignore, true, err)) return false;
    size = total;
    return true;
}

bool Lister::list(const ConnectionIdentity& id,
                  const std::vector<std::string>& roots,
                  const ListOptions& options,
                  std::vector<TransferRecord>& out,
                  Error& err) {
    LOGD("Connecting to %s", id.host.c_str());
    std::unique_ptr<SftpClient> session = connections_.connect(id, err);
    if (!session) return false;

    const std::string prefix = url::prefixFor(id);
    const std::vector<std::string> dirs = roots.empty() ? std::vector<std::string>{"."} : roots;

    for (const std::string& root : dirs) {
        auto handleNode = [&](const RemoteNode& node, Error& e) {
            if (node.kind == NodeKind::Directory && (options.filesOnly || node.path == root)) return true;

            std::string absolute;
            std::string serr;
            if (!session->normalize(node.path, absolute, serr)) {
                e.set(ErrorKind::Traversal, "Failed to resolve " + node.path + " (" + serr + ")");
                return false;
            }

            TransferRecord r;
            r.title = path::remoteBasename(node.path);
            r.url = url::locationFor(prefix, absolute);
            if (options.computeSize) {
                Error sizeErr;
                if (!nodeSize(*session, node, r.size, sizeErr)) {
                    LOGE("Failed to get size for %s (%s)", node.path.c_str(), sizeErr.message.c_str());
                    r.size = -1;
                }
            }
            if (id.private_key_path) {
                r.private_key_path = id.private_key_path;
                if (id.private_key_passphrase) r.private_key_passphrase = id.private_key_passphrase;
            }
            out.push_back(std::move(r));
            return true;
        };
        auto handleUnknown = [](const RemoteNode& node, Error&) {
            LOGW("Skipping unknown file: %s", node.path.c_str());
            return true;
        };

        Error walkErr;
        TreeWalker walker(*session);
        if (!walker.walk(root, handleNode, handleNode, handleUnknown, options.recursive, walkErr)) {
            LOGE("Failed to list %s (%s)", root.c_str(), walkErr.message.c_str());
            continue;
        }
    }

    session->disconnect();
    return true;
}

} // namespace sftpflow
