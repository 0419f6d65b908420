// Remote tree traversal.
#include "sftpflow/TreeWalker.hpp"
#include "sftpflow/Log.hpp"
#include "sftpflow/PathTranslator.hpp"

namespace sftpflow {

bool TreeWalker::walk(const std::string& root,
                      const NodeCallback& onFile,
                      const NodeCallback& onDirectory,
                      const NodeCallback& onUnknown,
                      bool recursive,
                      Error& err) {
    onFile_ = &onFile;
    onDirectory_ = &onDirectory;
    onUnknown_ = &onUnknown;

    FileInfo info{};
    std::string serr;
    if (!session_.stat(root, info, serr)) {
        if (serr.empty()) {
            err.set(ErrorKind::PathNotFound, "Remote path does not exist: " + root);
        } else {
            err.set(ErrorKind::Traversal, "Failed to open " + root + " (" + serr + ")");
        }
        return false;
    }

    const RemoteNode node{root, info.kind};
    if (!dispatch(node, err)) return false;
    if (node.kind != NodeKind::Directory) return true;
    return walkChildren(root, recursive, err);
}

bool TreeWalker::dispatch(const RemoteNode& node, Error& err) {
    const NodeCallback* cb = nullptr;
    switch (node.kind) {
        case NodeKind::File:      cb = onFile_; break;
        case NodeKind::Directory: cb = onDirectory_; break;
        case NodeKind::Unknown:   cb = onUnknown_; break;
    }
    if (!cb || !*cb) return true;
    return (*cb)(node, err);
}

bool TreeWalker::walkChildren(const std::string& dir, bool recursive, Error& err) {
    std::vector<FileInfo> children;
    std::string serr;
    if (!session_.list(dir, children, serr)) {
        err.set(ErrorKind::Traversal, "Failed to open " + dir + " (" + serr + ")");
        return false;
    }
    LOGD("Walking %s (%zu entries)", dir.c_str(), children.size());

    for (const FileInfo& child : children) {
        const RemoteNode node{path::remoteJoin(dir, child.name), child.kind};
        if (!dispatch(node, err)) return false;
        if (recursive && node.kind == NodeKind::Directory) {
            if (!walkChildren(node.path, recursive, err)) return false;
        }
    }
    return true;
}

} // namespace sftpflow
