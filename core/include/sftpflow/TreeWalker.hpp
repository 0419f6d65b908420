// Depth-first traversal of a remote tree with one callback per node kind.
#pragma once
#include "Errors.hpp"
#include "SftpClient.hpp"
#include <functional>

namespace sftpflow {

class TreeWalker {
public:
    // A callback returns false (and fills err) to stop the walk.
    using NodeCallback = std::function<bool(const RemoteNode& node, Error& err)>;

    explicit TreeWalker(SftpClient& session) : session_(session) {}

    // Dispatch `root`, then its children. A directory root is reported to
    // onDirectory before its children; with recursive=false only the
    // immediate children are visited. Children come in server listing
    // order. Nodes of unknown kind go to onUnknown and the walk continues.
    //
    // Errors: PathNotFound when root does not exist, Traversal when a
    // listing fails, or whatever a callback reported.
    bool walk(const std::string& root,
              const NodeCallback& onFile,
              const NodeCallback& onDirectory,
              const NodeCallback& onUnknown,
              bool recursive,
              Error& err);

private:
    bool dispatch(const RemoteNode& node, Error& err);
    bool walkChildren(const std::string& dir, bool recursive, Error& err);

    SftpClient& session_;
    const NodeCallback* onFile_ = nullptr;
    const NodeCallback* onDirectory_ = nullptr;
    const NodeCallback* onUnknown_ = nullptr;
};

} // namespace sftpflow
