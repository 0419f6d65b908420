// Error value used by the transfer engine. Nothing in the engine throws;
// operations return false and describe the failure through an Error.
#pragma once
#include <string>
#include <utility>

namespace sftpflow {

enum class ErrorKind {
    None,
    Connection,    // retry budget exhausted; fails the whole connection group
    PathNotFound,  // requested root or source does not exist
    Traversal,     // transport failure while walking a tree
    Transfer,      // a single get/put failed
    Render,        // destination template could not be rendered
    Cleanup        // origin delete or directory prune failed (non-fatal)
};

const char* errorKindName(ErrorKind kind);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    bool isSet() const { return kind != ErrorKind::None; }
};

} // namespace sftpflow
