#include "sftpflow/Errors.hpp"

namespace sftpflow {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "none";
        case ErrorKind::Connection:   return "connection";
        case ErrorKind::PathNotFound: return "path-not-found";
        case ErrorKind::Traversal:    return "traversal";
        case ErrorKind::Transfer:     return "transfer";
        case ErrorKind::Render:       return "render";
        case ErrorKind::Cleanup:      return "cleanup";
    }
    return "unknown";
}

} // namespace sftpflow
