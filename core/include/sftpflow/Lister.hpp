// Produces one TransferRecord per remote node found under a set of roots.
#pragma once
#include "ConnectionManager.hpp"
#include "Errors.hpp"
#include "TransferRecord.hpp"
#include <string>
#include <vector>

namespace sftpflow {

struct ListOptions {
    bool recursive = false;
    // Fill TransferRecord::size. For directories this walks the whole
    // subtree and stats every file, which can be very slow on large trees.
    bool computeSize = true;
    bool filesOnly = true;
};

class Lister {
public:
    explicit Lister(ConnectionManager& connections) : connections_(connections) {}

    // One session serves every root. A root that cannot be walked is logged
    // and skipped. Returns false only when no session could be opened.
    bool list(const ConnectionIdentity& id,
              const std::vector<std::string>& roots,
              const ListOptions& options,
              std::vector<TransferRecord>& out,
              Error& err);

    // Size of a file, or the sum of all file sizes below a directory.
    static bool nodeSize(SftpClient& session, const RemoteNode& node,
                         std::int64_t& size, Error& err);

private:
    ConnectionManager& connections_;
};

} // namespace sftpflow
