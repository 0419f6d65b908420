// Fetches remote files and directories referenced by sftp:// records.
#pragma once
#include "ConnectionManager.hpp"
#include "Errors.hpp"
#include "PathTemplate.hpp"
#include "TransferRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sftpflow {

struct DownloadOptions {
    std::string destination;   // local root; may contain "{{ field }}" placeholders
    bool recursive = true;
    bool deleteOrigin = false;
    // Login used when a URL names no user; its password applies only then,
    // and only when the URL carries none.
    ConnectionIdentity defaultIdentity;
};

class Downloader {
public:
    Downloader(ConnectionManager& connections, const PathRenderer& renderer)
        : connections_(connections), renderer_(renderer) {}

    // Records are grouped by the identity in their URL; each run of equal
    // identities shares one session. Every record ends Done, Skipped or
    // Failed. Returns false when the batch is non-empty and no record
    // yields an identity.
    bool download(std::vector<TransferRecord>& records, const DownloadOptions& options);

    // Copy one remote file to `destination`. An existing destination is left
    // untouched and counts as success. A failed copy never leaves a partial
    // file behind. With deleteOrigin the remote file is removed afterwards
    // and its parent directory pruned if it became empty; problems there are
    // only logged.
    static bool transferFile(SftpClient& session,
                             const std::string& remotePath,
                             const std::string& destination,
                             bool deleteOrigin,
                             Error& err);

    // The identity a record's URL refers to, or nullopt for non-sftp sources.
    // A URL without a user takes the user and password of `defaults`.
    static std::optional<ConnectionIdentity> identityOf(const TransferRecord& record,
                                                        const ConnectionIdentity& defaults = {});

private:
    void downloadRecord(SftpClient& session, TransferRecord& record, const DownloadOptions& options);

    ConnectionManager& connections_;
    const PathRenderer& renderer_;
};

// Remove `dir` if it exists and has no entries. A missing or non-empty
// directory is not an error; a failed listing or removal is a Cleanup error.
bool pruneEmptyDirectory(SftpClient& session, const std::string& dir, Error& err);

} // namespace sftpflow
