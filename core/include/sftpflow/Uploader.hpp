// Pushes local files to a remote directory rendered per record.
#pragma once
#include "ConnectionManager.hpp"
#include "Errors.hpp"
#include "PathTemplate.hpp"
#include "TransferRecord.hpp"
#include <string>
#include <vector>

namespace sftpflow {

struct UploadOptions {
    ConnectionIdentity identity;
    std::string destinationTemplate;  // remote directory; empty means the login directory
    bool deleteOrigin = false;
};

class Uploader {
public:
    Uploader(ConnectionManager& connections, const PathRenderer& renderer)
        : connections_(connections), renderer_(renderer) {}

    // Uploads record.location into the rendered directory over one session.
    // A missing local file is skipped; a session that cannot be opened
    // fails every record.
    void upload(std::vector<TransferRecord>& records, const UploadOptions& options);

    void uploadRecord(SftpClient& session, TransferRecord& record, const UploadOptions& options);

private:
    ConnectionManager& connections_;
    const PathRenderer& renderer_;
};

} // namespace sftpflow
