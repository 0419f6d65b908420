// Upload pipeline.
#include "sftpflow/Uploader.hpp"
#include "sftpflow/Log.hpp"
#include "sftpflow/PathTranslator.hpp"
#include "sftpflow/SftpUrl.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace sftpflow {

void Uploader::uploadRecord(SftpClient& session, TransferRecord& record, const UploadOptions& options) {
    const std::string& location = record.location;
    const std::string filename = path::localBasename(location);

    std::string to = options.destinationTemplate;
    if (!to.empty()) {
        std::string rendered;
        std::string rerr;
        if (!renderer_.render(to, record, rendered, rerr)) {
            LOGE("Could not render path: %s", to.c_str());
            record.fail(ErrorKind::Render, rerr);
            return;
        }
        to = rendered;
    }
    if (to.empty()) to = ".";

    const std::string destination = path::remoteJoin(to, filename);

    std::error_code ec;
    if (!fs::exists(location, ec)) {
        LOGW("File no longer exists: %s", location.c_str());
        record.skip("File no longer exists: " + location);
        return;
    }

    std::string serr;
    if (!session.lexists(to, serr)) {
        if (!serr.empty()) {
            LOGE("Failed to stat remote directory %s (%s)", to.c_str(), serr.c_str());
            record.fail(ErrorKind::Transfer, "Failed to stat remote directory " + to + " (" + serr + ")");
            return;
        }
        std::string merr;
        if (!session.makeDirectories(to, merr)) {
            LOGE("Failed to create remote directory %s (%s)", to.c_str(), merr.c_str());
            record.fail(ErrorKind::Transfer, "Failed to create remote directory " + to + " (" + merr + ")");
            return;
        }
    }

    if (!session.isDirectory(to)) {
        LOGE("Not a directory: %s", to.c_str());
        record.fail(ErrorKind::Transfer, "Not a directory: " + to);
        return;
    }

    std::string perr;
    if (!session.put(location, destination, perr)) {
        if (session.lastErrorCode() == SftpErrorCode::NoSuchFile) {
            LOGE("Remote directory does not exist: %s (%s)", to.c_str(), perr.c_str());
            record.fail(ErrorKind::Transfer, "Remote directory does not exist: " + to + " (" + perr + ")");
        } else {
            LOGE("Failed to upload %s (%s)", location.c_str(), perr.c_str());
            record.fail(ErrorKind::Transfer, "Failed to upload " + location + " (" + perr + ")");
        }
        return;
    }
    LOGV("Successfully uploaded %s to %s", location.c_str(),
         url::locationFor(url::prefixFor(options.identity), destination).c_str());
    record.succeed();

    if (record.delete_origin.value_or(options.deleteOrigin)) {
        fs::remove(location, ec);
        if (ec) {
            Error cleanup;
            cleanup.set(ErrorKind::Cleanup, "Failed to delete file " + location + " (" + ec.message() + ")");
            LOGE("%s: %s", errorKindName(cleanup.kind), cleanup.message.c_str());
        }
    }
}

void Uploader::upload(std::vector<TransferRecord>& records, const UploadOptions& options) {
    Error err;
    std::unique_ptr<SftpClient> session = connections_.connect(options.identity, err);
    if (!session) {
        for (TransferRecord& r : records) {
            LOGD("SFTP connection failed; failing record: %s", r.location.c_str());
            r.fail(ErrorKind::Connection, "SFTP connection failed (" + err.message + ")");
        }
        return;
    }
    for (TransferRecord& r : records) {
        LOGD("Uploading file: %s", r.location.c_str());
        uploadRecord(*session, r, options);
    }
    session->disconnect();
}

} // namespace sftpflow
