// Download pipeline: grouping, per-record dispatch and single file transfer.
#include "sftpflow/Downloader.hpp"
#include "sftpflow/ConnectionGrouper.hpp"
#include "sftpflow/Log.hpp"
#include "sftpflow/PathTranslator.hpp"
#include "sftpflow/SftpUrl.hpp"
#include "sftpflow/TreeWalker.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace sftpflow {

bool pruneEmptyDirectory(SftpClient& session, const std::string& dir, Error& err) {
    bool isDir = false;
    std::string serr;
    if (!session.exists(dir, isDir, serr) || !isDir) return true;
    std::vector<FileInfo> entries;
    if (!session.list(dir, entries, serr)) {
        err.set(ErrorKind::Cleanup, "Failed to list directory " + dir + " (" + serr + ")");
        return false;
    }
    if (!entries.empty()) return true;
    LOGD("Attempting to delete directory %s", dir.c_str());
    if (!session.removeDir(dir, serr)) {
        err.set(ErrorKind::Cleanup, "Failed to delete directory " + dir + " (" + serr + ")");
        return false;
    }
    return true;
}

namespace {

void logCleanup(const Error& err) {
    LOGE("%s: %s", errorKindName(err.kind), err.message.c_str());
}

} // namespace

std::optional<ConnectionIdentity> Downloader::identityOf(const TransferRecord& record,
                                                         const ConnectionIdentity& defaults) {
    url::ParsedUrl parsed;
    std::string err;
    if (!url::parse(record.url, parsed, err) || parsed.scheme != "sftp") {
        LOGW("Scheme does not match SFTP: %s", record.url.c_str());
        return std::nullopt;
    }
    ConnectionIdentity id = parsed.identity;
    if (id.username.empty()) {
        id.username = defaults.username;
        if (!id.password) id.password = defaults.password;
    }
    id.private_key_path = record.private_key_path;
    id.private_key_passphrase = record.private_key_passphrase;
    return id;
}

bool Downloader::transferFile(SftpClient& session,
                              const std::string& remotePath,
                              const std::string& destination,
                              bool deleteOrigin,
                              Error& err) {
    std::error_code ec;
    if (fs::exists(destination, ec)) {
        LOGV("Destination file already exists. Skipping %s", remotePath.c_str());
        return true;
    }

    const std::string destDir = path::localDirname(destination);
    if (!destDir.empty() && !fs::exists(destDir, ec)) {
        fs::create_directories(destDir, ec);
        if (ec) {
            err.set(ErrorKind::Transfer, "Failed to create directory " + destDir + " (" + ec.message() + ")");
            return false;
        }
    }

    LOGV("Downloading file %s to %s", remotePath.c_str(), destination.c_str());
    std::string gerr;
    if (!session.get(remotePath, destination, gerr)) {
        LOGE("Failed to download %s (%s)", remotePath.c_str(), gerr.c_str());
        if (fs::exists(destination, ec)) {
            LOGD("Removing partially downloaded file %s", destination.c_str());
            fs::remove(destination, ec);
        }
        err.set(ErrorKind::Transfer, gerr);
        return false;
    }

    if (deleteOrigin) {
        LOGD("Deleting remote file %s", remotePath.c_str());
        std::string rerr;
        Error cleanup;
        if (!session.removeFile(remotePath, rerr)) {
            cleanup.set(ErrorKind::Cleanup, "Failed to delete file " + remotePath + " (" + rerr + ")");
            logCleanup(cleanup);
            return true;
        }
        if (!pruneEmptyDirectory(session, path::remoteDirname(remotePath), cleanup)) logCleanup(cleanup);
    }
    return true;
}

void Downloader::downloadRecord(SftpClient& session, TransferRecord& record, const DownloadOptions& options) {
    url::ParsedUrl parsed;
    std::string perr;
    if (!url::parse(record.url, parsed, perr)) {
        record.fail(ErrorKind::Connection, perr);
        return;
    }
    const std::string source = path::remoteNormalize(parsed.path);
    const bool recursive = record.recursive.value_or(options.recursive);
    const bool deleteOrigin = record.delete_origin.value_or(options.deleteOrigin);

    std::string to = options.destination;
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

    std::string serr;
    if (!session.lexists(source, serr)) {
        const std::string msg = serr.empty() ? ("Remote path does not exist: " + source)
                                             : ("Failed to stat " + source + " (" + serr + ")");
        LOGE("%s", msg.c_str());
        record.fail(serr.empty() ? ErrorKind::PathNotFound : ErrorKind::Traversal, msg);
        return;
    }

    FileInfo info{};
    if (!session.stat(source, info, serr)) info.kind = NodeKind::Unknown; // dangling link

    Error err;
    switch (info.kind) {
        case NodeKind::File: {
            const std::string dest = path::localJoin(to, path::remoteToLocal(path::remoteBasename(source)));
            if (!transferFile(session, source, dest, deleteOrigin, err)) {
                const std::string msg = "Failed to download file " + source + " (" + err.message + ")";
                LOGE("%s", msg.c_str());
                record.fail(err.kind, msg);
                return;
            }
            record.succeed();
            return;
        }
        case NodeKind::Directory: {
            const std::string base = path::remoteDirname(source);
            auto handleFile = [&](const RemoteNode& node, Error& e) {
                std::string rel;
                if (!path::remoteRelative(node.path, base, rel)) rel = path::remoteBasename(node.path);
                return transferFile(session, node.path, path::localJoin(to, path::remoteToLocal(rel)),
                                    deleteOrigin, e);
            };
            auto handleDir = [](const RemoteNode&, Error&) { return true; };
            auto handleUnknown = [](const RemoteNode& node, Error&) {
                LOGW("Skipping unknown file %s", node.path.c_str());
                return true;
            };
            TreeWalker walker(session);
            if (!walker.walk(source, handleFile, handleDir, handleUnknown, recursive, err)) {
                const std::string msg = "Failed to download directory " + source + " (" + err.message + ")";
                LOGE("%s", msg.c_str());
                record.fail(err.kind, msg);
                return;
            }
            Error cleanup;
            if (deleteOrigin && !pruneEmptyDirectory(session, source, cleanup)) logCleanup(cleanup);
            record.succeed();
            return;
        }
        case NodeKind::Unknown:
            LOGW("Skipping unknown file %s", source.c_str());
            record.skip("Unknown file type: " + source);
            return;
    }
}

bool Downloader::download(std::vector<TransferRecord>& records, const DownloadOptions& options) {
    std::size_t rejected = 0;
    auto groups = groupByIdentity(
        records,
        [&options](const TransferRecord& r) { return identityOf(r, options.defaultIdentity); },
        [&rejected](TransferRecord& r) {
            ++rejected;
            r.fail(ErrorKind::Connection, "Scheme does not match SFTP: " + r.url);
        });

    for (auto& group : groups) {
        Error err;
        std::unique_ptr<SftpClient> session = connections_.connect(group.identity, err);
        if (!session) {
            for (TransferRecord* r : group.items) r->fail(err.kind, err.message);
            continue;
        }
        for (TransferRecord* r : group.items) downloadRecord(*session, *r, options);
        session->disconnect();
    }

    if (!records.empty() && rejected == records.size()) {
        LOGE("No record references an SFTP source");
        return false;
    }
    return true;
}

} // namespace sftpflow
