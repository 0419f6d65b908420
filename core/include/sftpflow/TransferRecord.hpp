// Unit of work consumed by the pipelines. Lister produces records, Downloader
// and Uploader consume them; each consumed record ends with one outcome.
#pragma once
#include "Errors.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sftpflow {

enum class RecordStatus { Pending, Done, Skipped, Failed };

const char* recordStatusName(RecordStatus status);

struct TransferRecord {
    std::string title;
    std::string url;          // sftp:// source reference (list output, download input)
    std::string location;     // local file (upload input)
    std::int64_t size = -1;   // -1 when unknown

    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // Per-record overrides of the pipeline options
    std::optional<bool> recursive;
    std::optional<bool> delete_origin;

    // Free-form fields available to destination templates
    std::map<std::string, std::string> fields;

    RecordStatus status = RecordStatus::Pending;
    std::string reason;       // failure or skip explanation
    ErrorKind errorKind = ErrorKind::None;

    // The first failure wins; later calls are ignored.
    void fail(ErrorKind kind, const std::string& why) {
        if (status == RecordStatus::Failed) return;
        status = RecordStatus::Failed;
        errorKind = kind;
        reason = why;
    }
    void succeed(const std::string& note = std::string()) {
        if (status == RecordStatus::Failed) return;
        status = RecordStatus::Done;
        reason = note;
    }
    void skip(const std::string& why) {
        if (status == RecordStatus::Failed) return;
        status = RecordStatus::Skipped;
        reason = why;
    }
    bool failed() const { return status == RecordStatus::Failed; }
};

} // namespace sftpflow
