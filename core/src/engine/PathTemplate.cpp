// "{{ field }}" renderer and record status names.
#include "sftpflow/PathTemplate.hpp"
#include "sftpflow/PathTranslator.hpp"

namespace sftpflow {

const char* recordStatusName(RecordStatus status) {
    switch (status) {
        case RecordStatus::Pending: return "PENDING";
        case RecordStatus::Done:    return "OK";
        case RecordStatus::Skipped: return "SKIPPED";
        case RecordStatus::Failed:  return "FAILED";
    }
    return "?";
}

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool lookupField(const TransferRecord& r, const std::string& name, std::string& value) {
    const auto it = r.fields.find(name);
    if (it != r.fields.end()) {
        value = it->second;
        return true;
    }
    if (name == "title") { value = r.title; return true; }
    if (name == "url") { value = r.url; return true; }
    if (name == "location") { value = r.location; return true; }
    if (name == "filename") { value = path::localBasename(r.location); return true; }
    if (name == "size") { value = std::to_string(r.size); return true; }
    return false;
}

} // namespace

bool FieldPathRenderer::render(const std::string& tmpl,
                               const TransferRecord& record,
                               std::string& out,
                               std::string& err) const {
    out.clear();
    std::string::size_type pos = 0;
    while (pos < tmpl.size()) {
        const auto open = tmpl.find("{{", pos);
        if (open == std::string::npos) {
            out += tmpl.substr(pos);
            break;
        }
        out += tmpl.substr(pos, open - pos);
        const auto close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            err = "Unterminated placeholder in template: " + tmpl;
            return false;
        }
        const std::string name = trim(tmpl.substr(open + 2, close - open - 2));
        std::string value;
        if (name.empty() || !lookupField(record, name, value)) {
            err = "Undefined field '" + name + "' in template: " + tmpl;
            return false;
        }
        out += value;
        pos = close + 2;
    }
    return true;
}

} // namespace sftpflow
