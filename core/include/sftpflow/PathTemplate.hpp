// Destination templating. The engine only depends on PathRenderer; the
// field renderer below covers "{{ name }}" placeholders.
#pragma once
#include "TransferRecord.hpp"
#include <string>

namespace sftpflow {

class PathRenderer {
public:
    virtual ~PathRenderer() = default;
    virtual bool render(const std::string& tmpl,
                        const TransferRecord& record,
                        std::string& out,
                        std::string& err) const = 0;
};

// Replaces "{{ field }}" with a record value. Known fields: title, url,
// location, filename (basename of location), size, plus record.fields.
// An unknown field or an unterminated placeholder is a render error.
class FieldPathRenderer : public PathRenderer {
public:
    bool render(const std::string& tmpl,
                const TransferRecord& record,
                std::string& out,
                std::string& err) const override;
};

} // namespace sftpflow
