#include "validate/ValidationResult.hpp"

namespace csvcheck {

std::string error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::File:       return "file";
        case ErrorKind::Structural: return "structural";
        case ErrorKind::Type:       return "type";
        case ErrorKind::Required:   return "required";
        case ErrorKind::Custom:     return "custom";
    }
    return "unknown";
}

void add_error(ValidationResult& res, size_t line, const std::string& column, ErrorKind kind,
               const std::string& message, std::optional<std::string> value) {
    ValidationError e;
    e.line = line;
    e.column = column;
    e.kind = kind;
    e.message = message;
    e.value = std::move(value);
    res.errors.push_back(std::move(e));

    res.error_count += 1;
    res.summary[static_cast<size_t>(kind)] += 1;
    res.valid = false;
}

}  // namespace csvcheck
