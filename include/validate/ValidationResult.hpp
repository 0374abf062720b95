#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace csvcheck {

enum class ErrorKind {
    File,
    Structural,
    Type,
    Required,
    Custom
};

constexpr size_t kErrorKindCount = 5;

// "file", "structural", "type", "required", "custom"
std::string error_kind_name(ErrorKind k);

constexpr std::array<ErrorKind, kErrorKindCount> all_error_kinds() {
    return {ErrorKind::File, ErrorKind::Structural, ErrorKind::Type, ErrorKind::Required, ErrorKind::Custom};
}

struct ValidationError {
    size_t line = 0;                   // 0 file-level, 1 header, >= 2 data record
    std::string column;                // empty when not tied to a column
    ErrorKind kind = ErrorKind::File;
    std::string message;
    std::optional<std::string> value;  // raw cell text for type/custom errors

    bool operator==(const ValidationError& o) const {
        return line == o.line && column == o.column && kind == o.kind &&
               message == o.message && value == o.value;
    }
};

struct ValidationResult {
    bool valid = true;
    std::string file_path;
    size_t total_rows = 0;
    size_t rows_validated = 0;
    size_t error_count = 0;
    std::array<size_t, kErrorKindCount> summary{};   // indexed by ErrorKind
    std::vector<ValidationError> errors;

    size_t count(ErrorKind k) const { return summary[static_cast<size_t>(k)]; }

    bool operator==(const ValidationResult& o) const {
        return valid == o.valid && file_path == o.file_path && total_rows == o.total_rows &&
               rows_validated == o.rows_validated && error_count == o.error_count &&
               summary == o.summary && errors == o.errors;
    }
};

// The only way errors enter a result; keeps valid, error_count and summary in step.
void add_error(ValidationResult& res, size_t line, const std::string& column, ErrorKind kind,
               const std::string& message, std::optional<std::string> value = std::nullopt);

}  // namespace csvcheck
