#pragma once

#include "schema/Schema.hpp"
#include "validate/ValidationResult.hpp"

#include <optional>
#include <string>

namespace csvcheck {

struct ValidationOptions {
    std::string encoding = "utf-8";
    char delimiter = ',';
    std::optional<size_t> max_errors;   // stop collecting once this many errors exist
};

// Validates a delimited text file against `schema`.
//
// Stages run in order and stop at the first file-level or structural failure:
// access (exists, regular file, non-empty), encoding probe of the first line,
// header reconciliation, then per-record checks (required, type, custom predicate).
// Never throws for problems with the file or its content; every failure is an entry
// in the returned result.
ValidationResult validate_csv(const std::string& file_path, const Schema& schema,
                              const ValidationOptions& opts = ValidationOptions{});

}  // namespace csvcheck
