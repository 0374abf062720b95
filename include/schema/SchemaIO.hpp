#pragma once

#include "schema/Schema.hpp"

#include <optional>
#include <string>

namespace csvcheck {

// Schema plus the optional run settings a schema file may carry.
struct SchemaFile {
    Schema schema;
    std::optional<std::string> encoding;
    std::optional<char> delimiter;
    std::optional<size_t> max_errors;
};

// Loads a JSON schema file. Throws std::runtime_error naming the offending location,
// e.g. "schema.columns[2].type must be a string".
SchemaFile load_schema_file(const std::string& path);

// Same as load_schema_file, from JSON text.
SchemaFile parse_schema_text(const std::string& text);

// "," -> ','; "\t" / "tab" -> '\t'. Throws std::invalid_argument for anything longer than one character.
char parse_delimiter(const std::string& s);

}  // namespace csvcheck
