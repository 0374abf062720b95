#pragma once

#include "validate/ValidationResult.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace csvcheck {

// { valid, file_path, total_rows, rows_validated, error_count,
//   summary: { file_errors, structural_errors, type_errors, required_errors, custom_errors },
//   errors: [ { line, column, error_type, message, value|null } ] }
nlohmann::json result_to_json(const ValidationResult& res);

// throws std::runtime_error when the file cannot be written
void write_json_report(const std::filesystem::path& path, const ValidationResult& res);

}  // namespace csvcheck
