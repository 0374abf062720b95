#pragma once

#include "validate/ValidationResult.hpp"
#include "validate/Validator.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace csvcheck {

// One JSON Lines record describing a finished validation run.
nlohmann::json run_log_record(const ValidationResult& res, const ValidationOptions& opts);

// Appends run_log_record() as one line. Returns false (and writes nothing) when the log
// cannot be opened; the caller decides how loudly to report that.
bool append_run_log(const std::filesystem::path& path, const ValidationResult& res, const ValidationOptions& opts);

}  // namespace csvcheck
