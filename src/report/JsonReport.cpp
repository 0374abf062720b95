#include "report/JsonReport.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace csvcheck {

nlohmann::json result_to_json(const ValidationResult& res) {
    nlohmann::json j;
    j["valid"] = res.valid;
    j["file_path"] = res.file_path;
    j["total_rows"] = res.total_rows;
    j["rows_validated"] = res.rows_validated;
    j["error_count"] = res.error_count;

    nlohmann::json summary = nlohmann::json::object();
    for (ErrorKind k : all_error_kinds()) {
        summary[error_kind_name(k) + "_errors"] = res.count(k);
    }
    j["summary"] = summary;

    j["errors"] = nlohmann::json::array();
    for (const auto& e : res.errors) {
        nlohmann::json ej;
        ej["line"] = e.line;
        ej["column"] = e.column;
        ej["error_type"] = error_kind_name(e.kind);
        ej["message"] = e.message;
        ej["value"] = e.value ? nlohmann::json(*e.value) : nlohmann::json(nullptr);
        j["errors"].push_back(ej);
    }
    return j;
}

void write_json_report(const fs::path& path, const ValidationResult& res) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << result_to_json(res).dump(2) << "\n";
}

}  // namespace csvcheck
