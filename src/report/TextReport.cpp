#include "report/TextReport.hpp"

#include <algorithm>
#include <cctype>

namespace csvcheck {

static const std::string kRule(70, '=');
static const std::string kThinRule(70, '-');

// "structural" -> "Structural Errors"
static std::string summary_label(ErrorKind k) {
    std::string name = error_kind_name(k);
    if (!name.empty()) name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name + " Errors";
}

std::string render_text_report(const ValidationResult& res, const ReportOptions& opts) {
    std::string out;

    out += "\n" + kRule + "\n";
    out += "CSV VALIDATION REPORT\n";
    out += kRule + "\n";
    out += "File: " + res.file_path + "\n";
    out += std::string("Status: ") + (res.valid ? "VALID" : "INVALID") + "\n";
    out += "Total Rows: " + std::to_string(res.total_rows) + "\n";
    out += "Rows Validated: " + std::to_string(res.rows_validated) + "\n";
    out += "Total Errors: " + std::to_string(res.error_count) + "\n";

    if (res.error_count > 0) {
        out += "\n" + kThinRule + "\n";
        out += "ERROR SUMMARY\n";
        out += kThinRule + "\n";
        for (ErrorKind k : all_error_kinds()) {
            if (res.count(k) == 0) continue;
            out += summary_label(k) + ": " + std::to_string(res.count(k)) + "\n";
        }

        if (opts.verbose && !res.errors.empty()) {
            out += "\n" + kThinRule + "\n";
            out += "DETAILED ERRORS\n";
            out += kThinRule + "\n";

            const size_t shown = std::min(opts.max_listed, res.errors.size());
            for (size_t i = 0; i < shown; ++i) {
                const ValidationError& e = res.errors[i];
                out += "\n" + std::to_string(i + 1) + ". Line " + std::to_string(e.line) + ", Column '" + e.column + "'\n";
                out += "   Type: " + error_kind_name(e.kind) + "\n";
                out += "   Message: " + e.message + "\n";
                if (e.value) out += "   Value: " + *e.value + "\n";
            }

            if (res.errors.size() > shown) {
                out += "\n... and " + std::to_string(res.errors.size() - shown) + " more errors\n";
            }
        }
    }

    out += "\n" + kRule + "\n\n";
    return out;
}

void print_text_report(std::ostream& out, const ValidationResult& res, const ReportOptions& opts) {
    out << render_text_report(res, opts);
}

}  // namespace csvcheck
