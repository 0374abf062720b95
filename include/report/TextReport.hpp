#pragma once

#include "validate/ValidationResult.hpp"

#include <ostream>
#include <string>

namespace csvcheck {

struct ReportOptions {
    bool verbose = false;       // list individual errors
    size_t max_listed = 100;    // errors listed in verbose mode before "... and N more errors"
};

std::string render_text_report(const ValidationResult& res, const ReportOptions& opts = ReportOptions{});

void print_text_report(std::ostream& out, const ValidationResult& res, const ReportOptions& opts = ReportOptions{});

}  // namespace csvcheck
