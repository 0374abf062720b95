#include "commands/validate.hpp"

#include "report/JsonReport.hpp"
#include "report/RunLog.hpp"
#include "report/TextReport.hpp"
#include "schema/SchemaIO.hpp"
#include "validate/Validator.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  csvcheck validate --file <csv> --schema <json> [options]\n"
        << "\n"
        << "options:\n"
        << "  --encoding <name>            default: schema value, else utf-8\n"
        << "  --delimiter <c>              default: schema value, else ','  (\\t or tab for TAB)\n"
        << "  --max_errors <n>             default: schema value, else unlimited\n"
        << "  --verbose                    list individual errors\n"
        << "  --json <path>                also write the result as JSON\n"
        << "  --log <path>                 append one JSON line per run\n";
    return 2;
}

int cmd_validate(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        validate_usage();
        return 0;
    }

    const std::string file_path   = get_arg(argc, argv, "--file", "");
    const std::string schema_path = get_arg(argc, argv, "--schema", "");
    const std::string json_path   = get_arg(argc, argv, "--json", "");
    const std::string log_path    = get_arg(argc, argv, "--log", "");
    const bool verbose = has_flag(argc, argv, "--verbose");

    if (file_path.empty()) {
        std::cerr << "error: missing --file\n";
        return validate_usage();
    }
    if (schema_path.empty()) {
        std::cerr << "error: missing --schema\n";
        return validate_usage();
    }

    csvcheck::SchemaFile sf;
    try {
        sf = csvcheck::load_schema_file(schema_path);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to load schema: " << e.what() << "\n";
        return 2;
    }

    csvcheck::ValidationOptions opts;
    if (sf.encoding) opts.encoding = *sf.encoding;
    if (sf.delimiter) opts.delimiter = *sf.delimiter;
    if (sf.max_errors) opts.max_errors = sf.max_errors;

    opts.encoding = get_arg(argc, argv, "--encoding", opts.encoding);

    const std::string delim_s = get_arg(argc, argv, "--delimiter", "");
    if (!delim_s.empty()) {
        try {
            opts.delimiter = csvcheck::parse_delimiter(delim_s);
        } catch (const std::exception& e) {
            std::cerr << "error: invalid --delimiter: " << e.what() << "\n";
            return 2;
        }
    }

    const std::string max_s = get_arg(argc, argv, "--max_errors", "");
    if (!max_s.empty()) {
        long long n = 0;
        size_t used = 0;
        try { n = std::stoll(max_s, &used); }
        catch (const std::exception&) { used = 0; }
        if (used != max_s.size() || n <= 0) {
            std::cerr << "error: invalid --max_errors (expected a positive integer)\n";
            return 2;
        }
        opts.max_errors = static_cast<size_t>(n);
    }

    const csvcheck::ValidationResult res = csvcheck::validate_csv(file_path, sf.schema, opts);

    csvcheck::ReportOptions ropts;
    ropts.verbose = verbose;
    csvcheck::print_text_report(std::cout, res, ropts);

    if (!json_path.empty()) {
        try {
            csvcheck::write_json_report(json_path, res);
            std::cout << "OUT_JSON: " << json_path << "\n";
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 2;
        }
    }

    if (!log_path.empty()) {
        if (!csvcheck::append_run_log(log_path, res, opts)) {
            std::cerr << "warning: failed to open log file: " << log_path << "\n";
        }
    }

    return res.valid ? 0 : 1;
}
