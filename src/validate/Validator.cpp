#include "validate/Validator.hpp"

#include "csv/CsvReader.hpp"
#include "csv/Decoder.hpp"
#include "util/TextUtil.hpp"
#include "validate/TypeChecks.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace csvcheck {

static bool under_cap(const ValidationResult& res, const ValidationOptions& opts) {
    return !opts.max_errors || res.error_count < *opts.max_errors;
}

static std::string encoding_error_message(const std::string& encoding, const std::string& detail) {
    return "Encoding error: Unable to read file with " + encoding + " encoding. " + detail;
}

// ---------- stage 1: access ----------

static bool check_access(const std::string& path, ValidationResult& res) {
    try {
        const fs::path p(path);
        if (!fs::exists(p)) {
            add_error(res, 0, "", ErrorKind::File, "File not found: " + path);
            return false;
        }
        if (!fs::is_regular_file(p)) {
            add_error(res, 0, "", ErrorKind::File, "Path is not a file: " + path);
            return false;
        }
        if (fs::file_size(p) == 0) {
            add_error(res, 0, "", ErrorKind::File, "File is empty");
            return false;
        }
    } catch (const fs::filesystem_error& e) {
        add_error(res, 0, "", ErrorKind::File, std::string("File access error: ") + e.what());
        return false;
    }
    return true;
}

// ---------- stage 2: encoding probe ----------

static std::optional<Encoding> probe_encoding(const std::string& path, const std::string& encoding,
                                              ValidationResult& res) {
    Encoding enc;
    try {
        enc = parse_encoding(encoding);
    } catch (const std::invalid_argument& e) {
        add_error(res, 0, "", ErrorKind::File, std::string("Error opening file: ") + e.what());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        add_error(res, 0, "", ErrorKind::File, "Error opening file: cannot open " + path);
        return std::nullopt;
    }

    std::string raw;
    std::string eol;
    // the file is known to be non-empty, so reading nothing means the read failed
    if (!read_raw_line(in, raw, eol) || in.bad()) {
        add_error(res, 0, "", ErrorKind::File, "Error opening file: read failed on " + path);
        return std::nullopt;
    }

    try {
        LineDecoder decoder(enc);
        decoder.decode(raw);
    } catch (const DecodeError& e) {
        add_error(res, 0, "", ErrorKind::File, encoding_error_message(encoding, e.what()));
        return std::nullopt;
    }
    return enc;
}

// ---------- stage 3: header ----------

using HeaderIndex = std::unordered_map<std::string, size_t>;

static bool check_header(CsvReader& reader, const Schema& schema, HeaderIndex& index, ValidationResult& res) {
    std::vector<std::string> header;
    if (!reader.next(header)) {
        add_error(res, 1, "", ErrorKind::Structural, "No headers found in CSV file");
        return false;
    }

    // a repeated header name maps to its last occurrence
    for (size_t i = 0; i < header.size(); ++i) index[header[i]] = i;

    bool ok = true;
    for (const auto& [name, rule] : schema.columns()) {
        (void)rule;
        if (index.find(name) == index.end()) {
            add_error(res, 1, name, ErrorKind::Structural,
                      "Required column '" + name + "' not found in CSV headers");
            ok = false;
        }
    }
    return ok;
}

// ---------- stage 4: rows ----------

// Runs the custom predicate; returns false when an error was recorded.
static bool run_predicate(const std::string& column, const ColumnRule& rule, const std::string& value,
                          size_t line, ValidationResult& res) {
    try {
        if (rule.validator(value)) return true;
        add_error(res, line, column, ErrorKind::Custom,
                  "Custom validation failed for '" + column + "' with value '" + value + "'", value);
    } catch (const std::exception& e) {
        add_error(res, line, column, ErrorKind::Custom,
                  "Custom validator error for '" + column + "': " + e.what(), value);
    } catch (...) {
        add_error(res, line, column, ErrorKind::Custom,
                  "Custom validator error for '" + column + "': unknown exception", value);
    }
    return false;
}

static void validate_rows(CsvReader& reader, const Schema& schema, const HeaderIndex& index,
                          const ValidationOptions& opts, ValidationResult& res) {
    std::vector<std::string> fields;

    while (under_cap(res, opts) && reader.next(fields)) {
        const size_t line = reader.record_number();
        res.total_rows += 1;
        bool row_valid = true;

        for (const auto& [column, rule] : schema.columns()) {
            const auto it = index.find(column);
            const std::string value =
                (it != index.end() && it->second < fields.size()) ? textutil::trim(fields[it->second]) : std::string();
            const bool is_empty = value.empty();

            if (is_empty) {
                if (!rule.is_required()) continue;
                add_error(res, line, column, ErrorKind::Required,
                          "Required field '" + column + "' is empty or missing");
                row_valid = false;
                if (!under_cap(res, opts)) break;
                continue;
            }

            if (!check_type(rule.type, value)) {
                add_error(res, line, column, ErrorKind::Type,
                          "Invalid type for '" + column + "'. Expected " + column_type_name(rule.type) +
                              ", got '" + value + "'",
                          value);
                row_valid = false;
                if (!under_cap(res, opts)) break;
                continue;
            }

            if (rule.validator) {
                if (!run_predicate(column, rule, value, line, res)) {
                    row_valid = false;
                    if (!under_cap(res, opts)) break;
                }
            }
        }

        if (row_valid) res.rows_validated += 1;
    }
}

ValidationResult validate_csv(const std::string& file_path, const Schema& schema, const ValidationOptions& opts) {
    ValidationResult res;
    res.file_path = file_path;

    if (!check_access(file_path, res)) return res;

    const std::optional<Encoding> enc = probe_encoding(file_path, opts.encoding, res);
    if (!enc) return res;

    try {
        std::ifstream in(file_path, std::ios::in | std::ios::binary);
        if (!in) {
            add_error(res, 0, "", ErrorKind::File, "Error opening file: cannot open " + file_path);
            return res;
        }

        CsvReader reader(in, opts.delimiter, *enc);

        HeaderIndex index;
        if (!check_header(reader, schema, index, res)) return res;

        validate_rows(reader, schema, index, opts, res);
    } catch (const CsvSyntaxError& e) {
        add_error(res, 0, "", ErrorKind::Structural, std::string("CSV parsing error: ") + e.what());
    } catch (const DecodeError& e) {
        add_error(res, 0, "", ErrorKind::File, encoding_error_message(opts.encoding, e.what()));
    } catch (const std::exception& e) {
        add_error(res, 0, "", ErrorKind::File, std::string("Unexpected error during validation: ") + e.what());
    }

    return res;
}

}  // namespace csvcheck
