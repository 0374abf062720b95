#include "schema/SchemaIO.hpp"

#include "schema/Predicates.hpp"
#include "util/TextUtil.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

// ordered_json keeps the column order of object-form schemas
using json = nlohmann::ordered_json;

namespace csvcheck {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<bool> optional_bool(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static std::optional<double> optional_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static std::optional<size_t> optional_count(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_number_unsigned()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a non-negative integer");
    }
    return j.at(key).get<size_t>();
}

static std::string format_bound(const std::optional<double>& v) {
    if (!v) return "";
    std::ostringstream oss;
    oss << *v;
    return oss.str();
}

static std::string format_count(const std::optional<size_t>& v) {
    return v ? std::to_string(*v) : std::string();
}

static void parse_validator(const json& j, const std::string& where, ColumnRule& rule) {
    require_object(j, where);
    const std::string kind = textutil::to_lower(require_string(j, "kind", where));

    try {
        if (kind == "regex") {
            const std::string pattern = require_string(j, "pattern", where);
            rule.validator = regex_predicate(pattern);
            rule.validator_name = "regex(" + pattern + ")";
        } else if (kind == "range") {
            const auto min = optional_number(j, "min", where);
            const auto max = optional_number(j, "max", where);
            if (!min && !max) throw std::runtime_error(where + " range needs min and/or max");
            rule.validator = range_predicate(min, max);
            rule.validator_name = "range(" + format_bound(min) + ".." + format_bound(max) + ")";
        } else if (kind == "one_of") {
            if (!j.contains("values") || !j.at("values").is_array()) {
                throw std::runtime_error(where + ".values must be an array");
            }
            std::vector<std::string> values;
            const json& arr = j.at("values");
            for (size_t i = 0; i < arr.size(); ++i) {
                if (!arr.at(i).is_string()) {
                    std::ostringstream oss;
                    oss << where << ".values[" << i << "] must be a string";
                    throw std::runtime_error(oss.str());
                }
                values.push_back(arr.at(i).get<std::string>());
            }
            const bool cs = optional_bool(j, "case_sensitive", where).value_or(true);

            std::string shown;
            for (size_t i = 0; i < values.size(); ++i) {
                if (i) shown += "|";
                shown += values[i];
            }
            rule.validator = one_of_predicate(std::move(values), cs);
            rule.validator_name = "one_of(" + shown + ")";
        } else if (kind == "length") {
            const auto min = optional_count(j, "min", where);
            const auto max = optional_count(j, "max", where);
            if (!min && !max) throw std::runtime_error(where + " length needs min and/or max");
            rule.validator = length_predicate(min, max);
            rule.validator_name = "length(" + format_count(min) + ".." + format_count(max) + ")";
        } else {
            throw std::runtime_error(where + ".kind unknown validator: " + kind);
        }
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(where + ": " + e.what());
    }
}

static ColumnRule parse_rule(const json& j, const std::string& where) {
    require_object(j, where);

    ColumnRule rule;
    if (j.contains("type")) {
        const std::string t = require_string(j, "type", where);
        try {
            rule.type = parse_column_type(t);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(where + ".type: " + e.what());
        }
    }
    rule.required = optional_bool(j, "required", where);
    rule.nullable = optional_bool(j, "nullable", where);

    if (rule.required && rule.nullable && *rule.required == *rule.nullable) {
        throw std::runtime_error(where + ": required and nullable contradict each other");
    }

    if (j.contains("validator") && !j.at("validator").is_null()) {
        parse_validator(j.at("validator"), where + ".validator", rule);
    }
    return rule;
}

char parse_delimiter(const std::string& s) {
    if (s == "\\t" || textutil::to_lower(s) == "tab") return '\t';
    if (s.size() != 1) {
        throw std::invalid_argument("delimiter must be a 1-character string");
    }
    return s[0];
}

SchemaFile parse_schema_text(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    require_object(j, "schema");

    SchemaFile sf;

    if (!j.contains("columns")) {
        throw std::runtime_error("schema missing required field: columns");
    }
    const json& cols = j.at("columns");

    if (cols.is_array()) {
        for (size_t i = 0; i < cols.size(); ++i) {
            std::ostringstream oss;
            oss << "schema.columns[" << i << "]";
            const std::string where = oss.str();
            require_object(cols.at(i), where);

            const std::string name = require_string(cols.at(i), "name", where);
            if (sf.schema.contains(name)) {
                throw std::runtime_error(where + ": duplicate column name: " + name);
            }
            sf.schema.add(name, parse_rule(cols.at(i), where));
        }
    } else if (cols.is_object()) {
        for (auto it = cols.begin(); it != cols.end(); ++it) {
            sf.schema.add(it.key(), parse_rule(it.value(), "schema.columns." + it.key()));
        }
    } else {
        throw std::runtime_error("schema.columns must be an array or an object");
    }

    if (sf.schema.empty()) {
        throw std::runtime_error("schema.columns must not be empty");
    }

    if (j.contains("encoding")) {
        sf.encoding = require_string(j, "encoding", "schema");
    }
    if (j.contains("delimiter")) {
        try {
            sf.delimiter = parse_delimiter(require_string(j, "delimiter", "schema"));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("schema.delimiter: ") + e.what());
        }
    }
    if (j.contains("max_errors") && !j.at("max_errors").is_null()) {
        const auto n = optional_count(j, "max_errors", "schema");
        if (!n || *n == 0) throw std::runtime_error("schema.max_errors must be a positive integer");
        sf.max_errors = n;
    }

    return sf;
}

SchemaFile load_schema_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open schema file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_schema_text(ss.str());
}

}  // namespace csvcheck
