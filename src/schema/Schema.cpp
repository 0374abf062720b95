#include "schema/Schema.hpp"

#include "util/TextUtil.hpp"

#include <stdexcept>

namespace csvcheck {

std::string column_type_name(ColumnType t) {
    switch (t) {
        case ColumnType::String:  return "string";
        case ColumnType::Integer: return "integer";
        case ColumnType::Float:   return "float";
        case ColumnType::Boolean: return "boolean";
        case ColumnType::Date:    return "date";
    }
    return "unknown";
}

ColumnType parse_column_type(const std::string& name) {
    const std::string n = textutil::to_lower(textutil::trim(name));
    if (n == "string" || n == "str") return ColumnType::String;
    if (n == "integer" || n == "int") return ColumnType::Integer;
    if (n == "float" || n == "double" || n == "number") return ColumnType::Float;
    if (n == "boolean" || n == "bool") return ColumnType::Boolean;
    if (n == "date" || n == "datetime") return ColumnType::Date;
    throw std::invalid_argument("unknown column type: " + name);
}

bool ColumnRule::is_required() const {
    if (required) return *required;
    if (nullable) return !*nullable;
    return true;
}

Schema::Schema(std::initializer_list<Entry> entries) {
    for (const auto& e : entries) add(e.first, e.second);
}

Schema& Schema::add(const std::string& name, ColumnRule rule) {
    for (auto& e : m_columns) {
        if (e.first == name) {
            e.second = std::move(rule);
            return *this;
        }
    }
    m_columns.emplace_back(name, std::move(rule));
    return *this;
}

const ColumnRule* Schema::find(const std::string& name) const {
    for (const auto& e : m_columns) {
        if (e.first == name) return &e.second;
    }
    return nullptr;
}

ColumnRule required_column(ColumnType type, CellPredicate validator) {
    ColumnRule r;
    r.type = type;
    r.required = true;
    r.validator = std::move(validator);
    return r;
}

ColumnRule nullable_column(ColumnType type, CellPredicate validator) {
    ColumnRule r;
    r.type = type;
    r.nullable = true;
    r.validator = std::move(validator);
    return r;
}

}  // namespace csvcheck
