#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csvcheck {

enum class ColumnType {
    String,
    Integer,
    Float,
    Boolean,
    Date
};

// "string", "integer", ... ; used in messages and schema files
std::string column_type_name(ColumnType t);

// accepts the names above plus "str", "int", "bool", "datetime"; throws std::invalid_argument
ColumnType parse_column_type(const std::string& name);

// Custom check on a trimmed, non-empty cell value. May throw; a thrown exception is reported
// as a failed check, never propagated out of validation.
using CellPredicate = std::function<bool(const std::string&)>;

struct ColumnRule {
    ColumnType type = ColumnType::String;
    std::optional<bool> required;
    std::optional<bool> nullable;
    CellPredicate validator;
    std::string validator_name;   // for display only, e.g. "range(0..150)"

    // required if given, else !nullable if given, else true
    bool is_required() const;
};

// Ordered column name -> rule mapping. Insertion order drives error order.
class Schema {
public:
    using Entry = std::pair<std::string, ColumnRule>;

    Schema() = default;
    Schema(std::initializer_list<Entry> entries);

    // inserts at the end, or replaces the rule in place when the name already exists
    Schema& add(const std::string& name, ColumnRule rule);

    const ColumnRule* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    const std::vector<Entry>& columns() const { return m_columns; }
    size_t size() const { return m_columns.size(); }
    bool empty() const { return m_columns.empty(); }

private:
    std::vector<Entry> m_columns;
};

// Convenience builders for code-defined schemas.
ColumnRule required_column(ColumnType type, CellPredicate validator = {});
ColumnRule nullable_column(ColumnType type, CellPredicate validator = {});

}  // namespace csvcheck
