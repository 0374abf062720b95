#pragma once

#include "schema/Schema.hpp"

#include <string>

namespace csvcheck {

// Syntax checks on trimmed, non-empty cell text.

// optional sign followed by one or more ASCII digits
bool is_integer(const std::string& v);

// decimal fixed or exponential notation with optional sign; also inf, infinity, nan
bool is_float(const std::string& v);

// case-insensitive true/false/1/0/yes/no
bool is_boolean(const std::string& v);

// Tries, in order: YYYY-MM-DD, YYYY-MM-DD HH:MM:SS, MM/DD/YYYY, DD/MM/YYYY.
// First format that parses to a real calendar date wins.
bool is_date(const std::string& v);

// Dispatches to the check for `type`; String accepts anything.
bool check_type(ColumnType type, const std::string& v);

}  // namespace csvcheck
