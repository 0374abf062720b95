#pragma once

#include "schema/Schema.hpp"

#include <optional>
#include <string>
#include <vector>

namespace csvcheck {

// Built-in cell predicates selectable from schema files.

// longest cell the regex predicate will match against; std::regex recurses per character
constexpr size_t kRegexInputLimit = 8192;

// full match against an ECMAScript regex; throws std::invalid_argument on a bad pattern.
// The returned predicate throws std::length_error for cells longer than kRegexInputLimit bytes.
CellPredicate regex_predicate(const std::string& pattern);

// numeric value within [min, max]; the returned predicate throws std::invalid_argument
// when the cell is not a number
CellPredicate range_predicate(std::optional<double> min, std::optional<double> max);

CellPredicate one_of_predicate(std::vector<std::string> values, bool case_sensitive = true);

// length in code points within [min, max]
CellPredicate length_predicate(std::optional<size_t> min, std::optional<size_t> max);

}  // namespace csvcheck
