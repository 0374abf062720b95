#include "schema/Predicates.hpp"

#include "util/TextUtil.hpp"
#include "validate/TypeChecks.hpp"

#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace csvcheck {

CellPredicate regex_predicate(const std::string& pattern) {
    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid regex '" + pattern + "': " + e.what());
    }
    return [re](const std::string& v) {
        if (v.size() > kRegexInputLimit) {
            throw std::length_error("value of " + std::to_string(v.size()) + " bytes exceeds regex limit of " +
                                    std::to_string(kRegexInputLimit) + " bytes");
        }
        return std::regex_match(v, re);
    };
}

CellPredicate range_predicate(std::optional<double> min, std::optional<double> max) {
    return [min, max](const std::string& v) {
        if (!is_float(v)) {
            throw std::invalid_argument("could not convert string to float: '" + v + "'");
        }
        const double d = std::strtod(v.c_str(), nullptr);
        if (min && d < *min) return false;
        if (max && d > *max) return false;
        return true;
    };
}

CellPredicate one_of_predicate(std::vector<std::string> values, bool case_sensitive) {
    if (!case_sensitive) {
        for (auto& s : values) s = textutil::to_lower(s);
    }
    return [values, case_sensitive](const std::string& v) {
        const std::string key = case_sensitive ? v : textutil::to_lower(v);
        for (const auto& s : values) {
            if (s == key) return true;
        }
        return false;
    };
}

CellPredicate length_predicate(std::optional<size_t> min, std::optional<size_t> max) {
    return [min, max](const std::string& v) {
        const size_t n = textutil::utf8_length(v);
        if (min && n < *min) return false;
        if (max && n > *max) return false;
        return true;
    };
}

}  // namespace csvcheck
