#include "validate/TypeChecks.hpp"

#include "util/TextUtil.hpp"

#include <array>
#include <cctype>

namespace csvcheck {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_integer(const std::string& v) {
    size_t i = 0;
    if (i < v.size() && (v[i] == '+' || v[i] == '-')) ++i;
    if (i == v.size()) return false;
    for (; i < v.size(); ++i) {
        if (!is_digit(v[i])) return false;
    }
    return true;
}

bool is_float(const std::string& v) {
    size_t i = 0;
    const size_t n = v.size();
    if (i < n && (v[i] == '+' || v[i] == '-')) ++i;

    const std::string word = textutil::to_lower(v.substr(i));
    if (word == "inf" || word == "infinity" || word == "nan") return true;

    size_t int_digits = 0;
    while (i < n && is_digit(v[i])) { ++i; ++int_digits; }

    size_t frac_digits = 0;
    if (i < n && v[i] == '.') {
        ++i;
        while (i < n && is_digit(v[i])) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;

    if (i < n && (v[i] == 'e' || v[i] == 'E')) {
        ++i;
        if (i < n && (v[i] == '+' || v[i] == '-')) ++i;
        size_t exp_digits = 0;
        while (i < n && is_digit(v[i])) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == n;
}

bool is_boolean(const std::string& v) {
    static const std::array<const char*, 6> accepted = {"true", "false", "1", "0", "yes", "no"};
    const std::string lower = textutil::to_lower(v);
    for (const char* a : accepted) {
        if (lower == a) return true;
    }
    return false;
}

// ---------- dates ----------

struct DateFields {
    int year = 1900;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return days[m - 1];
}

// reads between min_w and max_w digits, greedy
static bool read_number(const std::string& v, size_t& i, size_t min_w, size_t max_w, int& out) {
    size_t w = 0;
    int n = 0;
    while (w < max_w && i + w < v.size() && is_digit(v[i + w])) {
        n = n * 10 + (v[i + w] - '0');
        ++w;
    }
    if (w < min_w) return false;
    i += w;
    out = n;
    return true;
}

// Directives: %Y four-digit year; %m %d %H %M %S one or two digits.
// A space in the format matches one or more whitespace characters.
static bool match_format(const std::string& v, const char* fmt, DateFields& f) {
    size_t i = 0;
    for (const char* p = fmt; *p; ++p) {
        if (*p == '%') {
            ++p;
            bool ok = false;
            switch (*p) {
                case 'Y': ok = read_number(v, i, 4, 4, f.year); break;
                case 'm': ok = read_number(v, i, 1, 2, f.month); break;
                case 'd': ok = read_number(v, i, 1, 2, f.day); break;
                case 'H': ok = read_number(v, i, 1, 2, f.hour); break;
                case 'M': ok = read_number(v, i, 1, 2, f.minute); break;
                case 'S': ok = read_number(v, i, 1, 2, f.second); break;
                default: return false;
            }
            if (!ok) return false;
        } else if (*p == ' ') {
            size_t start = i;
            while (i < v.size() && std::isspace(static_cast<unsigned char>(v[i]))) ++i;
            if (i == start) return false;
        } else {
            if (i >= v.size() || v[i] != *p) return false;
            ++i;
        }
    }
    return i == v.size();
}

static bool valid_fields(const DateFields& f) {
    if (f.year < 1) return false;
    if (f.month < 1 || f.month > 12) return false;
    if (f.day < 1 || f.day > days_in_month(f.year, f.month)) return false;
    if (f.hour > 23 || f.minute > 59 || f.second > 59) return false;
    return true;
}

bool is_date(const std::string& v) {
    static const std::array<const char*, 4> formats = {
        "%Y-%m-%d",
        "%Y-%m-%d %H:%M:%S",
        "%m/%d/%Y",
        "%d/%m/%Y",
    };
    for (const char* fmt : formats) {
        DateFields f;
        if (match_format(v, fmt, f) && valid_fields(f)) return true;
    }
    return false;
}

static bool is_any(const std::string&) {
    return true;
}

bool check_type(ColumnType type, const std::string& v) {
    using Check = bool (*)(const std::string&);
    // indexed by ColumnType
    static const std::array<Check, 5> table = {
        &is_any,       // String
        &is_integer,   // Integer
        &is_float,     // Float
        &is_boolean,   // Boolean
        &is_date,      // Date
    };
    return table[static_cast<size_t>(type)](v);
}

}  // namespace csvcheck
