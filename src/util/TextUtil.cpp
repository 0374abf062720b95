#include "util/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string normalize_codec_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : to_lower(trim(name))) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out.push_back(c);
    }
    return out;
}

}
