#pragma once
#include <string>

namespace textutil {

// strip leading/trailing ASCII whitespace
std::string trim(const std::string& s);

// ASCII lowercase, other bytes untouched
std::string to_lower(std::string s);

// number of code points in a UTF-8 string (continuation bytes are not counted)
size_t utf8_length(const std::string& s);

// "utf-8", "UTF_8", "Utf8" -> "utf8"
std::string normalize_codec_name(const std::string& name);

}
