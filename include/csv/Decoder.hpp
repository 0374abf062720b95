#pragma once

#include <stdexcept>
#include <string>

namespace csvcheck {

enum class Encoding {
    Utf8,
    Utf8Sig,   // utf-8 with an optional leading byte order mark
    Ascii,
    Latin1     // iso-8859-1, transcoded to utf-8
};

// accepts "utf-8", "utf8", "utf-8-sig", "ascii", "us-ascii", "latin-1", "latin1", "iso-8859-1"
// (case-insensitive, '-'/'_' interchangeable); throws std::invalid_argument("unknown encoding: <name>")
Encoding parse_encoding(const std::string& name);

std::string encoding_name(Encoding enc);

class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& what, size_t position)
        : std::runtime_error(what), position_(position) {}

    size_t position() const { return position_; }

private:
    size_t position_;
};

// Decodes raw physical lines into utf-8, one line at a time.
class LineDecoder {
public:
    explicit LineDecoder(Encoding enc) : enc_(enc) {}

    // throws DecodeError on bytes that are not valid in the encoding
    std::string decode(const std::string& raw);

private:
    Encoding enc_;
    bool first_line_ = true;
};

}  // namespace csvcheck
