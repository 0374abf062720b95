#include "csv/Decoder.hpp"

#include "util/TextUtil.hpp"

#include <cstdio>

namespace csvcheck {

static std::string byte_hex(unsigned char b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", b);
    return buf;
}

static DecodeError make_error(Encoding enc, unsigned char b, size_t pos, const std::string& reason) {
    return DecodeError("'" + encoding_name(enc) + "' codec can't decode byte " + byte_hex(b) +
                           " in position " + std::to_string(pos) + ": " + reason,
                       pos);
}

Encoding parse_encoding(const std::string& name) {
    const std::string n = textutil::normalize_codec_name(name);
    if (n == "utf8") return Encoding::Utf8;
    if (n == "utf8sig") return Encoding::Utf8Sig;
    if (n == "ascii" || n == "usascii") return Encoding::Ascii;
    if (n == "latin1" || n == "iso88591" || n == "l1") return Encoding::Latin1;
    throw std::invalid_argument("unknown encoding: " + name);
}

std::string encoding_name(Encoding enc) {
    switch (enc) {
        case Encoding::Utf8:    return "utf-8";
        case Encoding::Utf8Sig: return "utf-8-sig";
        case Encoding::Ascii:   return "ascii";
        case Encoding::Latin1:  return "latin-1";
    }
    return "unknown";
}

// Rejects overlong forms, surrogates and code points above U+10FFFF.
static void check_utf8(Encoding enc, const std::string& s) {
    const size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // allowed range of the second byte
        if (c >= 0xC2 && c <= 0xDF) { len = 2; }
        else if (c == 0xE0)         { len = 3; lo = 0xA0; }
        else if (c == 0xED)         { len = 3; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)         { len = 4; lo = 0x90; }
        else if (c == 0xF4)         { len = 4; hi = 0x8F; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else throw make_error(enc, c, i, "invalid start byte");

        for (size_t k = 1; k < len; ++k) {
            if (i + k >= n) throw make_error(enc, c, i, "unexpected end of data");
            const unsigned char cc = static_cast<unsigned char>(s[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) throw make_error(enc, c, i, "invalid continuation byte");
        }
        i += len;
    }
}

std::string LineDecoder::decode(const std::string& raw) {
    const bool first = first_line_;
    first_line_ = false;

    switch (enc_) {
        case Encoding::Utf8:
            check_utf8(enc_, raw);
            return raw;

        case Encoding::Utf8Sig: {
            if (first && raw.size() >= 3 && raw.compare(0, 3, "\xEF\xBB\xBF") == 0) {
                std::string rest = raw.substr(3);
                check_utf8(enc_, rest);
                return rest;
            }
            check_utf8(enc_, raw);
            return raw;
        }

        case Encoding::Ascii:
            for (size_t i = 0; i < raw.size(); ++i) {
                const unsigned char c = static_cast<unsigned char>(raw[i]);
                if (c >= 0x80) throw make_error(enc_, c, i, "ordinal not in range(128)");
            }
            return raw;

        case Encoding::Latin1: {
            std::string out;
            out.reserve(raw.size());
            for (unsigned char c : raw) {
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            return out;
        }
    }
    return raw;
}

}  // namespace csvcheck
