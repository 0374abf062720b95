#include <gtest/gtest.h>

#include "csv/Decoder.hpp"

using namespace csvcheck;

TEST(Decoder, ParsesEncodingNames) {
    EXPECT_EQ(parse_encoding("utf-8"), Encoding::Utf8);
    EXPECT_EQ(parse_encoding("UTF8"), Encoding::Utf8);
    EXPECT_EQ(parse_encoding("utf-8-sig"), Encoding::Utf8Sig);
    EXPECT_EQ(parse_encoding("US-ASCII"), Encoding::Ascii);
    EXPECT_EQ(parse_encoding("latin-1"), Encoding::Latin1);
    EXPECT_EQ(parse_encoding("iso-8859-1"), Encoding::Latin1);
    EXPECT_THROW(parse_encoding("ebcdic"), std::invalid_argument);
}

TEST(Decoder, Utf8AcceptsMultibyteText) {
    LineDecoder d(Encoding::Utf8);
    EXPECT_EQ(d.decode("na\xC3\xAFve \xE2\x82\xAC \xF0\x9F\x98\x80"), "na\xC3\xAFve \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST(Decoder, Utf8RejectsInvalidStartByte) {
    LineDecoder d(Encoding::Utf8);
    try {
        d.decode("ab\xFF");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.position(), 2u);
        EXPECT_NE(std::string(e.what()).find("0xff"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("invalid start byte"), std::string::npos);
    }
}

TEST(Decoder, Utf8RejectsTruncatedAndOverlongSequences) {
    LineDecoder d(Encoding::Utf8);
    EXPECT_THROW(d.decode("x\xC3"), DecodeError);        // truncated
    EXPECT_THROW(d.decode("\xC0\xAF"), DecodeError);     // overlong '/'
    EXPECT_THROW(d.decode("\xED\xA0\x80"), DecodeError); // surrogate
    EXPECT_THROW(d.decode("\xC3(x"), DecodeError);       // bad continuation
}

TEST(Decoder, Utf8SigStripsBomOnFirstLineOnly) {
    LineDecoder d(Encoding::Utf8Sig);
    EXPECT_EQ(d.decode("\xEF\xBB\xBFid,name"), "id,name");
    EXPECT_EQ(d.decode("\xEF\xBB\xBFx"), "\xEF\xBB\xBFx");
}

TEST(Decoder, PlainUtf8KeepsBom) {
    LineDecoder d(Encoding::Utf8);
    EXPECT_EQ(d.decode("\xEF\xBB\xBFid"), "\xEF\xBB\xBFid");
}

TEST(Decoder, AsciiRejectsHighBytes) {
    LineDecoder d(Encoding::Ascii);
    EXPECT_EQ(d.decode("plain"), "plain");
    EXPECT_THROW(d.decode("caf\xC3\xA9"), DecodeError);
}

TEST(Decoder, Latin1TranscodesToUtf8) {
    LineDecoder d(Encoding::Latin1);
    EXPECT_EQ(d.decode("caf\xE9"), "caf\xC3\xA9");
    EXPECT_EQ(d.decode("\xFF"), "\xC3\xBF");
}
