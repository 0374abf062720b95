#include <gtest/gtest.h>

#include "csv/CsvReader.hpp"

#include <sstream>

using namespace csvcheck;

namespace {

std::vector<std::vector<std::string>> read_all(const std::string& text, char delim = ',',
                                               Encoding enc = Encoding::Utf8) {
    std::istringstream in(text);
    CsvReader reader(in, delim, enc);
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> fields;
    while (reader.next(fields)) rows.push_back(fields);
    return rows;
}

}  // namespace

TEST(ReadRawLine, SplitsOnAllLineEndings) {
    std::istringstream in("a\nb\r\nc\rd");
    std::string content, eol;

    ASSERT_TRUE(read_raw_line(in, content, eol));
    EXPECT_EQ(content, "a");
    EXPECT_EQ(eol, "\n");
    ASSERT_TRUE(read_raw_line(in, content, eol));
    EXPECT_EQ(content, "b");
    EXPECT_EQ(eol, "\r\n");
    ASSERT_TRUE(read_raw_line(in, content, eol));
    EXPECT_EQ(content, "c");
    EXPECT_EQ(eol, "\r");
    ASSERT_TRUE(read_raw_line(in, content, eol));
    EXPECT_EQ(content, "d");
    EXPECT_EQ(eol, "");
    EXPECT_FALSE(read_raw_line(in, content, eol));
}

TEST(CsvReader, SplitsSimpleRecords) {
    const auto rows = read_all("id,name\n1,alice\n2,bob\n");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"id", "name"}));
    EXPECT_EQ(rows[2], (std::vector<std::string>{"2", "bob"}));
}

TEST(CsvReader, KeepsEmptyFields) {
    const auto rows = read_all("a,,c\n,\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(rows[1], (std::vector<std::string>{"", ""}));
}

TEST(CsvReader, SkipsBlankLinesButNotWhitespaceLines) {
    const auto rows = read_all("h\n\n\r\n  \nx\n");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1], (std::vector<std::string>{"  "}));
    EXPECT_EQ(rows[2], (std::vector<std::string>{"x"}));
}

TEST(CsvReader, HandlesQuotedFields) {
    const auto rows = read_all("\"a,b\",\"say \"\"hi\"\"\",\"\"\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"a,b", "say \"hi\"", ""}));
}

TEST(CsvReader, QuotedFieldMaySpanLines) {
    std::istringstream in("id,note\n1,\"line one\nline two\"\n2,x\n");
    CsvReader reader(in, ',', Encoding::Utf8);
    std::vector<std::string> fields;

    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ(reader.record_number(), 1u);
    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ(fields[1], "line one\nline two");
    EXPECT_EQ(reader.record_number(), 2u);
    EXPECT_EQ(reader.line_number(), 3u);
    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ(reader.record_number(), 3u);
    EXPECT_FALSE(reader.next(fields));
}

TEST(CsvReader, QuoteInsideUnquotedFieldIsLiteral) {
    const auto rows = read_all("ab\"c,\"x\"y\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"ab\"c", "xy"}));
}

TEST(CsvReader, CustomDelimiter) {
    const auto rows = read_all("a;b,c\n1;2\n", ';');
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"a", "b,c"}));
}

TEST(CsvReader, LastRecordWithoutNewline) {
    const auto rows = read_all("a\nb");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (std::vector<std::string>{"b"}));
}

TEST(CsvReader, UnterminatedQuoteIsSyntaxError) {
    EXPECT_THROW(read_all("a,\"never closed\nmore\n"), CsvSyntaxError);
}

TEST(CsvReader, OversizedFieldIsSyntaxError) {
    const std::string big(CsvReader::kFieldSizeLimit + 1, 'x');
    EXPECT_THROW(read_all("h\n" + big + "\n"), CsvSyntaxError);
}

TEST(CsvReader, NulByteIsSyntaxError) {
    EXPECT_THROW(read_all(std::string("id\n1\0x\n", 7)), CsvSyntaxError);
    EXPECT_THROW(read_all(std::string("id\n\"a\0b\"\n", 9)), CsvSyntaxError);
}

TEST(CsvReader, RejectsQuoteAsDelimiter) {
    std::istringstream in("a");
    EXPECT_THROW(CsvReader(in, '"', Encoding::Utf8), std::invalid_argument);
}

TEST(CsvReader, DecodeErrorsSurface) {
    EXPECT_THROW(read_all("h\n\xFF\n"), DecodeError);
    const auto rows = read_all("h\ncaf\xE9\n", ',', Encoding::Latin1);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1][0], "caf\xC3\xA9");
}
