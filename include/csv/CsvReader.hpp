#pragma once

#include "csv/Decoder.hpp"

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace csvcheck {

class CsvSyntaxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads one physical line. `eol` receives the terminator ("\n", "\r\n", "\r" or "" at end of input).
// Returns false when nothing was left to read.
bool read_raw_line(std::istream& in, std::string& content, std::string& eol);

// Record reader for delimited text: single-character delimiter, '"' quoting with doubled quotes
// as escapes, quoted fields may span lines. Blank lines are skipped; a NUL byte is a syntax error.
class CsvReader {
public:
    static constexpr size_t kFieldSizeLimit = 131072;

    CsvReader(std::istream& in, char delimiter, Encoding enc);

    // Reads the next non-blank record into `fields`. Returns false at end of input.
    // Throws CsvSyntaxError or DecodeError.
    bool next(std::vector<std::string>& fields);

    // 1-based number of the last record returned by next()
    size_t record_number() const { return m_records; }

    // physical line on which the last record (or failure) ended
    size_t line_number() const { return m_lines; }

private:
    enum class State { StartRecord, StartField, InField, InQuoted, QuoteInQuoted };

    void save_field(std::vector<std::string>& fields);
    void append(char c);

    std::istream& m_in;
    char m_delim;
    LineDecoder m_decoder;
    State m_state = State::StartRecord;
    std::string m_field;
    size_t m_records = 0;
    size_t m_lines = 0;
};

}  // namespace csvcheck
