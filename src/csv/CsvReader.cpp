#include "csv/CsvReader.hpp"

namespace csvcheck {

bool read_raw_line(std::istream& in, std::string& content, std::string& eol) {
    content.clear();
    eol.clear();

    std::streambuf* sb = in.rdbuf();
    if (!sb) return false;

    bool any = false;
    for (;;) {
        const int ch = sb->sbumpc();
        if (ch == std::char_traits<char>::eof()) {
            in.setstate(std::ios::eofbit);
            return any;
        }
        any = true;
        if (ch == '\n') {
            eol = "\n";
            return true;
        }
        if (ch == '\r') {
            if (sb->sgetc() == '\n') {
                sb->sbumpc();
                eol = "\r\n";
            } else {
                eol = "\r";
            }
            return true;
        }
        content.push_back(static_cast<char>(ch));
    }
}

CsvReader::CsvReader(std::istream& in, char delimiter, Encoding enc)
    : m_in(in), m_delim(delimiter), m_decoder(enc) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw std::invalid_argument("delimiter must not be a quote, NUL or line break character");
    }
}

void CsvReader::append(char c) {
    if (m_field.size() >= kFieldSizeLimit) {
        throw CsvSyntaxError("field larger than field limit (" + std::to_string(kFieldSizeLimit) + ")");
    }
    m_field.push_back(c);
}

void CsvReader::save_field(std::vector<std::string>& fields) {
    fields.push_back(std::move(m_field));
    m_field.clear();
}

bool CsvReader::next(std::vector<std::string>& fields) {
    fields.clear();
    m_field.clear();
    m_state = State::StartRecord;

    std::string raw;
    std::string eol;

    while (read_raw_line(m_in, raw, eol)) {
        ++m_lines;
        const std::string line = m_decoder.decode(raw);
        if (line.find('\0') != std::string::npos) {
            throw CsvSyntaxError("line contains NUL (line " + std::to_string(m_lines) + ")");
        }

        for (char c : line) {
            switch (m_state) {
                case State::StartRecord:
                case State::StartField:
                    if (c == '"') {
                        m_state = State::InQuoted;
                    } else if (c == m_delim) {
                        save_field(fields);
                        m_state = State::StartField;
                    } else {
                        append(c);
                        m_state = State::InField;
                    }
                    break;

                case State::InField:
                    if (c == m_delim) {
                        save_field(fields);
                        m_state = State::StartField;
                    } else {
                        append(c);
                    }
                    break;

                case State::InQuoted:
                    if (c == '"') m_state = State::QuoteInQuoted;
                    else append(c);
                    break;

                case State::QuoteInQuoted:
                    if (c == '"') {
                        append('"');
                        m_state = State::InQuoted;
                    } else if (c == m_delim) {
                        save_field(fields);
                        m_state = State::StartField;
                    } else {
                        // text after a closing quote is kept literally
                        append(c);
                        m_state = State::InField;
                    }
                    break;
            }
        }

        if (m_state == State::InQuoted) {
            // line break inside a quoted field belongs to the field
            for (char c : eol) append(c);
            if (eol.empty()) break;
            continue;
        }

        if (m_state == State::StartRecord) {
            // blank line
            if (eol.empty()) break;
            continue;
        }

        save_field(fields);
        ++m_records;
        return true;
    }

    if (m_state == State::InQuoted) {
        throw CsvSyntaxError("unexpected end of data inside quoted field (line " + std::to_string(m_lines) + ")");
    }
    return false;
}

}  // namespace csvcheck
