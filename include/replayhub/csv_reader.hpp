/**
 * @file csv_reader.hpp
 * @brief Minimal comma separated record reader.
 *
 * Fields are separated by `,`.  A field that starts with `"` runs until the
 * matching unescaped quote; `""` inside it is a literal quote, and such a
 * field may span lines.  Surrounding whitespace is left for the caller.
 */

#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace replayhub {

class CsvReader {
  private:
    std::istream& m_input;
    std::size_t m_line{0};

  public:
    explicit CsvReader(std::istream& input) : m_input(input) {}

    /// Line number of the last line consumed, starting at 1.
    std::size_t line() const { return m_line; }

    /**
     * @brief Read the next record into @p fields.
     * @return `false` at end of input.
     */
    bool next(std::vector<std::string>& fields) {
        fields.clear();
        std::string line;
        if (!std::getline(m_input, line)) {
            return false;
        }
        ++m_line;

        std::string field;
        bool quoted = false;
        std::size_t i = 0;
        while (true) {
            if (i == line.size()) {
                if (!quoted) {
                    break;
                }
                // Quoted field continues on the next line.
                std::string more;
                if (!std::getline(m_input, more)) {
                    break;
                }
                ++m_line;
                field.push_back('\n');
                line = std::move(more);
                i = 0;
                continue;
            }
            const char c = line[i++];
            if (quoted) {
                if (c == '"') {
                    if (i < line.size() && line[i] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        quoted = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"') {
                quoted = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
            } else if (c != '\r' || i != line.size()) {
                field.push_back(c);
            }
        }
        fields.push_back(std::move(field));
        return true;
    }
};

} // namespace replayhub
