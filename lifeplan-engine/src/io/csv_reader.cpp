#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace lifeplan {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    while (std::getline(is_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_skippable(line)) continue;

        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, delimiter_)) {
            row.push_back(trim(cell));
        }
        // Trailing delimiter means a trailing empty cell
        if (line.back() == delimiter_) {
            row.emplace_back();
        }
        break;
    }

    return row;
}

bool CsvReader::has_more() {
    return is_.good() && is_.peek() != std::char_traits<char>::eof();
}

bool CsvReader::is_skippable(const std::string& line) {
    auto first = std::find_if_not(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    return first == line.end() || *first == '#';
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace lifeplan
