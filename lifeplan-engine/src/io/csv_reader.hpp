#ifndef LIFEPLAN_CSV_READER_HPP
#define LIFEPLAN_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace lifeplan {

// Line-oriented CSV reader for tax tables
// Blank lines and lines starting with '#' are skipped; cells are trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next data row, or an empty row at end of input
    std::vector<std::string> read_row();
    bool has_more();

private:
    std::istream& is_;
    char delimiter_;

    static bool is_skippable(const std::string& line);
    static std::string trim(const std::string& s);
};

} // namespace lifeplan

#endif // LIFEPLAN_CSV_READER_HPP
