#ifndef LIFEPLAN_IO_PROFILE_LOADER_HPP
#define LIFEPLAN_IO_PROFILE_LOADER_HPP

#include "../money.hpp"
#include "../profile.hpp"
#include <stdexcept>
#include <string>

namespace lifeplan {
namespace io {

/**
 * @brief Exception thrown when a profile file cannot be read or parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses "YYYY-MM"
 *
 * @throws ConfigParseError on any other shape or a month outside 1-12
 */
YearMonth parse_year_month(const std::string& text);

/**
 * @brief Parses a profile from a JSON string
 *
 * Monetary amounts in the document are dollars and are converted to cents.
 * Rates are fractions. Entity ids default to "<collection>-<n>" when absent.
 * Every assumption is optional; tax_year defaults to the as_of year.
 *
 * @param json_string Profile document
 * @return Parsed and validated profile
 * @throws ConfigParseError if JSON is invalid, a required field is missing or an enum name is unknown
 * @throws ProfileValidationError if a value violates a profile precondition
 */
Profile parse_profile_json(const std::string& json_string);

/**
 * @brief Parses a profile from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read
 */
Profile load_profile_json(const std::string& file_path);

} // namespace io
} // namespace lifeplan

#endif // LIFEPLAN_IO_PROFILE_LOADER_HPP
