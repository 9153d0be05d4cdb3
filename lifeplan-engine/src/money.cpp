#include "money.hpp"
#include <cstdio>
#include <cmath>

namespace lifeplan {

std::string YearMonth::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
    return std::string(buffer);
}

std::string format_currency_compact(Cents amount) {
    const double dollars = std::fabs(cents_to_dollars(amount));
    const char* sign = amount < 0 ? "-" : "";
    char buffer[32];

    if (dollars >= 1e9) {
        std::snprintf(buffer, sizeof(buffer), "%s$%.1fB", sign, dollars / 1e9);
    } else if (dollars >= 1e6) {
        std::snprintf(buffer, sizeof(buffer), "%s$%.1fM", sign, dollars / 1e6);
    } else if (dollars >= 1e3) {
        std::snprintf(buffer, sizeof(buffer), "%s$%.1fK", sign, dollars / 1e3);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%s$%.0f", sign, dollars);
    }
    return std::string(buffer);
}

} // namespace lifeplan
