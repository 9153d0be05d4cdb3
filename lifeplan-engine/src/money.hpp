#ifndef LIFEPLAN_MONEY_HPP
#define LIFEPLAN_MONEY_HPP

#include <cmath>
#include <cstdint>
#include <string>

namespace lifeplan {

// All monetary amounts are whole cents
using Cents = int64_t;

// Rates are fractions: 0.07 = 7%
using Rate = double;

// Round a fractional cent amount to whole cents (half away from zero)
inline Cents round_cents(double amount) {
    return static_cast<Cents>(std::llround(amount));
}

inline Cents dollars_to_cents(double dollars) {
    return round_cents(dollars * 100.0);
}

inline double cents_to_dollars(Cents cents) {
    return static_cast<double>(cents) / 100.0;
}

// Calendar month used for end dates, target dates and the profile as-of date
struct YearMonth {
    int year;
    int month;                      // 1-12

    YearMonth() : year(0), month(1) {}
    YearMonth(int y, int m) : year(y), month(m) {}

    bool operator==(const YearMonth& other) const {
        return year == other.year && month == other.month;
    }
    bool operator!=(const YearMonth& other) const { return !(*this == other); }
    bool operator<(const YearMonth& other) const {
        return year < other.year || (year == other.year && month < other.month);
    }

    // "YYYY-MM"
    std::string to_string() const;
};

// Compact currency text for summaries: $950, $12.3K, $1.2M
std::string format_currency_compact(Cents amount);

} // namespace lifeplan

#endif // LIFEPLAN_MONEY_HPP
