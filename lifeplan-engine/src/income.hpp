#ifndef LIFEPLAN_INCOME_HPP
#define LIFEPLAN_INCOME_HPP

#include "money.hpp"
#include "profile.hpp"

namespace lifeplan {

constexpr double WEEKS_PER_YEAR = 52.0;
constexpr double DEFAULT_SALARY_HOURS_PER_WEEK = 40.0;

// Year-0 annual amount: hourly rate x hours x 52 for hourly income, otherwise the amount itself
Cents annual_base_amount(const Income& income);

// Full-year work hours: salary 40/week unless set, hourly and variable
// hours_per_week x 52, passive 0
double annual_work_hours(const Income& income);

struct IncomeYear {
    Cents gross = 0;
    double work_hours = 0.0;
    int months_active = 0;              // 12, fewer in the end year, 0 after it
};

// Income for simulated year year_index (calendar_year = start year + year_index)
// Grows at the income's own rate, or default_growth when unset, compounded
// from year 0. Prorated by end month in the end year and zero afterwards.
IncomeYear income_for_year(const Income& income, int year_index, int calendar_year, Rate default_growth);

// Annual cost of a recurring obligation; inflation-adjusted obligations grow
// at inflation_rate per simulated year. Same end-date proration as income.
Cents obligation_for_year(const Obligation& obligation, int year_index, int calendar_year, Rate inflation_rate);

} // namespace lifeplan

#endif // LIFEPLAN_INCOME_HPP
