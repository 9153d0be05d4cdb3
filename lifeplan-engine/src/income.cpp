#include "income.hpp"
#include <cmath>
#include <optional>

namespace lifeplan {

namespace {

int active_months(const std::optional<YearMonth>& end, int calendar_year) {
    if (!end || calendar_year < end->year) {
        return 12;
    }
    if (calendar_year == end->year) {
        return end->month;
    }
    return 0;
}

} // anonymous namespace

Cents annual_base_amount(const Income& income) {
    if (income.kind == IncomeKind::Hourly) {
        return round_cents(static_cast<double>(income.amount) * income.hours_per_week * WEEKS_PER_YEAR);
    }
    return income.amount;
}

double annual_work_hours(const Income& income) {
    switch (income.kind) {
        case IncomeKind::Salary:
            return (income.hours_per_week > 0.0 ? income.hours_per_week : DEFAULT_SALARY_HOURS_PER_WEEK) *
                   WEEKS_PER_YEAR;
        case IncomeKind::Hourly:
        case IncomeKind::Variable:
            return income.hours_per_week * WEEKS_PER_YEAR;
        case IncomeKind::Passive:
            return 0.0;
    }
    return 0.0;
}

IncomeYear income_for_year(const Income& income, int year_index, int calendar_year, Rate default_growth) {
    IncomeYear result;
    result.months_active = active_months(income.end, calendar_year);
    if (result.months_active == 0) {
        return result;
    }

    const Rate growth = income.growth_rate.value_or(default_growth);
    const double grown = static_cast<double>(annual_base_amount(income)) * std::pow(1.0 + growth, year_index);
    const double fraction = result.months_active / 12.0;

    result.gross = round_cents(grown * fraction);
    result.work_hours = annual_work_hours(income) * fraction;
    return result;
}

Cents obligation_for_year(const Obligation& obligation, int year_index, int calendar_year, Rate inflation_rate) {
    const int months = active_months(obligation.end, calendar_year);
    if (months == 0) {
        return 0;
    }
    double amount = static_cast<double>(obligation.monthly_amount) * months;
    if (obligation.inflation_adjusted) {
        amount *= std::pow(1.0 + inflation_rate, year_index);
    }
    return round_cents(amount);
}

} // namespace lifeplan
