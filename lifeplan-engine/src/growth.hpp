#ifndef LIFEPLAN_GROWTH_HPP
#define LIFEPLAN_GROWTH_HPP

#include "money.hpp"
#include "profile.hpp"
#include <optional>
#include <vector>

namespace lifeplan {

struct GrowthResult {
    Cents ending_balance = 0;
    Cents growth = 0;                   // ending - starting - contributions
    Cents contributions = 0;
};

// Twelve monthly steps: add the contribution at the start of the month, then
// apply 1 + annual_return / 12 and round to cents. Balances never go below 0.
GrowthResult yearly_growth(Cents starting_balance, Cents monthly_contribution, Rate annual_return);

// Match on contributions up to match_limit x annual_salary
Cents employer_match(Cents monthly_contribution, Cents annual_salary, Rate match_rate, Rate match_limit);

struct AssetYearResult {
    Cents starting_balance = 0;
    Cents ending_balance = 0;
    Cents contributions = 0;            // Holder contributions
    Cents employer_match = 0;
    Cents total_contributions = 0;      // contributions + employer_match
    Cents growth = 0;
};

// One year of an asset including employer match keyed off annual_salary
// Total contributions are deposited across the 12 months so the deposits sum
// to exactly total_contributions.
AssetYearResult asset_year(const Asset& asset, Cents starting_balance, Rate annual_return, Cents annual_salary);

struct AssetProjection {
    std::vector<Cents> yearly_balances; // Starting balance followed by each year end
    Cents final_balance = 0;
    Cents total_contributions = 0;
    Cents total_growth = 0;
};

AssetProjection project_asset_over_years(
    Cents starting_balance,
    Cents monthly_contribution,
    Rate annual_return,
    int years
);

// Compound-interest pair in fractional cents; callers round where they book
double future_value(double present_value, Rate annual_return, int years);
double present_value(double future_value, Rate annual_return, int years);

// Whole years until the balance reaches target: 0 if already there,
// empty if not reached within max_years
std::optional<int> years_to_target(
    Cents starting_balance,
    Cents monthly_contribution,
    Rate annual_return,
    Cents target_balance,
    int max_years = 100
);

// Monthly contribution needed to reach target in years; never negative
Cents required_monthly_savings(Cents starting_balance, Cents target_balance, Rate annual_return, int years);

struct RetirementReadiness {
    Cents current_assets = 0;
    Cents required_nest_egg = 0;        // 0 when the withdrawal rate is not positive
    Rate percentage_complete = 0.0;     // Capped at 1
    bool is_ready = false;
    Cents sustainable_withdrawal = 0;   // Annual
    Cents monthly_income = 0;
};

RetirementReadiness retirement_readiness(Cents retirement_assets, Cents desired_annual_income, Rate withdrawal_rate);

struct PropertyAppreciation {
    Cents future_value = 0;
    Cents total_appreciation = 0;
};

PropertyAppreciation property_appreciation(Cents current_value, Rate appreciation_rate, int years);

} // namespace lifeplan

#endif // LIFEPLAN_GROWTH_HPP
