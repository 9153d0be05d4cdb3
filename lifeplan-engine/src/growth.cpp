#include "growth.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lifeplan {

namespace {

Cents grow_month(Cents balance, double monthly_return) {
    return std::max<Cents>(0, round_cents(static_cast<double>(balance) * (1.0 + monthly_return)));
}

} // anonymous namespace

GrowthResult yearly_growth(Cents starting_balance, Cents monthly_contribution, Rate annual_return) {
    const double monthly_return = annual_return / 12.0;
    Cents balance = starting_balance;

    GrowthResult result;
    for (int month = 0; month < 12; ++month) {
        balance += monthly_contribution;
        result.contributions += monthly_contribution;
        balance = grow_month(balance, monthly_return);
    }

    result.ending_balance = balance;
    result.growth = balance - starting_balance - result.contributions;
    return result;
}

Cents employer_match(Cents monthly_contribution, Cents annual_salary, Rate match_rate, Rate match_limit) {
    const Cents annual_contribution = monthly_contribution * 12;
    const Cents matchable_cap = round_cents(static_cast<double>(annual_salary) * match_limit);
    const Cents matchable = std::min(annual_contribution, matchable_cap);
    return std::max<Cents>(0, round_cents(static_cast<double>(matchable) * match_rate));
}

AssetYearResult asset_year(const Asset& asset, Cents starting_balance, Rate annual_return, Cents annual_salary) {
    if (starting_balance < 0) {
        throw std::invalid_argument(asset.name + ": balance must be >= 0 (got " +
                                    std::to_string(starting_balance) + ")");
    }

    AssetYearResult result;
    result.starting_balance = starting_balance;
    result.contributions = asset.monthly_contribution * 12;
    if (asset.has_employer_match()) {
        result.employer_match = employer_match(asset.monthly_contribution, annual_salary,
                                               *asset.employer_match, *asset.match_limit);
    }
    result.total_contributions = result.contributions + result.employer_match;

    const double monthly_return = annual_return / 12.0;
    Cents balance = starting_balance;
    Cents deposited = 0;
    for (int month = 1; month <= 12; ++month) {
        const Cents deposit_to_date = result.total_contributions * month / 12;
        balance += deposit_to_date - deposited;
        deposited = deposit_to_date;
        balance = grow_month(balance, monthly_return);
    }

    result.ending_balance = balance;
    result.growth = balance - starting_balance - result.total_contributions;
    return result;
}

AssetProjection project_asset_over_years(
    Cents starting_balance,
    Cents monthly_contribution,
    Rate annual_return,
    int years)
{
    AssetProjection projection;
    projection.yearly_balances.reserve(static_cast<size_t>(std::max(years, 0)) + 1);
    projection.yearly_balances.push_back(starting_balance);

    Cents balance = starting_balance;
    for (int year = 0; year < years; ++year) {
        const GrowthResult step = yearly_growth(balance, monthly_contribution, annual_return);
        balance = step.ending_balance;
        projection.total_contributions += step.contributions;
        projection.total_growth += step.growth;
        projection.yearly_balances.push_back(balance);
    }

    projection.final_balance = balance;
    return projection;
}

double future_value(double present_value, Rate annual_return, int years) {
    return present_value * std::pow(1.0 + annual_return, years);
}

double present_value(double future_value, Rate annual_return, int years) {
    return future_value / std::pow(1.0 + annual_return, years);
}

std::optional<int> years_to_target(
    Cents starting_balance,
    Cents monthly_contribution,
    Rate annual_return,
    Cents target_balance,
    int max_years)
{
    Cents balance = starting_balance;
    for (int year = 0; year < max_years; ++year) {
        if (balance >= target_balance) {
            return year;
        }
        balance = yearly_growth(balance, monthly_contribution, annual_return).ending_balance;
    }
    if (balance >= target_balance) {
        return max_years;
    }
    return std::nullopt;
}

Cents required_monthly_savings(Cents starting_balance, Cents target_balance, Rate annual_return, int years) {
    if (years <= 0) {
        return std::max<Cents>(0, target_balance - starting_balance);
    }

    const Cents grown_start = round_cents(future_value(static_cast<double>(starting_balance), annual_return, years));
    const Cents needed = target_balance - grown_start;
    if (needed <= 0) {
        return 0;
    }

    // Future value of an annuity: FV = PMT * ((1 + r)^n - 1) / r
    const double monthly_return = annual_return / 12.0;
    const int months = years * 12;
    const double factor = std::pow(1.0 + monthly_return, months) - 1.0;

    if (factor == 0.0) {
        return round_cents(static_cast<double>(needed) / months);
    }
    return std::max<Cents>(0, round_cents(static_cast<double>(needed) * monthly_return / factor));
}

RetirementReadiness retirement_readiness(Cents retirement_assets, Cents desired_annual_income, Rate withdrawal_rate) {
    RetirementReadiness result;
    result.current_assets = retirement_assets;

    if (withdrawal_rate <= 0.0) {
        return result;
    }

    result.required_nest_egg = round_cents(static_cast<double>(desired_annual_income) / withdrawal_rate);
    result.percentage_complete = result.required_nest_egg > 0
        ? std::min(1.0, static_cast<double>(retirement_assets) / static_cast<double>(result.required_nest_egg))
        : 1.0;
    result.is_ready = retirement_assets >= result.required_nest_egg;
    result.sustainable_withdrawal = round_cents(static_cast<double>(retirement_assets) * withdrawal_rate);
    result.monthly_income = round_cents(static_cast<double>(result.sustainable_withdrawal) / 12.0);
    return result;
}

PropertyAppreciation property_appreciation(Cents current_value, Rate appreciation_rate, int years) {
    PropertyAppreciation result;
    result.future_value = round_cents(future_value(static_cast<double>(current_value), appreciation_rate, years));
    result.total_appreciation = result.future_value - current_value;
    return result;
}

} // namespace lifeplan
