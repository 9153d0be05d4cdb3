#include "comparison.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <stdexcept>

namespace lifeplan {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string format_rate(Rate rate) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", rate * 100.0);
    return std::string(buffer);
}

std::string format_optional_rate(const std::optional<Rate>& rate) {
    return rate ? format_rate(*rate) : std::string("default");
}

bool is_rate_field(AssumptionField field) {
    return field != AssumptionField::LifeExpectancy && field != AssumptionField::CurrentAge;
}

template <typename T>
T& find_entity(std::vector<T>& entities, const std::string& id, const char* collection) {
    for (auto& entity : entities) {
        if (entity.id == id) {
            return entity;
        }
    }
    throw std::invalid_argument(std::string("Change refers to unknown ") + collection + " id '" + id + "'");
}

void apply_assumption(Assumptions& assumptions, const AssumptionChange& change) {
    switch (change.field) {
        case AssumptionField::InflationRate: assumptions.inflation_rate = change.new_value; break;
        case AssumptionField::MarketReturn: assumptions.market_return = change.new_value; break;
        case AssumptionField::HomeAppreciation: assumptions.home_appreciation = change.new_value; break;
        case AssumptionField::SalaryGrowth: assumptions.salary_growth = change.new_value; break;
        case AssumptionField::RetirementWithdrawalRate:
            assumptions.retirement_withdrawal_rate = change.new_value;
            break;
        case AssumptionField::IncomeReplacementRatio:
            assumptions.income_replacement_ratio = change.new_value;
            break;
        case AssumptionField::LifeExpectancy:
            assumptions.life_expectancy = static_cast<int>(std::lround(change.new_value));
            break;
        case AssumptionField::CurrentAge:
            assumptions.current_age = static_cast<int>(std::lround(change.new_value));
            break;
    }
}

} // anonymous namespace

// ============================================================================
// Changes
// ============================================================================

std::string to_string(AssumptionField field) {
    switch (field) {
        case AssumptionField::InflationRate: return "inflation_rate";
        case AssumptionField::MarketReturn: return "market_return";
        case AssumptionField::HomeAppreciation: return "home_appreciation";
        case AssumptionField::SalaryGrowth: return "salary_growth";
        case AssumptionField::RetirementWithdrawalRate: return "retirement_withdrawal_rate";
        case AssumptionField::IncomeReplacementRatio: return "income_replacement_ratio";
        case AssumptionField::LifeExpectancy: return "life_expectancy";
        case AssumptionField::CurrentAge: return "current_age";
    }
    return "inflation_rate";
}

std::string describe_change(const ChangeDetail& detail) {
    return std::visit(overloaded{
        [](const IncomeAmountChange& c) {
            return "Income amount: " + format_currency_compact(c.old_amount) + " -> " +
                   format_currency_compact(c.new_amount);
        },
        [](const IncomeGrowthChange& c) {
            return "Income growth: " + format_optional_rate(c.old_rate) + " -> " + format_rate(c.new_rate);
        },
        [](const DebtRateChange& c) {
            return "Interest rate: " + format_rate(c.old_rate) + " -> " + format_rate(c.new_rate);
        },
        [](const DebtPaymentChange& c) {
            return "Monthly payment: " + format_currency_compact(c.old_payment) + " -> " +
                   format_currency_compact(c.new_payment);
        },
        [](const AssetContributionChange& c) {
            return "Monthly contribution: " + format_currency_compact(c.old_contribution) + " -> " +
                   format_currency_compact(c.new_contribution);
        },
        [](const AssetReturnChange& c) {
            return "Expected return: " + format_optional_rate(c.old_return) + " -> " + format_rate(c.new_return);
        },
        [](const AssumptionChange& c) {
            if (is_rate_field(c.field)) {
                return to_string(c.field) + ": " + format_rate(c.old_value) + " -> " + format_rate(c.new_value);
            }
            return to_string(c.field) + ": " + std::to_string(std::lround(c.old_value)) + " -> " +
                   std::to_string(std::lround(c.new_value));
        },
        [](const FilingStatusChange& c) {
            return "Filing status: " + to_string(c.old_status) + " -> " + to_string(c.new_status);
        },
        [](const StateChange& c) {
            return "State: " + c.old_state + " -> " + c.new_state;
        }
    }, detail);
}

Change make_change(ChangeDetail detail) {
    std::string description = describe_change(detail);
    return Change{std::move(detail), std::move(description)};
}

Profile apply_changes(const Profile& profile, const std::vector<Change>& changes) {
    Profile result = profile;
    for (const auto& change : changes) {
        std::visit(overloaded{
            [&](const IncomeAmountChange& c) {
                find_entity(result.incomes, c.income_id, "income").amount = c.new_amount;
            },
            [&](const IncomeGrowthChange& c) {
                find_entity(result.incomes, c.income_id, "income").growth_rate = c.new_rate;
            },
            [&](const DebtRateChange& c) {
                find_entity(result.debts, c.debt_id, "debt").interest_rate = c.new_rate;
            },
            [&](const DebtPaymentChange& c) {
                find_entity(result.debts, c.debt_id, "debt").actual_payment = c.new_payment;
            },
            [&](const AssetContributionChange& c) {
                find_entity(result.assets, c.asset_id, "asset").monthly_contribution = c.new_contribution;
            },
            [&](const AssetReturnChange& c) {
                find_entity(result.assets, c.asset_id, "asset").expected_return = c.new_return;
            },
            [&](const AssumptionChange& c) {
                apply_assumption(result.assumptions, c);
            },
            [&](const FilingStatusChange& c) {
                result.assumptions.filing_status = c.new_status;
            },
            [&](const StateChange& c) {
                result.assumptions.state = c.new_state;
            }
        }, change.detail);
    }
    return result;
}

// ============================================================================
// Deltas and summary
// ============================================================================

YearDelta calculate_year_delta(const TrajectoryYear& baseline, const TrajectoryYear& alternate) {
    YearDelta delta;
    delta.year = alternate.year;
    delta.age = alternate.age;
    delta.net_worth_delta = alternate.net_worth - baseline.net_worth;
    delta.income_delta = alternate.gross_income - baseline.gross_income;
    delta.net_income_delta = alternate.net_income - baseline.net_income;
    delta.taxes_delta = alternate.total_tax - baseline.total_tax;
    delta.debt_delta = alternate.total_debt - baseline.total_debt;
    delta.assets_delta = alternate.total_assets - baseline.total_assets;
    delta.work_hours_delta = alternate.work_hours - baseline.work_hours;
    return delta;
}

RetirementDateDelta retirement_date_delta(const TrajectorySummary& baseline, const TrajectorySummary& alternate) {
    if (baseline.retirement_year && alternate.retirement_year) {
        return RetirementShift{(*alternate.retirement_year - *baseline.retirement_year) * 12};
    }
    if (alternate.retirement_year) {
        return RetirementEnabled{};
    }
    if (baseline.retirement_year) {
        return RetirementDisabled{};
    }
    return RetirementNeither{};
}

std::string generate_key_insight(const ComparisonSummary& summary) {
    std::vector<std::string> insights;

    std::visit(overloaded{
        [](const RetirementNeither&) {},
        [&](const RetirementEnabled&) { insights.push_back("This change enables retirement"); },
        [&](const RetirementDisabled&) { insights.push_back("This change prevents retirement"); },
        [&](const RetirementShift& shift) {
            if (shift.months == 0) return;
            char buffer[64];
            std::snprintf(buffer, sizeof(buffer), "Retire %.1f years %s",
                          std::abs(shift.months) / 12.0, shift.months < 0 ? "earlier" : "later");
            insights.emplace_back(buffer);
        }
    }, summary.retirement_date_delta);

    if (std::llabs(summary.net_worth_at_end_delta) >= INSIGHT_NET_WORTH_THRESHOLD) {
        insights.push_back(format_currency_compact(std::llabs(summary.net_worth_at_end_delta)) +
                           (summary.net_worth_at_end_delta > 0 ? " more" : " less") + " at end");
    }

    if (summary.lifetime_interest_delta <= -INSIGHT_INTEREST_THRESHOLD) {
        insights.push_back("Save " + format_currency_compact(-summary.lifetime_interest_delta) + " in interest");
    } else if (summary.lifetime_interest_delta >= INSIGHT_INTEREST_THRESHOLD) {
        insights.push_back("Pay " + format_currency_compact(summary.lifetime_interest_delta) + " more in interest");
    }

    if (std::fabs(summary.work_hours_delta) >= INSIGHT_WORK_HOURS_THRESHOLD) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "Work %.0f %s hours",
                      std::fabs(summary.work_hours_delta), summary.work_hours_delta < 0 ? "fewer" : "more");
        insights.emplace_back(buffer);
    }

    if (insights.empty()) {
        return "Minimal difference between scenarios";
    }

    std::string result = insights.front();
    for (size_t i = 1; i < insights.size(); ++i) {
        result += ". " + insights[i];
    }
    return result;
}

Comparison compare_trajectories(
    const Trajectory& baseline,
    const Trajectory& alternate,
    const std::vector<Change>& changes,
    const std::string& name)
{
    if (!baseline.years.empty() && !alternate.years.empty()) {
        const TrajectoryYear& b = baseline.years.front();
        const TrajectoryYear& a = alternate.years.front();
        if (b.year != a.year || b.age != a.age) {
            throw std::invalid_argument(
                "Trajectories must share a starting point (baseline " + std::to_string(b.year) +
                " age " + std::to_string(b.age) + ", alternate " + std::to_string(a.year) +
                " age " + std::to_string(a.age) + ")");
        }
    }

    Comparison comparison;
    comparison.name = name;
    comparison.baseline = baseline;
    comparison.alternate = alternate;
    comparison.changes = changes;

    std::map<int, const TrajectoryYear*> baseline_years;
    for (const auto& year : baseline.years) {
        baseline_years[year.year] = &year;
    }
    for (const auto& year : alternate.years) {
        auto it = baseline_years.find(year.year);
        if (it != baseline_years.end()) {
            comparison.deltas.push_back(calculate_year_delta(*it->second, year));
        }
    }

    ComparisonSummary& summary = comparison.summary;
    summary.retirement_date_delta = retirement_date_delta(baseline.summary, alternate.summary);
    summary.lifetime_interest_delta = alternate.summary.lifetime_interest - baseline.summary.lifetime_interest;
    summary.net_worth_at_retirement_delta =
        alternate.summary.net_worth_at_retirement - baseline.summary.net_worth_at_retirement;
    summary.work_hours_delta = alternate.summary.lifetime_work_hours - baseline.summary.lifetime_work_hours;
    summary.net_worth_at_end_delta = alternate.summary.net_worth_at_end - baseline.summary.net_worth_at_end;
    summary.key_insight = generate_key_insight(summary);

    return comparison;
}

// ============================================================================
// Auxiliary analyses
// ============================================================================

std::optional<YearDelta> find_max_divergence_year(const std::vector<YearDelta>& deltas) {
    if (deltas.empty()) {
        return std::nullopt;
    }
    const YearDelta* max = &deltas.front();
    for (const auto& delta : deltas) {
        if (std::llabs(delta.net_worth_delta) > std::llabs(max->net_worth_delta)) {
            max = &delta;
        }
    }
    return *max;
}

std::optional<int> find_crossover_year(const std::vector<YearDelta>& deltas) {
    for (size_t i = 1; i < deltas.size(); ++i) {
        const Cents prev = deltas[i - 1].net_worth_delta;
        const Cents curr = deltas[i].net_worth_delta;
        if ((prev <= 0 && curr > 0) || (prev >= 0 && curr < 0)) {
            return deltas[i].year;
        }
    }
    return std::nullopt;
}

std::optional<int> find_break_even_year(const std::vector<YearDelta>& deltas) {
    Cents cumulative = 0;
    for (const auto& delta : deltas) {
        cumulative += delta.net_worth_delta;
        if (cumulative > 0) {
            return delta.year;
        }
    }
    return std::nullopt;
}

CumulativeImpact calculate_cumulative_impact(const std::vector<YearDelta>& deltas, int start_year, int end_year) {
    CumulativeImpact impact;
    const YearDelta* last = nullptr;
    int count = 0;

    for (const auto& delta : deltas) {
        if (delta.year < start_year || delta.year > end_year) continue;
        impact.total_income_delta += delta.income_delta;
        impact.total_taxes_delta += delta.taxes_delta;
        last = &delta;
        ++count;
    }

    if (last == nullptr) {
        return impact;
    }
    impact.total_net_worth_delta = last->net_worth_delta;
    impact.average_yearly_benefit = round_cents(static_cast<double>(last->net_worth_delta) / count);
    return impact;
}

ComparisonAtYear comparison_at_year(const Comparison& comparison, int year) {
    ComparisonAtYear result;
    result.baseline = comparison.baseline.find_year(year);
    result.alternate = comparison.alternate.find_year(year);
    for (const auto& delta : comparison.deltas) {
        if (delta.year == year) {
            result.delta = &delta;
            break;
        }
    }
    return result;
}

} // namespace lifeplan
