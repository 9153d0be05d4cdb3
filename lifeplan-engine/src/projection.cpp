#include "projection.hpp"
#include "amortization.hpp"
#include "growth.hpp"
#include "income.hpp"
#include "tax.hpp"
#include <algorithm>
#include <stdexcept>

namespace lifeplan {

// ============================================================================
// ProjectionConfig Implementation
// ============================================================================

std::vector<Cents> default_net_worth_milestones() {
    return {
        dollars_to_cents(100000),
        dollars_to_cents(250000),
        dollars_to_cents(500000),
        dollars_to_cents(1000000),
        dollars_to_cents(2500000),
        dollars_to_cents(5000000),
        dollars_to_cents(10000000)
    };
}

ProjectionConfig::ProjectionConfig()
    : net_worth_milestones(default_net_worth_milestones()) {}

void ProjectionConfig::validate() const {
    for (size_t i = 0; i < net_worth_milestones.size(); ++i) {
        if (net_worth_milestones[i] <= 0) {
            throw std::invalid_argument("net_worth_milestones[" + std::to_string(i) +
                                        "] must be positive (got " +
                                        std::to_string(net_worth_milestones[i]) + ")");
        }
        if (i > 0 && net_worth_milestones[i] <= net_worth_milestones[i - 1]) {
            throw std::invalid_argument("net_worth_milestones must be strictly increasing (index " +
                                        std::to_string(i) + ")");
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

Rate asset_return(const Asset& asset, const Assumptions& assumptions) {
    if (asset.expected_return) {
        return *asset.expected_return;
    }
    return asset.kind == AssetKind::Property ? assumptions.home_appreciation : assumptions.market_return;
}

bool counts_toward_retirement(AssetKind kind) {
    return kind == AssetKind::RetirementPretax ||
           kind == AssetKind::RetirementRoth ||
           kind == AssetKind::Investment;
}

bool has_pmi_terms(const Debt& debt) {
    return debt.is_mortgage() && debt.pmi_threshold.has_value() && debt.pmi_monthly > 0;
}

int initial_months_remaining(const Debt& debt) {
    return debt.months_remaining > 0 ? debt.months_remaining : debt.term_months;
}

Milestone make_milestone(MilestoneKind kind, int year, int month, std::string description,
                         std::optional<std::string> related_id = std::nullopt) {
    return Milestone{kind, year, month, std::move(description), std::move(related_id)};
}

void check_inputs(const Profile& profile, const ProjectionConfig& config, const TaxTables& tables) {
    validate_profile(profile);
    config.validate();
    // Fail before simulating rather than in year 0's tax step
    tables.states.get(profile.assumptions.state);
    if (tables.federal.empty()) {
        throw std::invalid_argument("Federal tax schedule is empty");
    }
}

TrajectorySummary summarize(const Profile& profile, const std::vector<TrajectoryYear>& years,
                            const std::vector<Milestone>& milestones) {
    TrajectorySummary summary;
    summary.total_years = static_cast<int>(years.size());

    for (const auto& year : years) {
        summary.lifetime_income += year.gross_income;
        summary.lifetime_taxes += year.total_tax;
        summary.lifetime_interest += year.total_interest_paid;
        summary.lifetime_net_income += year.net_income;
        summary.lifetime_employer_match += year.total_employer_match;
        summary.lifetime_contributions += year.total_contributions;
        summary.lifetime_work_hours += year.work_hours;
    }

    for (const auto& milestone : milestones) {
        switch (milestone.kind) {
            case MilestoneKind::RetirementReady:
                if (!summary.retirement_year) {
                    summary.retirement_year = milestone.year;
                    summary.retirement_age = profile.assumptions.current_age +
                                             (milestone.year - profile.as_of.year);
                }
                break;
            case MilestoneKind::GoalAchieved:
                ++summary.goals_achieved;
                break;
            case MilestoneKind::GoalMissed:
                ++summary.goals_missed;
                break;
            default:
                break;
        }
    }

    if (summary.retirement_year) {
        for (const auto& year : years) {
            if (year.year == *summary.retirement_year) {
                summary.net_worth_at_retirement = year.net_worth;
                break;
            }
        }
    }

    if (!years.empty()) {
        summary.net_worth_at_end = years.back().net_worth;
    }
    if (summary.lifetime_work_hours > 0.0) {
        summary.average_effective_hourly_rate =
            round_cents(static_cast<double>(summary.lifetime_net_income) / summary.lifetime_work_hours);
    }
    return summary;
}

Trajectory run(const Profile& profile, int years, const ProjectionConfig& config, const TaxTables& tables) {
    const ProjectionContext context{profile, config, tables};

    Trajectory trajectory;
    trajectory.profile_id = profile.id;
    trajectory.generated_at = config.generated_at.value_or(profile.as_of.to_string());
    trajectory.years.reserve(static_cast<size_t>(years));

    ProjectionState state = initial_state(profile, config);
    for (int i = 0; i < years; ++i) {
        YearStep step = advance_year(context, state);
        trajectory.years.push_back(std::move(step.year));
        for (auto& milestone : step.milestones) {
            trajectory.milestones.push_back(std::move(milestone));
        }
        state = std::move(step.next_state);
    }

    trajectory.summary = summarize(profile, trajectory.years, trajectory.milestones);
    return trajectory;
}

} // anonymous namespace

// ============================================================================
// State machine
// ============================================================================

int projection_years(const Profile& profile) {
    return std::max(0, profile.assumptions.life_expectancy - profile.assumptions.current_age);
}

ProjectionState initial_state(const Profile& profile, const ProjectionConfig& config) {
    ProjectionState state;
    state.year_index = 0;

    Cents total_assets = 0;
    for (const auto& asset : profile.assets) {
        state.asset_balances.push_back(asset.balance);
        total_assets += asset.balance;
    }

    for (const auto& debt : profile.debts) {
        DebtCarry carry;
        carry.balance = debt.principal;
        carry.months_remaining = initial_months_remaining(debt);
        carry.paid_off = debt.principal == 0;
        carry.property_value = debt.property_value;
        carry.paying_pmi = has_pmi_terms(debt) &&
                           should_pay_pmi(debt.principal, *debt.property_value, *debt.pmi_threshold);
        state.debts.push_back(carry);
        state.total_debt += debt.principal;
    }

    state.net_worth = total_assets - state.total_debt;
    state.debt_free = !profile.debts.empty() && state.total_debt == 0;
    state.goal_resolved.assign(profile.goals.size(), false);

    // Thresholds the starting net worth already exceeds are never crossed
    const auto& thresholds = config.net_worth_milestones;
    while (state.next_net_worth_milestone < thresholds.size() &&
           state.net_worth > thresholds[state.next_net_worth_milestone]) {
        ++state.next_net_worth_milestone;
    }
    return state;
}

YearStep advance_year(const ProjectionContext& context, const ProjectionState& state) {
    const Profile& profile = context.profile;
    const Assumptions& assumptions = profile.assumptions;
    const int year_index = state.year_index;
    const int calendar_year = profile.as_of.year + year_index;

    YearStep step;
    TrajectoryYear& year = step.year;
    ProjectionState& next = step.next_state;
    next = state;
    next.year_index = year_index + 1;

    year.year = calendar_year;
    year.age = assumptions.current_age + year_index;

    // 1. Income
    Cents earned_income = 0;
    for (const auto& income : profile.incomes) {
        const IncomeYear result = income_for_year(income, year_index, calendar_year, assumptions.salary_growth);
        year.gross_income += result.gross;
        year.work_hours += result.work_hours;
        if (income.kind != IncomeKind::Passive) {
            earned_income += result.gross;
        }
    }

    // 2. Tax
    Cents pretax_contributions = 0;
    for (const auto& asset : profile.assets) {
        if (asset.kind == AssetKind::RetirementPretax) {
            pretax_contributions += asset.monthly_contribution * 12;
        }
    }
    const TaxSummary tax = estimate_future_tax(context.tables, year.gross_income, year_index, assumptions,
                                               std::min(pretax_contributions, year.gross_income));
    year.federal_tax = tax.federal_tax;
    year.state_tax = tax.state_tax;
    year.fica_tax = tax.total_fica;
    year.total_tax = tax.total_tax;
    year.net_income = tax.net_income;
    year.effective_tax_rate = tax.effective_rate;
    year.marginal_tax_rate = tax.marginal_rate;

    // 3. Debts
    Cents mortgage_balance = 0;
    Cents property_total = 0;
    bool has_mortgage = false;
    for (size_t d = 0; d < profile.debts.size(); ++d) {
        const Debt& debt = profile.debts[d];
        const DebtCarry& carry = state.debts[d];
        DebtCarry& carry_next = next.debts[d];

        DebtState debt_state;
        debt_state.debt_id = debt.id;
        debt_state.name = debt.name;

        const bool pmi_this_year = !carry.paid_off && has_pmi_terms(debt) && carry.property_value &&
                                   should_pay_pmi(carry.balance, *carry.property_value, *debt.pmi_threshold);

        if (carry.paid_off) {
            debt_state.is_paid_off = true;
        } else {
            const DebtYearResult result = debt_year(debt, carry.balance, carry.months_remaining);
            debt_state.remaining_principal = result.end_balance;
            debt_state.interest_paid = result.interest_paid;
            debt_state.principal_paid = result.principal_paid;
            debt_state.months_remaining = result.months_remaining;
            debt_state.is_paid_off = result.is_paid_off;
            if (pmi_this_year) {
                debt_state.pmi_paid = debt.pmi_monthly * result.months_paid;
            }
            if (debt.is_mortgage()) {
                debt_state.escrow_paid = debt.escrow_monthly * result.months_paid;
            }
            debt_state.total_paid = result.total_paid + debt_state.pmi_paid + debt_state.escrow_paid;

            if (result.is_paid_off) {
                step.milestones.push_back(make_milestone(
                    MilestoneKind::DebtPayoff, calendar_year, result.payoff_month.value_or(1),
                    "Paid off " + debt.name, debt.id));
            }

            carry_next.balance = result.end_balance;
            carry_next.months_remaining = result.months_remaining;
            carry_next.paid_off = result.is_paid_off;
        }
        debt_state.paying_pmi = pmi_this_year;

        if (has_pmi_terms(debt) && carry.paying_pmi && !pmi_this_year) {
            step.milestones.push_back(make_milestone(
                MilestoneKind::PmiRemoved, calendar_year, 1, "PMI removed on " + debt.name, debt.id));
        }
        carry_next.paying_pmi = pmi_this_year;

        if (carry.property_value) {
            const Cents appreciated = round_cents(static_cast<double>(*carry.property_value) *
                                                  (1.0 + assumptions.home_appreciation));
            carry_next.property_value = appreciated;
            debt_state.property_value = appreciated;
            if (debt.is_mortgage()) {
                has_mortgage = true;
                mortgage_balance += debt_state.remaining_principal;
                property_total += appreciated;
            }
        }

        year.total_debt += debt_state.remaining_principal;
        year.total_debt_payment += debt_state.total_paid;
        year.total_interest_paid += debt_state.interest_paid;
        year.paying_pmi = year.paying_pmi || pmi_this_year;
        year.debts.push_back(std::move(debt_state));
    }

    if (has_mortgage) {
        year.home_equity = property_total - mortgage_balance;
        year.ltv_ratio = ltv(mortgage_balance, property_total);
    }

    // 4. Assets
    Cents retirement_assets = 0;
    for (size_t a = 0; a < profile.assets.size(); ++a) {
        const Asset& asset = profile.assets[a];
        const AssetYearResult result = asset_year(asset, state.asset_balances[a],
                                                  asset_return(asset, assumptions), earned_income);

        AssetState asset_state;
        asset_state.asset_id = asset.id;
        asset_state.name = asset.name;
        asset_state.kind = asset.kind;
        asset_state.balance = result.ending_balance;
        asset_state.contributions = result.contributions;
        asset_state.employer_match = result.employer_match;
        asset_state.growth = result.growth;

        next.asset_balances[a] = result.ending_balance;
        year.total_assets += result.ending_balance;
        year.total_contributions += result.contributions;
        year.total_employer_match += result.employer_match;
        if (counts_toward_retirement(asset.kind)) {
            retirement_assets += result.ending_balance;
        }
        year.assets.push_back(std::move(asset_state));
    }

    // 5. Totals and cash flow
    year.net_worth = year.total_assets - year.total_debt;
    for (const auto& obligation : profile.obligations) {
        year.total_obligations += obligation_for_year(obligation, year_index, calendar_year,
                                                      assumptions.inflation_rate);
    }
    year.discretionary_income = year.net_income - year.total_debt_payment -
                                year.total_obligations - year.total_contributions;
    year.savings_rate = year.net_income > 0
        ? static_cast<double>(year.total_contributions) / static_cast<double>(year.net_income)
        : 0.0;
    if (year.work_hours > 0.0) {
        year.effective_hourly_rate = round_cents(static_cast<double>(year.net_income) / year.work_hours);
    }

    next.total_debt = year.total_debt;
    next.net_worth = year.net_worth;

    // 6. Milestones
    if (profile.debts.size() > 1 && !state.debt_free && year.total_debt == 0) {
        step.milestones.push_back(make_milestone(MilestoneKind::DebtPayoff, calendar_year, 12, "Debt free"));
    }
    next.debt_free = !profile.debts.empty() && year.total_debt == 0;

    if (!state.retirement_ready && year.gross_income > 0) {
        const Cents desired = round_cents(static_cast<double>(year.gross_income) *
                                          assumptions.income_replacement_ratio);
        const RetirementReadiness readiness = retirement_readiness(
            retirement_assets, desired, assumptions.retirement_withdrawal_rate);
        if (readiness.is_ready) {
            next.retirement_ready = true;
            step.milestones.push_back(make_milestone(
                MilestoneKind::RetirementReady, calendar_year, 12,
                "Retirement ready at age " + std::to_string(year.age)));
        }
    }

    for (size_t g = 0; g < profile.goals.size(); ++g) {
        if (state.goal_resolved[g]) continue;
        const Goal& goal = profile.goals[g];

        Cents progress = year.net_worth;
        if (goal.linked_asset_id) {
            for (size_t a = 0; a < profile.assets.size(); ++a) {
                if (profile.assets[a].id == *goal.linked_asset_id) {
                    progress = next.asset_balances[a];
                    break;
                }
            }
        }

        if (progress >= goal.target_amount && calendar_year <= goal.target_date.year) {
            next.goal_resolved[g] = true;
            step.milestones.push_back(make_milestone(
                MilestoneKind::GoalAchieved, calendar_year, 12, "Achieved " + goal.name, goal.id));
        } else if (calendar_year >= goal.target_date.year) {
            next.goal_resolved[g] = true;
            step.milestones.push_back(make_milestone(
                MilestoneKind::GoalMissed, calendar_year, goal.target_date.month,
                "Missed " + goal.name, goal.id));
        }
    }

    const auto& thresholds = context.config.net_worth_milestones;
    while (next.next_net_worth_milestone < thresholds.size() &&
           year.net_worth > thresholds[next.next_net_worth_milestone]) {
        const Cents threshold = thresholds[next.next_net_worth_milestone];
        step.milestones.push_back(make_milestone(
            MilestoneKind::NetWorthMilestone, calendar_year, 12,
            "Net worth reached " + format_currency_compact(threshold)));
        ++next.next_net_worth_milestone;
    }

    return step;
}

// ============================================================================
// Entry points
// ============================================================================

Trajectory generate_trajectory(const Profile& profile, const ProjectionConfig& config, const TaxTables& tables) {
    check_inputs(profile, config, tables);
    return run(profile, projection_years(profile), config, tables);
}

Trajectory generate_quick_trajectory(const Profile& profile, int years, const ProjectionConfig& config,
                                     const TaxTables& tables) {
    if (years < 1) {
        throw std::invalid_argument("years must be >= 1 (got " + std::to_string(years) + ")");
    }
    check_inputs(profile, config, tables);
    return run(profile, std::min(years, projection_years(profile)), config, tables);
}

} // namespace lifeplan
