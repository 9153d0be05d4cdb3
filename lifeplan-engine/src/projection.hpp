#ifndef LIFEPLAN_PROJECTION_HPP
#define LIFEPLAN_PROJECTION_HPP

#include "money.hpp"
#include "profile.hpp"
#include "tax_tables.hpp"
#include "trajectory.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lifeplan {

constexpr int DEFAULT_QUICK_YEARS = 10;

// $100K, $250K, $500K, $1M, $2.5M, $5M, $10M
std::vector<Cents> default_net_worth_milestones();

// Configuration options for a projection run
struct ProjectionConfig {
    std::vector<Cents> net_worth_milestones;    // Strictly increasing, positive
    std::optional<std::string> generated_at;    // Defaults to the profile's as-of month

    ProjectionConfig();

    // Throws std::invalid_argument when thresholds are not positive and strictly increasing
    void validate() const;
};

// Running state of one debt between years
struct DebtCarry {
    Cents balance = 0;
    int months_remaining = 0;           // 0 = open-ended
    bool paid_off = false;
    std::optional<Cents> property_value;
    bool paying_pmi = false;            // PMI charged in the previous year
};

// Everything carried from one simulated year into the next
struct ProjectionState {
    int year_index = 0;
    std::vector<DebtCarry> debts;       // Parallel to profile.debts
    std::vector<Cents> asset_balances;  // Parallel to profile.assets
    Cents total_debt = 0;
    Cents net_worth = 0;
    size_t next_net_worth_milestone = 0;// Index into config.net_worth_milestones
    bool retirement_ready = false;
    bool debt_free = false;
    std::vector<bool> goal_resolved;    // Parallel to profile.goals
};

// Inputs shared by every year of one run
struct ProjectionContext {
    const Profile& profile;
    const ProjectionConfig& config;
    const TaxTables& tables;
};

// Output of advancing one year
struct YearStep {
    TrajectoryYear year;
    std::vector<Milestone> milestones;
    ProjectionState next_state;
};

// Number of simulated years: life_expectancy - current_age
int projection_years(const Profile& profile);

// Starting balances from the profile. Net-worth thresholds already exceeded
// by the starting net worth are skipped.
ProjectionState initial_state(const Profile& profile, const ProjectionConfig& config);

// Advance one simulated year
//
// Per year, in order:
//   1. Income for the year (growth, end-date proration)
//   2. Tax on gross income less pre-tax retirement contributions
//   3. Debts advanced from the previous year's ending balance
//   4. Assets grown, with employer match keyed off this year's earned income
//   5. Totals, cash flow and savings rate
//   6. Milestones from the change against the carried state
YearStep advance_year(const ProjectionContext& context, const ProjectionState& state);

// Full projection from current_age to life_expectancy
// Throws ProfileValidationError or std::invalid_argument on malformed input.
Trajectory generate_trajectory(
    const Profile& profile,
    const ProjectionConfig& config = ProjectionConfig(),
    const TaxTables& tables = TaxTables::builtin()
);

// Same projection truncated to at most years (>= 1)
Trajectory generate_quick_trajectory(
    const Profile& profile,
    int years = DEFAULT_QUICK_YEARS,
    const ProjectionConfig& config = ProjectionConfig(),
    const TaxTables& tables = TaxTables::builtin()
);

} // namespace lifeplan

#endif // LIFEPLAN_PROJECTION_HPP
