#ifndef LIFEPLAN_COMPARISON_HPP
#define LIFEPLAN_COMPARISON_HPP

#include "money.hpp"
#include "profile.hpp"
#include "trajectory.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lifeplan {

// ============================================================================
// Changes
// ============================================================================

struct IncomeAmountChange {
    std::string income_id;
    Cents old_amount;
    Cents new_amount;
};

struct IncomeGrowthChange {
    std::string income_id;
    std::optional<Rate> old_rate;
    Rate new_rate;
};

struct DebtRateChange {
    std::string debt_id;
    Rate old_rate;
    Rate new_rate;
};

struct DebtPaymentChange {
    std::string debt_id;
    Cents old_payment;                  // Monthly actual payment
    Cents new_payment;
};

struct AssetContributionChange {
    std::string asset_id;
    Cents old_contribution;             // Monthly
    Cents new_contribution;
};

struct AssetReturnChange {
    std::string asset_id;
    std::optional<Rate> old_return;
    Rate new_return;
};

enum class AssumptionField : uint8_t {
    InflationRate,
    MarketReturn,
    HomeAppreciation,
    SalaryGrowth,
    RetirementWithdrawalRate,
    IncomeReplacementRatio,
    LifeExpectancy,
    CurrentAge
};

std::string to_string(AssumptionField field);

// Numeric assumption; ages are whole years stored as double
struct AssumptionChange {
    AssumptionField field;
    double old_value;
    double new_value;
};

struct FilingStatusChange {
    FilingStatus old_status;
    FilingStatus new_status;
};

struct StateChange {
    std::string old_state;
    std::string new_state;
};

using ChangeDetail = std::variant<
    IncomeAmountChange,
    IncomeGrowthChange,
    DebtRateChange,
    DebtPaymentChange,
    AssetContributionChange,
    AssetReturnChange,
    AssumptionChange,
    FilingStatusChange,
    StateChange
>;

struct Change {
    ChangeDetail detail;
    std::string description;
};

// Default human-readable description, e.g. "Monthly contribution: $500 -> $1.0K"
std::string describe_change(const ChangeDetail& detail);

// Change with the default description
Change make_change(ChangeDetail detail);

// Copy of profile with every change's new value applied in order
// Throws std::invalid_argument when a change names an unknown entity id.
Profile apply_changes(const Profile& profile, const std::vector<Change>& changes);

// ============================================================================
// Deltas and summary
// ============================================================================

// Alternate minus baseline for one matched calendar year
struct YearDelta {
    int year;
    int age;
    Cents net_worth_delta;
    Cents income_delta;                 // Gross income
    Cents net_income_delta;
    Cents taxes_delta;
    Cents debt_delta;
    Cents assets_delta;
    double work_hours_delta;
};

YearDelta calculate_year_delta(const TrajectoryYear& baseline, const TrajectoryYear& alternate);

// Neither trajectory reaches retirement readiness
struct RetirementNeither {};
// Both do; negative months = alternate retires earlier
struct RetirementShift { int months; };
// Only the alternate does
struct RetirementEnabled {};
// Only the baseline does
struct RetirementDisabled {};

using RetirementDateDelta = std::variant<RetirementNeither, RetirementShift, RetirementEnabled, RetirementDisabled>;

RetirementDateDelta retirement_date_delta(const TrajectorySummary& baseline, const TrajectorySummary& alternate);

struct ComparisonSummary {
    RetirementDateDelta retirement_date_delta = RetirementNeither{};
    Cents lifetime_interest_delta = 0;
    Cents net_worth_at_retirement_delta = 0;
    double work_hours_delta = 0.0;
    Cents net_worth_at_end_delta = 0;
    std::string key_insight;
};

// Materiality thresholds for the key insight
constexpr Cents INSIGHT_NET_WORTH_THRESHOLD = 10000000;     // $100,000
constexpr Cents INSIGHT_INTEREST_THRESHOLD = 100000;        // $1,000
constexpr double INSIGHT_WORK_HOURS_THRESHOLD = 2080.0;     // One work-year

// Sentence fragments joined by ". " for every delta past its threshold,
// or "Minimal difference between scenarios" when none qualify
std::string generate_key_insight(const ComparisonSummary& summary);

struct Comparison {
    std::string name;
    Trajectory baseline;
    Trajectory alternate;
    std::vector<Change> changes;
    std::vector<YearDelta> deltas;
    ComparisonSummary summary;
};

// Align by calendar year and diff; only overlapping years produce deltas.
// Throws std::invalid_argument when the first years disagree on year or age.
Comparison compare_trajectories(
    const Trajectory& baseline,
    const Trajectory& alternate,
    const std::vector<Change>& changes,
    const std::string& name = "Comparison"
);

// ============================================================================
// Auxiliary analyses
// ============================================================================

// Year with the largest absolute net-worth delta (earliest on ties)
std::optional<YearDelta> find_max_divergence_year(const std::vector<YearDelta>& deltas);

// First year whose net-worth delta changes sign against the previous year
std::optional<int> find_crossover_year(const std::vector<YearDelta>& deltas);

// First year at which the running sum of net-worth deltas is positive
std::optional<int> find_break_even_year(const std::vector<YearDelta>& deltas);

struct CumulativeImpact {
    Cents total_net_worth_delta = 0;    // Net-worth delta of the last year in range
    Cents total_income_delta = 0;
    Cents total_taxes_delta = 0;
    Cents average_yearly_benefit = 0;   // total_net_worth_delta / years in range
};

// Over deltas with start_year <= year <= end_year
CumulativeImpact calculate_cumulative_impact(const std::vector<YearDelta>& deltas, int start_year, int end_year);

struct ComparisonAtYear {
    const TrajectoryYear* baseline = nullptr;
    const TrajectoryYear* alternate = nullptr;
    const YearDelta* delta = nullptr;
};

// Pointers into comparison; each is nullptr when that side has no such year
ComparisonAtYear comparison_at_year(const Comparison& comparison, int year);

} // namespace lifeplan

#endif // LIFEPLAN_COMPARISON_HPP
