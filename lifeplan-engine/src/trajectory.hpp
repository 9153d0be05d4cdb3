#ifndef LIFEPLAN_TRAJECTORY_HPP
#define LIFEPLAN_TRAJECTORY_HPP

#include "money.hpp"
#include "profile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lifeplan {

// State of one debt at the end of a simulated year
struct DebtState {
    std::string debt_id;
    std::string name;
    Cents remaining_principal = 0;
    Cents interest_paid = 0;            // This year
    Cents principal_paid = 0;           // This year
    Cents pmi_paid = 0;                 // This year
    Cents escrow_paid = 0;              // This year
    Cents total_paid = 0;               // Principal + interest + PMI + escrow
    int months_remaining = 0;           // 0 = open-ended or paid off
    bool is_paid_off = false;
    std::optional<Cents> property_value;// End-of-year value for mortgages
    bool paying_pmi = false;
};

// State of one asset at the end of a simulated year
struct AssetState {
    std::string asset_id;
    std::string name;
    AssetKind kind = AssetKind::Savings;
    Cents balance = 0;
    Cents contributions = 0;            // Holder contributions this year
    Cents employer_match = 0;           // This year
    Cents growth = 0;                   // This year
};

// Complete snapshot of one simulated year
struct TrajectoryYear {
    int year = 0;                       // Calendar year
    int age = 0;

    // Income and tax
    Cents gross_income = 0;
    Cents federal_tax = 0;
    Cents state_tax = 0;
    Cents fica_tax = 0;
    Cents total_tax = 0;
    Cents net_income = 0;
    Rate effective_tax_rate = 0.0;
    Rate marginal_tax_rate = 0.0;

    std::vector<DebtState> debts;
    std::vector<AssetState> assets;

    // Totals; net_worth == total_assets - total_debt
    Cents total_debt = 0;
    Cents total_assets = 0;
    Cents net_worth = 0;
    Cents total_debt_payment = 0;
    Cents total_interest_paid = 0;
    Cents total_contributions = 0;      // Holder contributions across assets
    Cents total_employer_match = 0;

    // Cash flow
    Cents total_obligations = 0;
    Cents discretionary_income = 0;     // net - debt payments - obligations - contributions
    Rate savings_rate = 0.0;            // contributions / net income, 0 when net <= 0

    // Mortgage (present when the profile has a mortgage with a property value)
    std::optional<Cents> home_equity;   // Property value - mortgage balance, signed
    std::optional<double> ltv_ratio;
    bool paying_pmi = false;

    // Work
    double work_hours = 0.0;
    Cents effective_hourly_rate = 0;    // Net income per work hour, 0 without hours
};

enum class MilestoneKind : uint8_t {
    DebtPayoff = 0,
    GoalAchieved = 1,
    GoalMissed = 2,
    RetirementReady = 3,
    PmiRemoved = 4,
    NetWorthMilestone = 5
};

std::string to_string(MilestoneKind kind);

struct Milestone {
    MilestoneKind kind;
    int year;                           // Calendar year
    int month;                          // 1-12
    std::string description;
    std::optional<std::string> related_id;
};

struct TrajectorySummary {
    int total_years = 0;
    std::optional<int> retirement_year;
    std::optional<int> retirement_age;
    Cents lifetime_income = 0;
    Cents lifetime_taxes = 0;
    Cents lifetime_interest = 0;
    Cents lifetime_net_income = 0;
    Cents lifetime_employer_match = 0;
    Cents lifetime_contributions = 0;
    Cents net_worth_at_retirement = 0;  // 0 when never retirement ready
    Cents net_worth_at_end = 0;
    double lifetime_work_hours = 0.0;
    Cents average_effective_hourly_rate = 0;
    int goals_achieved = 0;
    int goals_missed = 0;
};

struct Trajectory {
    std::string profile_id;
    std::string generated_at;
    std::vector<TrajectoryYear> years;
    std::vector<Milestone> milestones;
    TrajectorySummary summary;

    const TrajectoryYear* find_year(int year) const;
};

} // namespace lifeplan

#endif // LIFEPLAN_TRAJECTORY_HPP
