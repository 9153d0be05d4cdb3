#ifndef LIFEPLAN_PROFILE_HPP
#define LIFEPLAN_PROFILE_HPP

#include "money.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lifeplan {

enum class FilingStatus : uint8_t {
    Single = 0,
    MarriedJoint = 1,
    MarriedSeparate = 2,
    HeadOfHousehold = 3
};

enum class IncomeKind : uint8_t {
    Salary = 0,
    Hourly = 1,
    Variable = 2,
    Passive = 3
};

enum class DebtKind : uint8_t {
    Mortgage = 0,
    Student = 1,
    Auto = 2,
    Credit = 3,
    Personal = 4,
    Other = 5
};

enum class AssetKind : uint8_t {
    RetirementPretax = 0,
    RetirementRoth = 1,
    Savings = 2,
    Investment = 3,
    Property = 4,
    Other = 5
};

// Snake-case names used in configuration files and JSON output
std::string to_string(FilingStatus status);
std::string to_string(IncomeKind kind);
std::string to_string(DebtKind kind);
std::string to_string(AssetKind kind);

// Throw std::invalid_argument on an unknown name
FilingStatus parse_filing_status(const std::string& name);
IncomeKind parse_income_kind(const std::string& name);
DebtKind parse_debt_kind(const std::string& name);
AssetKind parse_asset_kind(const std::string& name);

struct Income {
    std::string id;
    std::string name;
    IncomeKind kind = IncomeKind::Salary;
    Cents amount = 0;                           // Annual cents, or hourly rate cents for Hourly
    double hours_per_week = 0.0;                // 0 = default (40 for salary)
    double variability = 0.0;                   // 0-1, informational for variable income
    std::optional<Rate> growth_rate;            // Falls back to assumptions.salary_growth
    std::optional<YearMonth> end;               // Last month the income is received
};

struct Debt {
    std::string id;
    std::string name;
    DebtKind kind = DebtKind::Other;
    Cents principal = 0;
    Rate interest_rate = 0.0;                   // Annual
    Cents minimum_payment = 0;                  // Monthly
    Cents actual_payment = 0;                   // Monthly
    int term_months = 0;                        // Original term, 0 = open-ended
    int months_remaining = 0;                   // 0 = open-ended

    // Mortgage fields
    std::optional<Cents> property_value;
    std::optional<Rate> pmi_threshold;          // PMI charged while LTV exceeds this
    Cents pmi_monthly = 0;
    Cents escrow_monthly = 0;

    bool is_mortgage() const { return property_value.has_value() && *property_value > 0; }
};

struct Asset {
    std::string id;
    std::string name;
    AssetKind kind = AssetKind::Savings;
    Cents balance = 0;
    Cents monthly_contribution = 0;
    std::optional<Rate> expected_return;        // Falls back to market return or home appreciation
    std::optional<Rate> employer_match;         // Match rate, e.g. 0.5 = 50%
    std::optional<Rate> match_limit;            // Fraction of salary eligible for match

    bool has_employer_match() const {
        return employer_match.has_value() && match_limit.has_value();
    }
};

struct Obligation {
    std::string id;
    std::string name;
    Cents monthly_amount = 0;
    bool inflation_adjusted = false;
    std::optional<YearMonth> end;
};

struct Goal {
    std::string id;
    std::string name;
    Cents target_amount = 0;
    YearMonth target_date;
    std::optional<std::string> linked_asset_id; // Progress tracks net worth when unset
};

struct Assumptions {
    Rate inflation_rate = 0.03;
    Rate market_return = 0.07;
    Rate home_appreciation = 0.03;
    Rate salary_growth = 0.02;
    Rate retirement_withdrawal_rate = 0.04;
    Rate income_replacement_ratio = 0.80;
    int life_expectancy = 90;
    int current_age = 30;
    FilingStatus filing_status = FilingStatus::Single;
    std::string state = "TX";
    int tax_year = 2024;

    bool operator==(const Assumptions& other) const;
};

// Immutable per-run input to the trajectory engine
struct Profile {
    std::string id;
    std::string name;
    YearMonth as_of;                            // Year 0 of the projection is as_of.year
    std::vector<Income> incomes;
    std::vector<Debt> debts;
    std::vector<Asset> assets;
    std::vector<Obligation> obligations;
    std::vector<Goal> goals;
    Assumptions assumptions;

    const Asset* find_asset(const std::string& asset_id) const;
};

// Raised when a profile violates a basic precondition
class ProfileValidationError : public std::invalid_argument {
public:
    ProfileValidationError(const std::string& field, const std::string& message)
        : std::invalid_argument(field + " " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Check every entity and assumption; throws ProfileValidationError on the first violation
void validate_profile(const Profile& profile);

} // namespace lifeplan

#endif // LIFEPLAN_PROFILE_HPP
