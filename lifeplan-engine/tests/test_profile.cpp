#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "profile.hpp"
#include <stdexcept>

using namespace lifeplan;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

Profile make_valid_profile() {
    Profile profile;
    profile.id = "profile-1";
    profile.name = "Test";
    profile.as_of = YearMonth(2024, 1);

    Income salary;
    salary.id = "income-1";
    salary.name = "Salary";
    salary.amount = 8000000;
    profile.incomes.push_back(salary);

    Debt loan;
    loan.id = "debt-1";
    loan.name = "Car Loan";
    loan.kind = DebtKind::Auto;
    loan.principal = 2000000;
    loan.interest_rate = 0.06;
    loan.term_months = 60;
    loan.months_remaining = 48;
    profile.debts.push_back(loan);

    Asset savings;
    savings.id = "asset-1";
    savings.name = "Savings";
    savings.balance = 1000000;
    profile.assets.push_back(savings);

    Goal goal;
    goal.id = "goal-1";
    goal.name = "Emergency Fund";
    goal.target_amount = 2000000;
    goal.target_date = YearMonth(2026, 12);
    goal.linked_asset_id = "asset-1";
    profile.goals.push_back(goal);

    return profile;
}

// ============================================================================
// Enum names
// ============================================================================

TEST_CASE("Enum names parse back to their values", "[profile]") {
    for (FilingStatus s : {FilingStatus::Single, FilingStatus::MarriedJoint,
                           FilingStatus::MarriedSeparate, FilingStatus::HeadOfHousehold}) {
        REQUIRE(parse_filing_status(to_string(s)) == s);
    }
    for (IncomeKind k : {IncomeKind::Salary, IncomeKind::Hourly, IncomeKind::Variable, IncomeKind::Passive}) {
        REQUIRE(parse_income_kind(to_string(k)) == k);
    }
    for (DebtKind k : {DebtKind::Mortgage, DebtKind::Student, DebtKind::Auto,
                       DebtKind::Credit, DebtKind::Personal, DebtKind::Other}) {
        REQUIRE(parse_debt_kind(to_string(k)) == k);
    }
    for (AssetKind k : {AssetKind::RetirementPretax, AssetKind::RetirementRoth, AssetKind::Savings,
                        AssetKind::Investment, AssetKind::Property, AssetKind::Other}) {
        REQUIRE(parse_asset_kind(to_string(k)) == k);
    }
}

TEST_CASE("Unknown enum names are rejected", "[profile]") {
    REQUIRE_THROWS_AS(parse_filing_status("married"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_income_kind("bonus"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_debt_kind("payday"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_asset_kind("crypto"), std::invalid_argument);
}

TEST_CASE("Debt and asset helpers", "[profile]") {
    Debt debt;
    REQUIRE_FALSE(debt.is_mortgage());
    debt.property_value = 40000000;
    REQUIRE(debt.is_mortgage());

    Asset asset;
    REQUIRE_FALSE(asset.has_employer_match());
    asset.employer_match = 0.5;
    REQUIRE_FALSE(asset.has_employer_match());
    asset.match_limit = 0.06;
    REQUIRE(asset.has_employer_match());
}

TEST_CASE("Profile find_asset", "[profile]") {
    const Profile profile = make_valid_profile();
    REQUIRE(profile.find_asset("asset-1") != nullptr);
    REQUIRE(profile.find_asset("asset-1")->name == "Savings");
    REQUIRE(profile.find_asset("missing") == nullptr);
}

// ============================================================================
// validate_profile
// ============================================================================

TEST_CASE("validate_profile accepts a valid profile", "[profile][validation]") {
    REQUIRE_NOTHROW(validate_profile(make_valid_profile()));
}

TEST_CASE("validate_profile names the offending field", "[profile][validation]") {
    Profile profile = make_valid_profile();

    SECTION("Negative interest rate") {
        profile.debts[0].interest_rate = -0.05;
        try {
            validate_profile(profile);
            FAIL("Expected ProfileValidationError");
        } catch (const ProfileValidationError& e) {
            REQUIRE(e.field() == "debts[0] (Car Loan).interest_rate");
            REQUIRE_THAT(std::string(e.what()), ContainsSubstring("must be >= 0"));
        }
    }

    SECTION("Negative principal") {
        profile.debts[0].principal = -100;
        REQUIRE_THROWS_AS(validate_profile(profile), ProfileValidationError);
    }

    SECTION("Remaining months beyond the term") {
        profile.debts[0].months_remaining = 72;
        REQUIRE_THROWS_WITH(validate_profile(profile), ContainsSubstring("months_remaining"));
    }

    SECTION("Negative asset balance") {
        profile.assets[0].balance = -1;
        REQUIRE_THROWS_AS(validate_profile(profile), ProfileValidationError);
    }

    SECTION("Hourly income without hours") {
        profile.incomes[0].kind = IncomeKind::Hourly;
        REQUIRE_THROWS_WITH(validate_profile(profile), ContainsSubstring("hours_per_week"));
    }

    SECTION("Variability outside 0-1") {
        profile.incomes[0].variability = 1.5;
        REQUIRE_THROWS_AS(validate_profile(profile), ProfileValidationError);
    }

    SECTION("Match limit outside 0-1") {
        profile.assets[0].match_limit = 2.0;
        REQUIRE_THROWS_AS(validate_profile(profile), ProfileValidationError);
    }

    SECTION("Goal linked to an unknown asset") {
        profile.goals[0].linked_asset_id = "asset-9";
        REQUIRE_THROWS_WITH(validate_profile(profile), ContainsSubstring("asset-9"));
    }

    SECTION("Month outside 1-12") {
        profile.goals[0].target_date = YearMonth(2026, 13);
        REQUIRE_THROWS_AS(validate_profile(profile), ProfileValidationError);
    }

    SECTION("Life expectancy at or below current age") {
        profile.assumptions.current_age = 90;
        profile.assumptions.life_expectancy = 90;
        REQUIRE_THROWS_WITH(validate_profile(profile), ContainsSubstring("life_expectancy"));
    }

    SECTION("Malformed state code") {
        profile.assumptions.state = "Texas";
        REQUIRE_THROWS_WITH(validate_profile(profile), ContainsSubstring("assumptions.state"));
    }

    SECTION("Return below -100%") {
        profile.assumptions.market_return = -1.0;
        REQUIRE_THROWS_AS(validate_profile(profile), ProfileValidationError);
    }

    SECTION("ProfileValidationError is an invalid_argument") {
        profile.debts[0].interest_rate = -0.05;
        REQUIRE_THROWS_AS(validate_profile(profile), std::invalid_argument);
    }
}

TEST_CASE("Assumptions equality", "[profile]") {
    Assumptions a;
    Assumptions b;
    REQUIRE(a == b);
    b.market_return = 0.05;
    REQUIRE_FALSE(a == b);
}
