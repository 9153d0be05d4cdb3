#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/profile_loader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace lifeplan;
using namespace lifeplan::io;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("parse_year_month", "[profile_loader]") {
    SECTION("Valid month") {
        const YearMonth ym = parse_year_month("2031-09");
        REQUIRE(ym.year == 2031);
        REQUIRE(ym.month == 9);
    }

    SECTION("Malformed text") {
        REQUIRE_THROWS_AS(parse_year_month("2031-9"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_year_month("2031/09"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_year_month("2031-09-01"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_year_month("September"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_year_month(""), ConfigParseError);
    }

    SECTION("Month out of range") {
        REQUIRE_THROWS_WITH(parse_year_month("2031-13"), ContainsSubstring("01-12"));
        REQUIRE_THROWS_AS(parse_year_month("2031-00"), ConfigParseError);
    }
}

TEST_CASE("JSON profile parsing", "[profile_loader]") {
    SECTION("Parse minimal profile") {
        std::string json = R"({
            "as_of": "2024-01"
        })";

        const Profile profile = parse_profile_json(json);
        REQUIRE(profile.id == "profile");
        REQUIRE(profile.as_of == YearMonth(2024, 1));
        REQUIRE(profile.incomes.empty());
        REQUIRE(profile.debts.empty());
        REQUIRE(profile.assumptions.tax_year == 2024);
        REQUIRE(profile.assumptions.state == "TX");
        REQUIRE(profile.assumptions.market_return == 0.07);
    }

    SECTION("Parse full household") {
        std::string json = R"({
            "id": "smith",
            "name": "Smith Household",
            "as_of": "2025-03",
            "incomes": [
                {"id": "salary", "name": "Salary", "type": "salary", "amount": 95000, "growth_rate": 0.025},
                {"name": "Consulting", "type": "hourly", "amount": 85.5, "hours_per_week": 10, "end": "2027-06"}
            ],
            "debts": [
                {
                    "id": "mortgage", "name": "Mortgage", "type": "mortgage",
                    "principal": 320000, "interest_rate": 0.0625,
                    "actual_payment": 2100, "term_months": 360, "months_remaining": 340,
                    "property_value": 400000, "pmi_threshold": 0.8,
                    "pmi_monthly": 120, "escrow_monthly": 450.25
                },
                {"id": "car", "name": "Car", "type": "auto", "principal": 18000.99, "interest_rate": 0.059}
            ],
            "assets": [
                {
                    "id": "401k", "name": "401(k)", "type": "retirement_pretax",
                    "balance": 42000, "monthly_contribution": 800,
                    "employer_match": 0.5, "match_limit": 0.06
                },
                {"id": "hysa", "name": "HYSA", "balance": 12000, "expected_return": 0.045}
            ],
            "obligations": [
                {"name": "Daycare", "monthly_amount": 1400, "inflation_adjusted": true, "end": "2028-08"}
            ],
            "goals": [
                {"name": "Emergency Fund", "target_amount": 25000, "target_date": "2026-12", "linked_asset_id": "hysa"}
            ],
            "assumptions": {
                "current_age": 34,
                "life_expectancy": 92,
                "filing_status": "married_joint",
                "state": "CA",
                "market_return": 0.065
            }
        })";

        const Profile profile = parse_profile_json(json);
        REQUIRE(profile.id == "smith");
        REQUIRE(profile.name == "Smith Household");

        REQUIRE(profile.incomes.size() == 2);
        REQUIRE(profile.incomes[0].amount == 9500000);
        REQUIRE(profile.incomes[0].growth_rate == 0.025);
        REQUIRE(profile.incomes[1].id == "income-2");
        REQUIRE(profile.incomes[1].kind == IncomeKind::Hourly);
        REQUIRE(profile.incomes[1].amount == 8550);
        REQUIRE_FALSE(profile.incomes[1].growth_rate.has_value());
        REQUIRE(profile.incomes[1].end == YearMonth(2027, 6));

        REQUIRE(profile.debts.size() == 2);
        const Debt& mortgage = profile.debts[0];
        REQUIRE(mortgage.kind == DebtKind::Mortgage);
        REQUIRE(mortgage.is_mortgage());
        REQUIRE(mortgage.principal == 32000000);
        REQUIRE(mortgage.actual_payment == 210000);
        REQUIRE(mortgage.months_remaining == 340);
        REQUIRE(mortgage.property_value == 40000000);
        REQUIRE(mortgage.pmi_threshold == 0.8);
        REQUIRE(mortgage.escrow_monthly == 45025);
        REQUIRE(profile.debts[1].principal == 1800099);
        REQUIRE_FALSE(profile.debts[1].property_value.has_value());

        REQUIRE(profile.assets[0].has_employer_match());
        REQUIRE(profile.assets[0].monthly_contribution == 80000);
        REQUIRE(profile.assets[1].kind == AssetKind::Savings);
        REQUIRE(profile.assets[1].expected_return == 0.045);

        REQUIRE(profile.obligations[0].id == "obligation-1");
        REQUIRE(profile.obligations[0].inflation_adjusted);
        REQUIRE(profile.obligations[0].monthly_amount == 140000);

        REQUIRE(profile.goals[0].target_amount == 2500000);
        REQUIRE(profile.goals[0].target_date == YearMonth(2026, 12));
        REQUIRE(profile.goals[0].linked_asset_id == std::string("hysa"));

        REQUIRE(profile.assumptions.current_age == 34);
        REQUIRE(profile.assumptions.life_expectancy == 92);
        REQUIRE(profile.assumptions.filing_status == FilingStatus::MarriedJoint);
        REQUIRE(profile.assumptions.state == "CA");
        REQUIRE(profile.assumptions.market_return == 0.065);
        REQUIRE(profile.assumptions.inflation_rate == 0.03);
        REQUIRE(profile.assumptions.tax_year == 2025);
    }

    SECTION("Missing as_of should fail") {
        std::string json = R"({"id": "p"})";
        REQUIRE_THROWS_WITH(parse_profile_json(json), ContainsSubstring("as_of"));
    }

    SECTION("Missing income amount should fail") {
        std::string json = R"({"as_of": "2024-01", "incomes": [{"id": "salary"}]})";
        REQUIRE_THROWS_AS(parse_profile_json(json), ConfigParseError);
    }

    SECTION("Missing debt principal should fail") {
        std::string json = R"({"as_of": "2024-01", "debts": [{"id": "car", "interest_rate": 0.05}]})";
        REQUIRE_THROWS_WITH(parse_profile_json(json), ContainsSubstring("principal"));
    }

    SECTION("Missing goal date should fail") {
        std::string json = R"({"as_of": "2024-01", "goals": [{"name": "House", "target_amount": 60000}]})";
        REQUIRE_THROWS_WITH(parse_profile_json(json), ContainsSubstring("target_date"));
    }

    SECTION("Unknown enum name should fail") {
        std::string json = R"({"as_of": "2024-01", "assets": [{"type": "crypto", "balance": 10}]})";
        REQUIRE_THROWS_WITH(parse_profile_json(json), ContainsSubstring("Invalid type"));
    }

    SECTION("Collection that is not an array should fail") {
        std::string json = R"({"as_of": "2024-01", "debts": {"id": "car"}})";
        REQUIRE_THROWS_WITH(parse_profile_json(json), ContainsSubstring("debts"));
    }

    SECTION("Wrong value type should fail") {
        std::string json = R"({"as_of": "2024-01", "incomes": [{"amount": "lots"}]})";
        REQUIRE_THROWS_AS(parse_profile_json(json), ConfigParseError);
    }

    SECTION("Invalid JSON should fail") {
        std::string json = "not valid json";
        REQUIRE_THROWS_AS(parse_profile_json(json), ConfigParseError);
    }

    SECTION("Document that is not an object should fail") {
        REQUIRE_THROWS_AS(parse_profile_json("[1, 2, 3]"), ConfigParseError);
    }

    SECTION("Parsed profile is validated") {
        std::string json = R"({
            "as_of": "2024-01",
            "debts": [{"name": "Car", "principal": 10000, "interest_rate": -0.01}]
        })";
        REQUIRE_THROWS_AS(parse_profile_json(json), ProfileValidationError);
    }
}

TEST_CASE("load_profile_json", "[profile_loader]") {
    SECTION("Reads a file") {
        const std::string path = "test_profile_loader.json";
        {
            std::ofstream file(path);
            file << R"({"id": "file", "as_of": "2024-06", "incomes": [{"amount": 50000}]})";
        }

        const Profile profile = load_profile_json(path);
        REQUIRE(profile.id == "file");
        REQUIRE(profile.incomes[0].amount == 5000000);

        // Cleanup
        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_WITH(load_profile_json("does_not_exist.json"), ContainsSubstring("Failed to open"));
    }
}
