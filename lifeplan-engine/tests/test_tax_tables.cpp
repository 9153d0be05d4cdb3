#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "tax_tables.hpp"
#include "tax.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace lifeplan;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

// Two brackets for every status: 10% to $10,000, then 20%
std::string make_federal_csv(int year) {
    const std::string y = std::to_string(year);
    std::ostringstream csv;
    csv << "year,filing_status,kind,threshold,limit,rate\n";
    csv << y << ",all,bracket,0,1000000,0.10\n";
    csv << y << ",all,bracket,1000000,,0.20\n";
    csv << y << ",all,standard_deduction,500000,,\n";
    csv << y << ",married_joint,standard_deduction,1000000,,\n";
    csv << y << ",all,additional_medicare_threshold,20000000,,\n";
    csv << y << ",all,social_security_wage_base,15000000,,\n";
    return csv.str();
}

FederalTaxYear make_flat_year(int year, Rate rate) {
    FederalTaxYear table;
    table.year = year;
    for (auto& brackets : table.brackets) {
        brackets.push_back(TaxBracket{0, std::nullopt, rate});
    }
    table.fica.social_security_wage_base = 10000000;
    table.fica.additional_medicare_threshold.fill(20000000);
    return table;
}

// ============================================================================
// FederalTaxSchedule
// ============================================================================

TEST_CASE("Built-in federal schedule", "[tax_tables]") {
    const FederalTaxSchedule& federal = TaxTables::builtin().federal;

    REQUIRE(federal.size() == 2);
    REQUIRE(federal.earliest_year() == 2024);
    REQUIRE(federal.latest_year() == 2025);

    const FederalTaxYear& y2024 = federal.for_year(2024);
    REQUIRE(y2024.standard_deduction_for(FilingStatus::Single) == 1460000);
    REQUIRE(y2024.standard_deduction_for(FilingStatus::MarriedJoint) == 2920000);
    REQUIRE(y2024.brackets_for(FilingStatus::Single).size() == 7);
    REQUIRE(y2024.fica.social_security_wage_base == 16860000);

    const FederalTaxYear& y2025 = federal.for_year(2025);
    REQUIRE(y2025.standard_deduction_for(FilingStatus::Single) == 1575000);
    REQUIRE(y2025.fica.social_security_wage_base == 17610000);
}

TEST_CASE("Federal schedule year resolution", "[tax_tables]") {
    FederalTaxSchedule schedule;
    schedule.add(make_flat_year(2020, 0.10));
    schedule.add(make_flat_year(2023, 0.20));

    SECTION("Exact year") {
        REQUIRE(schedule.resolve_year(2020) == 2020);
        REQUIRE(schedule.resolve_year(2023) == 2023);
    }

    SECTION("Gap falls back to the latest earlier year") {
        REQUIRE(schedule.resolve_year(2021) == 2020);
        REQUIRE(schedule.resolve_year(2022) == 2020);
    }

    SECTION("After the last table") {
        REQUIRE(schedule.resolve_year(2050) == 2023);
    }

    SECTION("Before the first table uses the earliest") {
        REQUIRE(schedule.resolve_year(1990) == 2020);
    }

    SECTION("for_year returns the resolved table") {
        REQUIRE(schedule.for_year(2030).brackets_for(FilingStatus::Single).front().rate == Approx(0.20));
    }
}

TEST_CASE("Empty federal schedule", "[tax_tables]") {
    FederalTaxSchedule schedule;
    REQUIRE(schedule.empty());
    REQUIRE_THROWS_AS(schedule.resolve_year(2024), std::logic_error);
}

TEST_CASE("FederalTaxYear validation", "[tax_tables]") {
    SECTION("First bracket must start at zero") {
        FederalTaxYear table = make_flat_year(2024, 0.10);
        table.brackets[0].front().min = 100;
        REQUIRE_THROWS_AS(table.validate(), std::invalid_argument);
    }

    SECTION("Brackets must be contiguous") {
        FederalTaxYear table = make_flat_year(2024, 0.10);
        table.brackets[1] = {TaxBracket{0, Cents(1000), 0.10}, TaxBracket{2000, std::nullopt, 0.20}};
        REQUIRE_THROWS_AS(table.validate(), std::invalid_argument);
    }

    SECTION("Top bracket must be open") {
        FederalTaxYear table = make_flat_year(2024, 0.10);
        table.brackets[2].front().max = 5000;
        REQUIRE_THROWS_AS(table.validate(), std::invalid_argument);
    }

    SECTION("Rates within 0-1") {
        FederalTaxYear table = make_flat_year(2024, 1.5);
        REQUIRE_THROWS_AS(table.validate(), std::invalid_argument);
    }

    SECTION("Wage base must be positive") {
        FederalTaxYear table = make_flat_year(2024, 0.10);
        table.fica.social_security_wage_base = 0;
        REQUIRE_THROWS_WITH(table.validate(), ContainsSubstring("wage base"));
    }

    SECTION("Additional Medicare threshold must be positive") {
        FederalTaxYear table = make_flat_year(2024, 0.10);
        table.fica.additional_medicare_threshold[static_cast<size_t>(FilingStatus::MarriedJoint)] = 0;
        REQUIRE_THROWS_WITH(table.validate(), ContainsSubstring("married_joint"));
    }

    SECTION("Add rejects an invalid table") {
        FederalTaxSchedule schedule;
        FederalTaxYear table = make_flat_year(2024, 0.10);
        table.brackets[3].clear();
        REQUIRE_THROWS_AS(schedule.add(table), std::invalid_argument);
        REQUIRE(schedule.empty());
    }
}

TEST_CASE("Federal schedule CSV loading", "[tax_tables][csv]") {
    std::istringstream input(make_federal_csv(2030));
    const FederalTaxSchedule schedule = FederalTaxSchedule::load_from_csv(input);

    REQUIRE(schedule.size() == 1);
    const FederalTaxYear& table = schedule.for_year(2030);

    REQUIRE(table.brackets_for(FilingStatus::Single).size() == 2);
    REQUIRE(table.standard_deduction_for(FilingStatus::Single) == 500000);
    REQUIRE(table.standard_deduction_for(FilingStatus::MarriedJoint) == 1000000);
    REQUIRE(table.fica.social_security_wage_base == 15000000);

    SECTION("Loaded tables drive the tax calculation") {
        TaxTables tables;
        tables.federal = schedule;
        tables.states = state_tax_table_2024();

        // $30,000 - $5,000 deduction = $25,000: 10% of 10,000 + 20% of 15,000
        const FederalTaxResult result =
            calculate_federal_tax(tables, 3000000, FilingStatus::Single, 0, 2030);
        REQUIRE(result.tax == 400000);
        REQUIRE(result.marginal_rate == Approx(0.20));
    }
}

TEST_CASE("Federal schedule CSV errors", "[tax_tables][csv]") {
    SECTION("Unknown row kind") {
        std::istringstream input("year,filing_status,kind,threshold,limit,rate\n2030,all,credit,0,,\n");
        REQUIRE_THROWS_AS(FederalTaxSchedule::load_from_csv(input), std::runtime_error);
    }

    SECTION("Bracket rows need a rate") {
        std::istringstream input("year,filing_status,kind,threshold,limit,rate\n2030,all,bracket,0\n");
        REQUIRE_THROWS_AS(FederalTaxSchedule::load_from_csv(input), std::runtime_error);
    }

    SECTION("Gapped brackets fail validation") {
        std::istringstream input(
            "year,filing_status,kind,threshold,limit,rate\n"
            "2030,all,bracket,0,1000,0.10\n"
            "2030,all,bracket,2000,,0.20\n"
            "2030,all,additional_medicare_threshold,20000000,,\n"
            "2030,all,social_security_wage_base,15000000,,\n");
        REQUIRE_THROWS_AS(FederalTaxSchedule::load_from_csv(input), std::invalid_argument);
    }

    SECTION("Year without FICA rows") {
        std::istringstream input(
            "year,filing_status,kind,threshold,limit,rate\n"
            "2024,all,bracket,0,,0.10\n"
            "2024,all,standard_deduction,1460000,,\n");
        REQUIRE_THROWS_WITH(FederalTaxSchedule::load_from_csv(input),
                            ContainsSubstring("missing social_security_wage_base"));
    }

    SECTION("Medicare threshold missing for one status") {
        std::istringstream input(
            "year,filing_status,kind,threshold,limit,rate\n"
            "2024,all,bracket,0,,0.10\n"
            "2024,single,additional_medicare_threshold,20000000,,\n"
            "2024,married_joint,additional_medicare_threshold,25000000,,\n"
            "2024,married_separate,additional_medicare_threshold,12500000,,\n"
            "2024,all,social_security_wage_base,16860000,,\n");
        REQUIRE_THROWS_WITH(FederalTaxSchedule::load_from_csv(input),
                            ContainsSubstring("additional_medicare_threshold row for head_of_household"));
    }

    SECTION("FICA rows apply only to their own year") {
        std::string csv = make_federal_csv(2024);
        csv += "2025,all,bracket,0,,0.10\n";
        std::istringstream input(csv);
        REQUIRE_THROWS_WITH(FederalTaxSchedule::load_from_csv(input), ContainsSubstring("year 2025"));
    }

    SECTION("Non-numeric threshold names the row and column") {
        std::istringstream input("year,filing_status,kind,threshold,limit,rate\n2024,all,bracket,abc,,0.1\n");
        REQUIRE_THROWS_WITH(FederalTaxSchedule::load_from_csv(input),
                            ContainsSubstring("row 1: threshold 'abc' is not a number"));
    }

    SECTION("Trailing text in a rate") {
        std::istringstream input("year,filing_status,kind,threshold,limit,rate\n2024,all,bracket,0,,10%\n");
        REQUIRE_THROWS_WITH(FederalTaxSchedule::load_from_csv(input), ContainsSubstring("rate '10%'"));
    }

    SECTION("Non-numeric year") {
        std::istringstream input(
            "year,filing_status,kind,threshold,limit,rate\n"
            "2024,all,standard_deduction,1460000,,\n"
            "next,all,bracket,0,,0.10\n");
        REQUIRE_THROWS_WITH(FederalTaxSchedule::load_from_csv(input), ContainsSubstring("row 2: year 'next'"));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(FederalTaxSchedule::load_from_csv(std::string("/nonexistent/federal.csv")),
                          std::runtime_error);
    }
}

// ============================================================================
// StateTaxTable
// ============================================================================

TEST_CASE("Built-in state table", "[tax_tables][state]") {
    const StateTaxTable& states = TaxTables::builtin().states;

    REQUIRE(states.contains("TX"));
    REQUIRE(states.contains("ca"));
    REQUIRE_FALSE(states.contains("ZZ"));

    REQUIRE(states.get("TX").kind == StateTaxKind::None);
    REQUIRE(states.get("IL").kind == StateTaxKind::Flat);
    REQUIRE(states.get("IL").rate == Approx(0.0495));
    REQUIRE(states.get("CA").kind == StateTaxKind::Progressive);
    REQUIRE(states.get("CA").rate == Approx(0.133));

    const auto none = states.no_income_tax_codes();
    REQUIRE(std::find(none.begin(), none.end(), "TX") != none.end());
    REQUIRE(std::find(none.begin(), none.end(), "FL") != none.end());
    REQUIRE(std::find(none.begin(), none.end(), "CA") == none.end());

    REQUIRE_THROWS_AS(states.get("ZZ"), std::invalid_argument);
}

TEST_CASE("State table CSV loading", "[tax_tables][state][csv]") {
    std::istringstream input(
        "code,name,kind,rate,standard_deduction\n"
        "tx,Texas,none,0,0\n"
        "CO,Colorado,flat,0.044,0\n"
        "OR,Oregon,progressive,0.099,260500\n");
    const StateTaxTable table = StateTaxTable::load_from_csv(input);

    REQUIRE(table.size() == 3);
    REQUIRE(table.get("TX").name == "Texas");
    REQUIRE(table.get("co").rate == Approx(0.044));
    REQUIRE(table.get("OR").standard_deduction == 260500);

    SECTION("Unknown kind") {
        std::istringstream bad("code,name,kind,rate,standard_deduction\nXX,Nowhere,sliding,0.1,0\n");
        REQUIRE_THROWS_AS(StateTaxTable::load_from_csv(bad), std::runtime_error);
    }

    SECTION("Rate outside 0-1") {
        std::istringstream bad("code,name,kind,rate,standard_deduction\nXX,Nowhere,flat,1.5,0\n");
        REQUIRE_THROWS_AS(StateTaxTable::load_from_csv(bad), std::invalid_argument);
    }

    SECTION("Non-numeric rate") {
        std::istringstream bad("code,name,kind,rate,standard_deduction\nTX,Texas,none,0,0\nXX,Nowhere,flat,high,0\n");
        REQUIRE_THROWS_WITH(StateTaxTable::load_from_csv(bad), ContainsSubstring("row 2: rate 'high' is not a number"));
    }

    SECTION("Non-numeric standard deduction") {
        std::istringstream bad("code,name,kind,rate,standard_deduction\nXX,Nowhere,flat,0.05,n/a\n");
        REQUIRE_THROWS_WITH(StateTaxTable::load_from_csv(bad), ContainsSubstring("standard_deduction 'n/a'"));
    }
}
