#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "growth.hpp"
#include <cmath>
#include <stdexcept>

using namespace lifeplan;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

Asset make_401k(Cents balance, Cents monthly_contribution, Rate match_rate = 0.5, Rate match_limit = 0.06) {
    Asset asset;
    asset.id = "asset-1";
    asset.name = "401(k)";
    asset.kind = AssetKind::RetirementPretax;
    asset.balance = balance;
    asset.monthly_contribution = monthly_contribution;
    asset.employer_match = match_rate;
    asset.match_limit = match_limit;
    return asset;
}

// ============================================================================
// yearly_growth
// ============================================================================

TEST_CASE("yearly_growth with zero return adds contributions", "[growth]") {
    const GrowthResult result = yearly_growth(100000, 50000, 0.0);
    REQUIRE(result.ending_balance == 700000);
    REQUIRE(result.contributions == 600000);
    REQUIRE(result.growth == 0);
}

TEST_CASE("yearly_growth compounds monthly", "[growth]") {
    const GrowthResult result = yearly_growth(10000000, 0, 0.12);
    // 1% a month for 12 months: 1.01^12 = 1.126825
    REQUIRE_THAT(static_cast<double>(result.ending_balance), WithinAbs(11268250.0, 10.0));
    REQUIRE(result.growth == result.ending_balance - 10000000);
}

TEST_CASE("yearly_growth never goes below zero", "[growth]") {
    const GrowthResult result = yearly_growth(100000, 0, -15.0);
    REQUIRE(result.ending_balance == 0);
    REQUIRE(result.growth == -100000);
}

// ============================================================================
// employer_match
// ============================================================================

TEST_CASE("employer_match", "[growth][match]") {
    SECTION("Contribution under the limit is fully matched") {
        // $500/month on $100K salary, 50% match up to 6%
        REQUIRE(employer_match(50000, 10000000, 0.5, 0.06) == 300000);
    }

    SECTION("Contribution over the limit is capped") {
        REQUIRE(employer_match(100000, 10000000, 0.5, 0.06) == 300000);
    }

    SECTION("No salary means no match") {
        REQUIRE(employer_match(50000, 0, 0.5, 0.06) == 0);
    }

    SECTION("No contribution means no match") {
        REQUIRE(employer_match(0, 10000000, 1.0, 0.06) == 0);
    }
}

// ============================================================================
// asset_year
// ============================================================================

TEST_CASE("asset_year includes employer match", "[growth][asset_year]") {
    const Asset asset = make_401k(0, 50000);
    const AssetYearResult result = asset_year(asset, 0, 0.0, 10000000);

    REQUIRE(result.contributions == 600000);
    REQUIRE(result.employer_match == 300000);
    REQUIRE(result.total_contributions == 900000);
    REQUIRE(result.ending_balance == 900000);
    REQUIRE(result.growth == 0);
}

TEST_CASE("asset_year without match terms", "[growth][asset_year]") {
    Asset asset = make_401k(100000, 10000);
    asset.match_limit.reset();
    const AssetYearResult result = asset_year(asset, asset.balance, 0.0, 10000000);

    REQUIRE(result.employer_match == 0);
    REQUIRE(result.ending_balance == 220000);
}

TEST_CASE("asset_year growth identity", "[growth][asset_year]") {
    const Asset asset = make_401k(5000000, 75000);
    const AssetYearResult result = asset_year(asset, asset.balance, 0.07, 8500000);

    REQUIRE(result.growth > 0);
    REQUIRE(result.ending_balance ==
            result.starting_balance + result.total_contributions + result.growth);
}

TEST_CASE("asset_year rejects a negative balance", "[growth][asset_year]") {
    const Asset asset = make_401k(0, 0);
    REQUIRE_THROWS_AS(asset_year(asset, -1, 0.07, 0), std::invalid_argument);
}

TEST_CASE("project_asset_over_years", "[growth]") {
    const AssetProjection projection = project_asset_over_years(0, 10000, 0.0, 5);

    REQUIRE(projection.yearly_balances.size() == 6);
    REQUIRE(projection.yearly_balances.front() == 0);
    REQUIRE(projection.final_balance == 600000);
    REQUIRE(projection.total_contributions == 600000);
    REQUIRE(projection.total_growth == 0);
}

// ============================================================================
// Compound-interest helpers
// ============================================================================

TEST_CASE("future_value and present_value", "[growth][tvm]") {
    REQUIRE(future_value(100000.0, 0.07, 0) == Approx(100000.0));
    REQUIRE(future_value(100000.0, 0.10, 2) == Approx(121000.0));
    REQUIRE(present_value(121000.0, 0.10, 2) == Approx(100000.0));
}

TEST_CASE("present_value recovers future_value", "[growth][tvm]") {
    for (double amount : {0.0, 1.0, 12345.0, 100000000.0, 123456789012.0}) {
        for (Rate rate = -0.5; rate <= 0.5; rate += 0.05) {
            for (int years : {0, 1, 10, 30, 75}) {
                const double fv = future_value(amount, rate, years);
                const double pv = present_value(fv, rate, years);
                REQUIRE(std::isfinite(pv));
                REQUIRE_THAT(pv, WithinAbs(amount, 100.0));
            }
        }
    }
}

TEST_CASE("years_to_target", "[growth][tvm]") {
    SECTION("Already reached") {
        REQUIRE(years_to_target(1000000, 0, 0.07, 500000) == 0);
    }

    SECTION("Contributions only") {
        // $1,000/month to $24,000 takes two years
        REQUIRE(years_to_target(0, 100000, 0.0, 2400000) == 2);
    }

    SECTION("Unreachable") {
        REQUIRE_FALSE(years_to_target(0, 0, 0.0, 100000).has_value());
        REQUIRE_FALSE(years_to_target(0, 100, 0.0, 100000000, 10).has_value());
    }
}

TEST_CASE("required_monthly_savings", "[growth][tvm]") {
    SECTION("Zero return divides evenly") {
        REQUIRE(required_monthly_savings(0, 1200000, 0.0, 1) == 100000);
    }

    SECTION("Starting balance already grows past target") {
        REQUIRE(required_monthly_savings(10000000, 5000000, 0.05, 10) == 0);
    }

    SECTION("No time left") {
        REQUIRE(required_monthly_savings(100000, 500000, 0.07, 0) == 400000);
        REQUIRE(required_monthly_savings(600000, 500000, 0.07, 0) == 0);
    }

    SECTION("Positive return needs less than the straight-line amount") {
        const Cents monthly = required_monthly_savings(0, 100000000, 0.07, 30);
        REQUIRE(monthly > 0);
        REQUIRE(monthly < 100000000 / 360);
    }
}

// ============================================================================
// Retirement readiness
// ============================================================================

TEST_CASE("retirement_readiness", "[growth][retirement]") {
    SECTION("Exactly funded") {
        const RetirementReadiness r = retirement_readiness(100000000, 4000000, 0.04);
        REQUIRE(r.required_nest_egg == 100000000);
        REQUIRE(r.is_ready);
        REQUIRE(r.percentage_complete == Approx(1.0));
        REQUIRE(r.sustainable_withdrawal == 4000000);
        REQUIRE(r.monthly_income == 333333);
    }

    SECTION("Half funded") {
        const RetirementReadiness r = retirement_readiness(50000000, 4000000, 0.04);
        REQUIRE_FALSE(r.is_ready);
        REQUIRE(r.percentage_complete == Approx(0.5));
    }

    SECTION("Overfunded caps at 100%") {
        const RetirementReadiness r = retirement_readiness(300000000, 4000000, 0.04);
        REQUIRE(r.is_ready);
        REQUIRE(r.percentage_complete == Approx(1.0));
    }

    SECTION("Zero withdrawal rate is never ready") {
        const RetirementReadiness r = retirement_readiness(300000000, 4000000, 0.0);
        REQUIRE(r.current_assets == 300000000);
        REQUIRE(r.required_nest_egg == 0);
        REQUIRE(r.percentage_complete == 0.0);
        REQUIRE_FALSE(r.is_ready);
        REQUIRE(r.sustainable_withdrawal == 0);
        REQUIRE(r.monthly_income == 0);
    }
}

TEST_CASE("property_appreciation", "[growth]") {
    const PropertyAppreciation result = property_appreciation(40000000, 0.03, 10);
    REQUIRE_THAT(static_cast<double>(result.future_value), WithinAbs(40000000.0 * std::pow(1.03, 10), 1.0));
    REQUIRE(result.total_appreciation == result.future_value - 40000000);

    REQUIRE(property_appreciation(40000000, 0.03, 0).total_appreciation == 0);
}
