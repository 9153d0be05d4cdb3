#include "tax.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lifeplan {

namespace {

void require_non_negative(const char* field, Cents value) {
    if (value < 0) {
        throw std::invalid_argument(std::string(field) + " must be >= 0 (got " +
                                    std::to_string(value) + ")");
    }
}

Rate safe_ratio(Cents numerator, Cents denominator) {
    if (denominator <= 0) {
        return 0.0;
    }
    return static_cast<double>(numerator) / static_cast<double>(denominator);
}

Cents scale(Cents amount, double factor) {
    return round_cents(static_cast<double>(amount) * factor);
}

} // anonymous namespace

// ============================================================================
// Bracket helpers
// ============================================================================

const TaxBracket& marginal_bracket(const std::vector<TaxBracket>& brackets, Cents taxable_income) {
    if (brackets.empty()) {
        throw std::invalid_argument("Bracket table is empty");
    }
    for (const auto& bracket : brackets) {
        if (bracket.contains(taxable_income)) {
            return bracket;
        }
    }
    return brackets.front();
}

const TaxBracket* next_bracket(const std::vector<TaxBracket>& brackets, Cents taxable_income) {
    const TaxBracket& current = marginal_bracket(brackets, taxable_income);
    if (!current.max) {
        return nullptr;
    }
    for (const auto& bracket : brackets) {
        if (bracket.min == *current.max) {
            return &bracket;
        }
    }
    return nullptr;
}

std::optional<Cents> distance_to_next_bracket(const std::vector<TaxBracket>& brackets, Cents taxable_income) {
    const TaxBracket& current = marginal_bracket(brackets, taxable_income);
    if (!current.max) {
        return std::nullopt;
    }
    return *current.max - std::max<Cents>(taxable_income, 0);
}

// ============================================================================
// Federal, state and FICA
// ============================================================================

FederalTaxResult calculate_federal_tax(
    const TaxTables& tables,
    Cents income,
    FilingStatus status,
    Cents pretax_contribution,
    int tax_year)
{
    require_non_negative("income", income);
    require_non_negative("pretax_contribution", pretax_contribution);

    const FederalTaxYear& table = tables.federal.for_year(tax_year);
    const auto& brackets = table.brackets_for(status);

    FederalTaxResult result;
    result.taxable_income = std::max<Cents>(
        0, income - pretax_contribution - table.standard_deduction_for(status));

    double tax = 0.0;
    for (const auto& bracket : brackets) {
        if (result.taxable_income <= bracket.min) {
            break;
        }
        const Cents top = bracket.max ? std::min(result.taxable_income, *bracket.max)
                                      : result.taxable_income;
        tax += static_cast<double>(top - bracket.min) * bracket.rate;
    }

    result.tax = round_cents(tax);
    result.marginal_rate = result.taxable_income > 0
        ? marginal_bracket(brackets, result.taxable_income).rate
        : 0.0;
    result.effective_rate = safe_ratio(result.tax, income);
    return result;
}

StateTaxResult calculate_state_tax(
    const TaxTables& tables,
    Cents income,
    const std::string& state,
    Cents pretax_contribution)
{
    require_non_negative("income", income);
    require_non_negative("pretax_contribution", pretax_contribution);

    const StateTaxConfig& config = tables.states.get(state);

    StateTaxResult result;
    if (config.kind == StateTaxKind::None) {
        return result;
    }

    result.taxable_income = std::max<Cents>(
        0, income - pretax_contribution - config.standard_deduction);
    result.tax = round_cents(static_cast<double>(result.taxable_income) * config.rate);
    result.effective_rate = safe_ratio(result.tax, income);
    return result;
}

FicaResult calculate_fica(
    const TaxTables& tables,
    Cents income,
    FilingStatus status,
    int tax_year)
{
    require_non_negative("income", income);

    const FicaParameters& fica = tables.federal.for_year(tax_year).fica;

    FicaResult result;
    const Cents ss_wages = std::min(income, fica.social_security_wage_base);
    result.social_security = round_cents(static_cast<double>(ss_wages) * fica.social_security_rate);

    double medicare = static_cast<double>(income) * fica.medicare_rate;
    const Cents threshold = fica.additional_medicare_threshold_for(status);
    if (income > threshold) {
        medicare += static_cast<double>(income - threshold) * fica.additional_medicare_rate;
    }
    result.medicare = round_cents(medicare);
    result.total = result.social_security + result.medicare;
    return result;
}

TaxSummary calculate_total_tax(
    const TaxTables& tables,
    Cents income,
    FilingStatus status,
    const std::string& state,
    Cents pretax_contribution,
    int tax_year)
{
    const FederalTaxResult federal = calculate_federal_tax(tables, income, status, pretax_contribution, tax_year);
    const StateTaxResult state_result = calculate_state_tax(tables, income, state, pretax_contribution);
    const FicaResult fica = calculate_fica(tables, income, status, tax_year);

    TaxSummary summary;
    summary.gross_income = income;
    summary.federal_tax = federal.tax;
    summary.state_tax = state_result.tax;
    summary.social_security = fica.social_security;
    summary.medicare = fica.medicare;
    summary.total_fica = fica.total;
    summary.total_tax = federal.tax + state_result.tax + fica.total;
    summary.net_income = income - summary.total_tax;
    summary.effective_rate = safe_ratio(summary.total_tax, income);
    summary.marginal_rate = federal.marginal_rate;
    return summary;
}

Cents retirement_tax_savings(
    const TaxTables& tables,
    Cents income,
    Cents contribution,
    FilingStatus status,
    const std::string& state,
    int tax_year)
{
    const TaxSummary without = calculate_total_tax(tables, income, status, state, 0, tax_year);
    const TaxSummary with = calculate_total_tax(tables, income, status, state, contribution, tax_year);
    return without.total_tax - with.total_tax;
}

// ============================================================================
// Future years
// ============================================================================

TaxSummary estimate_future_tax(
    const TaxTables& tables,
    Cents income,
    int years_out,
    const Assumptions& assumptions,
    Cents pretax_contribution)
{
    const int target_year = assumptions.tax_year + years_out;
    const int table_year = tables.federal.resolve_year(target_year);

    if (table_year == target_year) {
        return calculate_total_tax(tables, income, assumptions.filing_status, assumptions.state,
                                   pretax_contribution, target_year);
    }

    require_non_negative("income", income);
    require_non_negative("pretax_contribution", pretax_contribution);

    const double factor = std::pow(1.0 + assumptions.inflation_rate, target_year - table_year);
    const Cents real_income = scale(income, 1.0 / factor);
    const Cents real_contribution = scale(pretax_contribution, 1.0 / factor);

    const TaxSummary real = calculate_total_tax(tables, real_income, assumptions.filing_status,
                                                assumptions.state, real_contribution, table_year);

    TaxSummary summary;
    summary.gross_income = income;
    summary.federal_tax = scale(real.federal_tax, factor);
    summary.state_tax = scale(real.state_tax, factor);
    summary.social_security = scale(real.social_security, factor);
    summary.medicare = scale(real.medicare, factor);
    summary.total_fica = summary.social_security + summary.medicare;
    summary.total_tax = summary.federal_tax + summary.state_tax + summary.total_fica;
    summary.net_income = income - summary.total_tax;
    summary.effective_rate = safe_ratio(summary.total_tax, income);
    summary.marginal_rate = real.marginal_rate;
    return summary;
}

} // namespace lifeplan
