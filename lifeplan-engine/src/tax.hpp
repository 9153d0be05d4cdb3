#ifndef LIFEPLAN_TAX_HPP
#define LIFEPLAN_TAX_HPP

#include "money.hpp"
#include "profile.hpp"
#include "tax_tables.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lifeplan {

struct FederalTaxResult {
    Cents tax = 0;
    Cents taxable_income = 0;
    Rate marginal_rate = 0.0;           // 0 when taxable income is 0
    Rate effective_rate = 0.0;          // tax / gross income
};

struct StateTaxResult {
    Cents tax = 0;
    Cents taxable_income = 0;
    Rate effective_rate = 0.0;
};

struct FicaResult {
    Cents social_security = 0;
    Cents medicare = 0;                 // Includes the additional Medicare surcharge
    Cents total = 0;
};

struct TaxSummary {
    Cents gross_income = 0;
    Cents federal_tax = 0;
    Cents state_tax = 0;
    Cents social_security = 0;
    Cents medicare = 0;
    Cents total_fica = 0;
    Cents total_tax = 0;
    Cents net_income = 0;
    Rate effective_rate = 0.0;          // total_tax / gross_income, 0 when gross is 0
    Rate marginal_rate = 0.0;           // Federal marginal rate
};

// Taxable income = max(0, income - pretax contribution - standard deduction)
// Brackets come from tables.federal.for_year(tax_year).
FederalTaxResult calculate_federal_tax(
    const TaxTables& tables,
    Cents income,
    FilingStatus status,
    Cents pretax_contribution,
    int tax_year
);

// Progressive states are taxed at their top marginal rate on the whole
// taxable base. No-income-tax states always return exactly 0.
// Throws std::invalid_argument for an unknown state code.
StateTaxResult calculate_state_tax(
    const TaxTables& tables,
    Cents income,
    const std::string& state,
    Cents pretax_contribution
);

// Social Security up to the wage base plus Medicare with the surcharge above
// the status threshold. Pre-tax contributions do not reduce FICA wages.
FicaResult calculate_fica(
    const TaxTables& tables,
    Cents income,
    FilingStatus status,
    int tax_year
);

TaxSummary calculate_total_tax(
    const TaxTables& tables,
    Cents income,
    FilingStatus status,
    const std::string& state,
    Cents pretax_contribution,
    int tax_year
);

// Total tax without the contribution minus total tax with it
Cents retirement_tax_savings(
    const TaxTables& tables,
    Cents income,
    Cents contribution,
    FilingStatus status,
    const std::string& state,
    int tax_year
);

// Tax for assumptions.tax_year + years_out
//
// Exact when that year is tabulated. Otherwise income is deflated at the
// inflation rate to the resolved table year, taxed there, and each
// component reflated back to nominal terms.
TaxSummary estimate_future_tax(
    const TaxTables& tables,
    Cents income,
    int years_out,
    const Assumptions& assumptions,
    Cents pretax_contribution = 0
);

// Bracket containing the last dollar of taxable income
const TaxBracket& marginal_bracket(const std::vector<TaxBracket>& brackets, Cents taxable_income);

// Bracket above the marginal one, nullptr in the top bracket
const TaxBracket* next_bracket(const std::vector<TaxBracket>& brackets, Cents taxable_income);

// Additional taxable income before the next bracket starts; empty in the top bracket
std::optional<Cents> distance_to_next_bracket(const std::vector<TaxBracket>& brackets, Cents taxable_income);

} // namespace lifeplan

#endif // LIFEPLAN_TAX_HPP
