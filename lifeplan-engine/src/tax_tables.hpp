#ifndef LIFEPLAN_TAX_TABLES_HPP
#define LIFEPLAN_TAX_TABLES_HPP

#include "money.hpp"
#include "profile.hpp"
#include <array>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lifeplan {

constexpr size_t NUM_FILING_STATUSES = 4;

// One marginal bracket; the top bracket has no upper limit
struct TaxBracket {
    Cents min;
    std::optional<Cents> max;
    Rate rate;

    bool contains(Cents taxable_income) const {
        return taxable_income >= min && (!max || taxable_income < *max);
    }
};

struct FicaParameters {
    Rate social_security_rate = 0.062;
    Rate medicare_rate = 0.0145;
    Rate additional_medicare_rate = 0.009;
    Cents social_security_wage_base = 0;
    std::array<Cents, NUM_FILING_STATUSES> additional_medicare_threshold{};

    Cents additional_medicare_threshold_for(FilingStatus status) const {
        return additional_medicare_threshold[static_cast<size_t>(status)];
    }
};

// Federal brackets, standard deductions and FICA parameters for one tax year
struct FederalTaxYear {
    int year = 0;
    std::array<std::vector<TaxBracket>, NUM_FILING_STATUSES> brackets;
    std::array<Cents, NUM_FILING_STATUSES> standard_deduction{};
    FicaParameters fica;

    const std::vector<TaxBracket>& brackets_for(FilingStatus status) const {
        return brackets[static_cast<size_t>(status)];
    }
    Cents standard_deduction_for(FilingStatus status) const {
        return standard_deduction[static_cast<size_t>(status)];
    }

    // Brackets must start at 0, be contiguous and ascending, with an open top bracket
    void validate() const;
};

// Federal tables keyed by tax year
//
// Year resolution: the exact year when tabulated, otherwise the latest
// tabulated year before it, otherwise the earliest tabulated year.
class FederalTaxSchedule {
public:
    FederalTaxSchedule() = default;

    void add(FederalTaxYear table);

    bool empty() const { return tables_.empty(); }
    size_t size() const { return tables_.size(); }
    bool has_year(int year) const { return tables_.count(year) > 0; }
    int earliest_year() const;
    int latest_year() const;

    int resolve_year(int year) const;
    const FederalTaxYear& for_year(int year) const;

    // CSV columns: year,filing_status,kind,threshold,limit,rate
    // kind: bracket | standard_deduction | additional_medicare_threshold | social_security_wage_base
    // filing_status "all" applies the row to every status
    static FederalTaxSchedule load_from_csv(const std::string& filepath);
    static FederalTaxSchedule load_from_csv(std::istream& is);

private:
    std::map<int, FederalTaxYear> tables_;
};

enum class StateTaxKind : uint8_t {
    None = 0,
    Flat = 1,
    Progressive = 2
};

// Progressive states are approximated by their top marginal rate
struct StateTaxConfig {
    std::string name;
    StateTaxKind kind = StateTaxKind::None;
    Rate rate = 0.0;
    Cents standard_deduction = 0;
};

class StateTaxTable {
public:
    StateTaxTable() = default;

    void set(const std::string& code, StateTaxConfig config);

    // Case-insensitive lookup
    bool contains(const std::string& code) const;
    const StateTaxConfig& get(const std::string& code) const;

    std::vector<std::string> codes() const;
    std::vector<std::string> no_income_tax_codes() const;
    size_t size() const { return states_.size(); }

    // CSV columns: code,name,kind,rate,standard_deduction
    static StateTaxTable load_from_csv(const std::string& filepath);
    static StateTaxTable load_from_csv(std::istream& is);

private:
    std::map<std::string, StateTaxConfig> states_;

    static std::string normalize(const std::string& code);
};

// The configuration injected into every tax calculation
struct TaxTables {
    FederalTaxSchedule federal;
    StateTaxTable states;

    // 2024 and 2025 federal tables, 2024 state rates
    static const TaxTables& builtin();
};

FederalTaxYear federal_tax_year_2024();
FederalTaxYear federal_tax_year_2025();
StateTaxTable state_tax_table_2024();

} // namespace lifeplan

#endif // LIFEPLAN_TAX_TABLES_HPP
