#include "tax_tables.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace lifeplan {

namespace {

[[noreturn]] void throw_not_a_number(const std::string& context, const char* column, const std::string& cell) {
    throw std::runtime_error(context + ": " + column + " '" + cell + "' is not a number");
}

long long parse_integer(const std::string& cell, const std::string& context, const char* column) {
    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(cell, &pos);
    } catch (const std::logic_error&) {
        throw_not_a_number(context, column, cell);
    }
    if (pos != cell.size()) {
        throw_not_a_number(context, column, cell);
    }
    return value;
}

Rate parse_rate(const std::string& cell, const std::string& context, const char* column) {
    size_t pos = 0;
    Rate value = 0.0;
    try {
        value = std::stod(cell, &pos);
    } catch (const std::logic_error&) {
        throw_not_a_number(context, column, cell);
    }
    if (pos != cell.size()) {
        throw_not_a_number(context, column, cell);
    }
    return value;
}

// FICA rows seen for one year while loading a CSV
struct FicaRowsSeen {
    bool wage_base = false;
    std::array<bool, NUM_FILING_STATUSES> medicare_threshold{};
};

} // anonymous namespace

// ============================================================================
// FederalTaxYear
// ============================================================================

void FederalTaxYear::validate() const {
    for (size_t s = 0; s < NUM_FILING_STATUSES; ++s) {
        const auto& table = brackets[s];
        const std::string label = "Tax year " + std::to_string(year) + " (" +
                                  to_string(static_cast<FilingStatus>(s)) + ")";
        if (table.empty()) {
            throw std::invalid_argument(label + ": no brackets defined");
        }
        if (table.front().min != 0) {
            throw std::invalid_argument(label + ": first bracket must start at 0");
        }
        for (size_t i = 0; i < table.size(); ++i) {
            const TaxBracket& b = table[i];
            if (b.rate < 0.0 || b.rate > 1.0) {
                throw std::invalid_argument(label + ": bracket rate must be between 0 and 1");
            }
            const bool last = (i + 1 == table.size());
            if (last) {
                if (b.max) {
                    throw std::invalid_argument(label + ": top bracket must be unbounded");
                }
            } else {
                if (!b.max || *b.max <= b.min) {
                    throw std::invalid_argument(label + ": bracket limits must be ascending");
                }
                if (table[i + 1].min != *b.max) {
                    throw std::invalid_argument(label + ": brackets must be contiguous");
                }
            }
        }
        if (standard_deduction[s] < 0) {
            throw std::invalid_argument(label + ": standard deduction must be >= 0");
        }
    }
    if (fica.social_security_wage_base <= 0) {
        throw std::invalid_argument("Tax year " + std::to_string(year) + ": wage base must be > 0");
    }
    for (size_t s = 0; s < NUM_FILING_STATUSES; ++s) {
        if (fica.additional_medicare_threshold[s] <= 0) {
            throw std::invalid_argument("Tax year " + std::to_string(year) + " (" +
                                        to_string(static_cast<FilingStatus>(s)) +
                                        "): additional Medicare threshold must be > 0");
        }
    }
}

// ============================================================================
// FederalTaxSchedule
// ============================================================================

void FederalTaxSchedule::add(FederalTaxYear table) {
    table.validate();
    const int year = table.year;
    tables_[year] = std::move(table);
}

int FederalTaxSchedule::earliest_year() const {
    if (tables_.empty()) {
        throw std::logic_error("Federal tax schedule is empty");
    }
    return tables_.begin()->first;
}

int FederalTaxSchedule::latest_year() const {
    if (tables_.empty()) {
        throw std::logic_error("Federal tax schedule is empty");
    }
    return tables_.rbegin()->first;
}

int FederalTaxSchedule::resolve_year(int year) const {
    if (tables_.empty()) {
        throw std::logic_error("Federal tax schedule is empty");
    }
    // First table strictly after the requested year
    auto it = tables_.upper_bound(year);
    if (it == tables_.begin()) {
        return it->first;
    }
    --it;
    return it->first;
}

const FederalTaxYear& FederalTaxSchedule::for_year(int year) const {
    return tables_.at(resolve_year(year));
}

FederalTaxSchedule FederalTaxSchedule::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open federal tax file: " + filepath);
    }
    return load_from_csv(file);
}

FederalTaxSchedule FederalTaxSchedule::load_from_csv(std::istream& is) {
    std::map<int, FederalTaxYear> years;
    std::map<int, FicaRowsSeen> fica_seen;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    size_t line = 0;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty()) continue;

        const std::string context = "Federal tax CSV row " + std::to_string(line);
        if (row.size() < 4) {
            throw std::runtime_error(context + ": expected columns year,filing_status,kind,threshold,limit,rate");
        }

        const int year = static_cast<int>(parse_integer(row[0], context, "year"));
        const std::string& status_name = row[1];
        const std::string& kind = row[2];
        const Cents threshold = parse_integer(row[3], context, "threshold");

        std::vector<FilingStatus> statuses;
        if (status_name == "all") {
            statuses = {FilingStatus::Single, FilingStatus::MarriedJoint,
                        FilingStatus::MarriedSeparate, FilingStatus::HeadOfHousehold};
        } else {
            statuses.push_back(parse_filing_status(status_name));
        }

        FederalTaxYear& table = years[year];
        table.year = year;

        if (kind == "bracket") {
            if (row.size() < 6) {
                throw std::runtime_error(context + ": bracket rows need threshold,limit,rate");
            }
            TaxBracket bracket;
            bracket.min = threshold;
            if (!row[4].empty()) {
                bracket.max = parse_integer(row[4], context, "limit");
            }
            bracket.rate = parse_rate(row[5], context, "rate");
            for (FilingStatus status : statuses) {
                table.brackets[static_cast<size_t>(status)].push_back(bracket);
            }
        } else if (kind == "standard_deduction") {
            for (FilingStatus status : statuses) {
                table.standard_deduction[static_cast<size_t>(status)] = threshold;
            }
        } else if (kind == "additional_medicare_threshold") {
            for (FilingStatus status : statuses) {
                table.fica.additional_medicare_threshold[static_cast<size_t>(status)] = threshold;
                fica_seen[year].medicare_threshold[static_cast<size_t>(status)] = true;
            }
        } else if (kind == "social_security_wage_base") {
            table.fica.social_security_wage_base = threshold;
            fica_seen[year].wage_base = true;
        } else {
            throw std::runtime_error(context + ": unknown kind '" + kind + "'");
        }
    }

    // Each year must supply its own FICA rows
    for (const auto& entry : years) {
        const std::string label = "Federal tax CSV year " + std::to_string(entry.first);
        const FicaRowsSeen& seen = fica_seen[entry.first];
        if (!seen.wage_base) {
            throw std::runtime_error(label + ": missing social_security_wage_base row");
        }
        for (size_t s = 0; s < NUM_FILING_STATUSES; ++s) {
            if (!seen.medicare_threshold[s]) {
                throw std::runtime_error(label + ": missing additional_medicare_threshold row for " +
                                         to_string(static_cast<FilingStatus>(s)));
            }
        }
    }

    FederalTaxSchedule schedule;
    for (auto& entry : years) {
        for (auto& table : entry.second.brackets) {
            std::sort(table.begin(), table.end(),
                      [](const TaxBracket& a, const TaxBracket& b) { return a.min < b.min; });
        }
        schedule.add(std::move(entry.second));
    }
    return schedule;
}

// ============================================================================
// StateTaxTable
// ============================================================================

std::string StateTaxTable::normalize(const std::string& code) {
    std::string result = code;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

void StateTaxTable::set(const std::string& code, StateTaxConfig config) {
    if (config.rate < 0.0 || config.rate > 1.0) {
        throw std::invalid_argument("State " + code + ": rate must be between 0 and 1");
    }
    if (config.standard_deduction < 0) {
        throw std::invalid_argument("State " + code + ": standard deduction must be >= 0");
    }
    states_[normalize(code)] = std::move(config);
}

bool StateTaxTable::contains(const std::string& code) const {
    return states_.count(normalize(code)) > 0;
}

const StateTaxConfig& StateTaxTable::get(const std::string& code) const {
    auto it = states_.find(normalize(code));
    if (it == states_.end()) {
        throw std::invalid_argument("Unknown state code: " + code);
    }
    return it->second;
}

std::vector<std::string> StateTaxTable::codes() const {
    std::vector<std::string> result;
    result.reserve(states_.size());
    for (const auto& [code, config] : states_) {
        result.push_back(code);
    }
    return result;
}

std::vector<std::string> StateTaxTable::no_income_tax_codes() const {
    std::vector<std::string> result;
    for (const auto& [code, config] : states_) {
        if (config.kind == StateTaxKind::None) {
            result.push_back(code);
        }
    }
    return result;
}

StateTaxTable StateTaxTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open state tax file: " + filepath);
    }
    return load_from_csv(file);
}

StateTaxTable StateTaxTable::load_from_csv(std::istream& is) {
    StateTaxTable table;
    CsvReader reader(is);

    if (reader.has_more()) {
        reader.read_row();
    }

    size_t line = 0;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty()) continue;

        const std::string context = "State tax CSV row " + std::to_string(line);
        if (row.size() < 5) {
            throw std::runtime_error(context + ": expected columns code,name,kind,rate,standard_deduction");
        }

        StateTaxConfig config;
        config.name = row[1];
        if (row[2] == "none") {
            config.kind = StateTaxKind::None;
        } else if (row[2] == "flat") {
            config.kind = StateTaxKind::Flat;
        } else if (row[2] == "progressive") {
            config.kind = StateTaxKind::Progressive;
        } else {
            throw std::runtime_error(context + ": unknown kind '" + row[2] + "' for " + row[0]);
        }
        config.rate = parse_rate(row[3], context, "rate");
        config.standard_deduction = parse_integer(row[4], context, "standard_deduction");
        table.set(row[0], std::move(config));
    }

    return table;
}

// ============================================================================
// Built-in tables
// ============================================================================

namespace {

std::vector<TaxBracket> make_brackets(const std::array<Cents, 6>& limits) {
    static constexpr std::array<Rate, 7> rates = {0.10, 0.12, 0.22, 0.24, 0.32, 0.35, 0.37};
    std::vector<TaxBracket> result;
    result.reserve(rates.size());
    Cents lower = 0;
    for (size_t i = 0; i < limits.size(); ++i) {
        result.push_back(TaxBracket{lower, limits[i], rates[i]});
        lower = limits[i];
    }
    result.push_back(TaxBracket{lower, std::nullopt, rates.back()});
    return result;
}

void set_status(FederalTaxYear& table, FilingStatus status,
                const std::array<Cents, 6>& limits, Cents deduction) {
    table.brackets[static_cast<size_t>(status)] = make_brackets(limits);
    table.standard_deduction[static_cast<size_t>(status)] = deduction;
}

FicaParameters make_fica(Cents wage_base) {
    FicaParameters fica;
    fica.social_security_wage_base = wage_base;
    fica.additional_medicare_threshold[static_cast<size_t>(FilingStatus::Single)] = 20000000;
    fica.additional_medicare_threshold[static_cast<size_t>(FilingStatus::MarriedJoint)] = 25000000;
    fica.additional_medicare_threshold[static_cast<size_t>(FilingStatus::MarriedSeparate)] = 12500000;
    fica.additional_medicare_threshold[static_cast<size_t>(FilingStatus::HeadOfHousehold)] = 20000000;
    return fica;
}

} // anonymous namespace

FederalTaxYear federal_tax_year_2024() {
    FederalTaxYear t;
    t.year = 2024;
    set_status(t, FilingStatus::Single,
               {1160000, 4712500, 10052500, 19155000, 24367500, 60962500}, 1460000);
    set_status(t, FilingStatus::MarriedJoint,
               {2320000, 9425000, 20105000, 38310000, 48735000, 73162500}, 2920000);
    set_status(t, FilingStatus::MarriedSeparate,
               {1160000, 4712500, 10052500, 19155000, 24367500, 36581250}, 1460000);
    set_status(t, FilingStatus::HeadOfHousehold,
               {1650000, 6355000, 10052500, 19155000, 24367500, 60962500}, 2190000);
    t.fica = make_fica(16860000);
    return t;
}

FederalTaxYear federal_tax_year_2025() {
    FederalTaxYear t;
    t.year = 2025;
    set_status(t, FilingStatus::Single,
               {1192500, 4847500, 10335000, 19730000, 25052500, 62635000}, 1575000);
    set_status(t, FilingStatus::MarriedJoint,
               {2385000, 9695000, 20670000, 39460000, 50105000, 75160000}, 3150000);
    set_status(t, FilingStatus::MarriedSeparate,
               {1192500, 4847500, 10335000, 19730000, 25052500, 37580000}, 1575000);
    set_status(t, FilingStatus::HeadOfHousehold,
               {1700000, 6485000, 10335000, 19730000, 25050000, 62635000}, 2362500);
    t.fica = make_fica(17610000);
    return t;
}

StateTaxTable state_tax_table_2024() {
    using K = StateTaxKind;
    StateTaxTable t;

    // No income tax
    t.set("AK", {"Alaska", K::None, 0.0, 0});
    t.set("FL", {"Florida", K::None, 0.0, 0});
    t.set("NV", {"Nevada", K::None, 0.0, 0});
    t.set("SD", {"South Dakota", K::None, 0.0, 0});
    t.set("TX", {"Texas", K::None, 0.0, 0});
    t.set("WA", {"Washington", K::None, 0.0, 0});
    t.set("WY", {"Wyoming", K::None, 0.0, 0});
    t.set("TN", {"Tennessee", K::None, 0.0, 0});
    t.set("NH", {"New Hampshire", K::None, 0.0, 0});

    // Flat
    t.set("CO", {"Colorado", K::Flat, 0.044, 0});
    t.set("IL", {"Illinois", K::Flat, 0.0495, 0});
    t.set("IN", {"Indiana", K::Flat, 0.0305, 0});
    t.set("KY", {"Kentucky", K::Flat, 0.04, 296000});
    t.set("MA", {"Massachusetts", K::Flat, 0.05, 0});
    t.set("MI", {"Michigan", K::Flat, 0.0425, 0});
    t.set("NC", {"North Carolina", K::Flat, 0.0525, 1275000});
    t.set("PA", {"Pennsylvania", K::Flat, 0.0307, 0});
    t.set("UT", {"Utah", K::Flat, 0.0465, 0});

    // Progressive, top marginal rate
    t.set("AL", {"Alabama", K::Progressive, 0.05, 300000});
    t.set("AZ", {"Arizona", K::Progressive, 0.025, 1413600});
    t.set("AR", {"Arkansas", K::Progressive, 0.044, 246000});
    t.set("CA", {"California", K::Progressive, 0.133, 545600});
    t.set("CT", {"Connecticut", K::Progressive, 0.0699, 0});
    t.set("DE", {"Delaware", K::Progressive, 0.066, 330000});
    t.set("DC", {"District of Columbia", K::Progressive, 0.1075, 0});
    t.set("GA", {"Georgia", K::Progressive, 0.0549, 1240000});
    t.set("HI", {"Hawaii", K::Progressive, 0.11, 248000});
    t.set("ID", {"Idaho", K::Progressive, 0.058, 1460000});
    t.set("IA", {"Iowa", K::Progressive, 0.057, 0});
    t.set("KS", {"Kansas", K::Progressive, 0.057, 300000});
    t.set("LA", {"Louisiana", K::Progressive, 0.0425, 0});
    t.set("ME", {"Maine", K::Progressive, 0.0715, 1410000});
    t.set("MD", {"Maryland", K::Progressive, 0.0575, 265000});
    t.set("MN", {"Minnesota", K::Progressive, 0.0985, 1460000});
    t.set("MS", {"Mississippi", K::Progressive, 0.05, 0});
    t.set("MO", {"Missouri", K::Progressive, 0.048, 0});
    t.set("MT", {"Montana", K::Progressive, 0.059, 565000});
    t.set("NE", {"Nebraska", K::Progressive, 0.0584, 0});
    t.set("NJ", {"New Jersey", K::Progressive, 0.1075, 0});
    t.set("NM", {"New Mexico", K::Progressive, 0.059, 0});
    t.set("NY", {"New York", K::Progressive, 0.109, 800000});
    t.set("ND", {"North Dakota", K::Progressive, 0.029, 0});
    t.set("OH", {"Ohio", K::Progressive, 0.035, 0});
    t.set("OK", {"Oklahoma", K::Progressive, 0.0475, 0});
    t.set("OR", {"Oregon", K::Progressive, 0.099, 260000});
    t.set("RI", {"Rhode Island", K::Progressive, 0.0599, 1025000});
    t.set("SC", {"South Carolina", K::Progressive, 0.064, 0});
    t.set("VT", {"Vermont", K::Progressive, 0.0875, 699000});
    t.set("VA", {"Virginia", K::Progressive, 0.0575, 800000});
    t.set("WV", {"West Virginia", K::Progressive, 0.055, 0});
    t.set("WI", {"Wisconsin", K::Progressive, 0.0765, 1324000});

    return t;
}

const TaxTables& TaxTables::builtin() {
    static const TaxTables tables = [] {
        TaxTables t;
        t.federal.add(federal_tax_year_2024());
        t.federal.add(federal_tax_year_2025());
        t.states = state_tax_table_2024();
        return t;
    }();
    return tables;
}

} // namespace lifeplan
