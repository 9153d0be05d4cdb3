#include "profile_loader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace lifeplan {
namespace io {

using json = nlohmann::json;

namespace {

std::string default_id(const char* prefix, size_t index) {
    return std::string(prefix) + "-" + std::to_string(index + 1);
}

std::string get_string(const json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) ? j[key].get<std::string>() : fallback;
}

Cents get_dollars(const json& j, const char* key) {
    return j.contains(key) ? dollars_to_cents(j[key].get<double>()) : 0;
}

std::optional<Cents> get_optional_dollars(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return dollars_to_cents(j[key].get<double>());
}

std::optional<Rate> get_optional_rate(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

std::optional<YearMonth> get_optional_month(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return parse_year_month(j[key].get<std::string>());
}

// Enum parsers throw std::invalid_argument; report them as config errors
template <typename Parser>
auto parse_enum(const json& j, const char* key, const std::string& fallback, Parser parser) {
    const std::string name = get_string(j, key, fallback);
    try {
        return parser(name);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Invalid ") + key + ": " + e.what());
    }
}

Income parse_income(const json& j, size_t index) {
    Income income;
    income.id = get_string(j, "id", default_id("income", index));
    income.name = get_string(j, "name");
    income.kind = parse_enum(j, "type", "salary", parse_income_kind);
    if (!j.contains("amount")) {
        throw ConfigParseError("Income '" + income.id + "' missing required field: amount");
    }
    income.amount = get_dollars(j, "amount");
    income.hours_per_week = j.value("hours_per_week", 0.0);
    income.variability = j.value("variability", 0.0);
    income.growth_rate = get_optional_rate(j, "growth_rate");
    income.end = get_optional_month(j, "end");
    return income;
}

Debt parse_debt(const json& j, size_t index) {
    Debt debt;
    debt.id = get_string(j, "id", default_id("debt", index));
    debt.name = get_string(j, "name");
    debt.kind = parse_enum(j, "type", "other", parse_debt_kind);
    if (!j.contains("principal")) {
        throw ConfigParseError("Debt '" + debt.id + "' missing required field: principal");
    }
    debt.principal = get_dollars(j, "principal");
    debt.interest_rate = j.value("interest_rate", 0.0);
    debt.minimum_payment = get_dollars(j, "minimum_payment");
    debt.actual_payment = get_dollars(j, "actual_payment");
    debt.term_months = j.value("term_months", 0);
    debt.months_remaining = j.value("months_remaining", 0);
    debt.property_value = get_optional_dollars(j, "property_value");
    debt.pmi_threshold = get_optional_rate(j, "pmi_threshold");
    debt.pmi_monthly = get_dollars(j, "pmi_monthly");
    debt.escrow_monthly = get_dollars(j, "escrow_monthly");
    return debt;
}

Asset parse_asset(const json& j, size_t index) {
    Asset asset;
    asset.id = get_string(j, "id", default_id("asset", index));
    asset.name = get_string(j, "name");
    asset.kind = parse_enum(j, "type", "savings", parse_asset_kind);
    asset.balance = get_dollars(j, "balance");
    asset.monthly_contribution = get_dollars(j, "monthly_contribution");
    asset.expected_return = get_optional_rate(j, "expected_return");
    asset.employer_match = get_optional_rate(j, "employer_match");
    asset.match_limit = get_optional_rate(j, "match_limit");
    return asset;
}

Obligation parse_obligation(const json& j, size_t index) {
    Obligation obligation;
    obligation.id = get_string(j, "id", default_id("obligation", index));
    obligation.name = get_string(j, "name");
    obligation.monthly_amount = get_dollars(j, "monthly_amount");
    obligation.inflation_adjusted = j.value("inflation_adjusted", false);
    obligation.end = get_optional_month(j, "end");
    return obligation;
}

Goal parse_goal(const json& j, size_t index) {
    Goal goal;
    goal.id = get_string(j, "id", default_id("goal", index));
    goal.name = get_string(j, "name");
    goal.target_amount = get_dollars(j, "target_amount");
    if (!j.contains("target_date")) {
        throw ConfigParseError("Goal '" + goal.id + "' missing required field: target_date");
    }
    goal.target_date = parse_year_month(j["target_date"].get<std::string>());
    if (j.contains("linked_asset_id") && !j["linked_asset_id"].is_null()) {
        goal.linked_asset_id = j["linked_asset_id"].get<std::string>();
    }
    return goal;
}

Assumptions parse_assumptions(const json& j, int as_of_year) {
    Assumptions a;
    a.tax_year = as_of_year;
    if (j.is_null()) {
        return a;
    }
    a.inflation_rate = j.value("inflation_rate", a.inflation_rate);
    a.market_return = j.value("market_return", a.market_return);
    a.home_appreciation = j.value("home_appreciation", a.home_appreciation);
    a.salary_growth = j.value("salary_growth", a.salary_growth);
    a.retirement_withdrawal_rate = j.value("retirement_withdrawal_rate", a.retirement_withdrawal_rate);
    a.income_replacement_ratio = j.value("income_replacement_ratio", a.income_replacement_ratio);
    a.life_expectancy = j.value("life_expectancy", a.life_expectancy);
    a.current_age = j.value("current_age", a.current_age);
    a.filing_status = parse_enum(j, "filing_status", to_string(a.filing_status), parse_filing_status);
    a.state = j.value("state", a.state);
    a.tax_year = j.value("tax_year", a.tax_year);
    return a;
}

template <typename T, typename Parser>
std::vector<T> parse_list(const json& j, const char* key, Parser parser) {
    std::vector<T> items;
    if (!j.contains(key)) {
        return items;
    }
    const json& list = j[key];
    if (!list.is_array()) {
        throw ConfigParseError(std::string("Field must be an array: ") + key);
    }
    for (size_t i = 0; i < list.size(); ++i) {
        items.push_back(parser(list[i], i));
    }
    return items;
}

} // anonymous namespace

YearMonth parse_year_month(const std::string& text) {
    int year = 0;
    int month = 0;
    char dash = 0;
    std::istringstream iss(text);
    if (!(iss >> year >> dash >> month) || dash != '-' || !iss.eof() || text.size() != 7) {
        throw ConfigParseError("Invalid month '" + text + "', expected YYYY-MM");
    }
    if (month < 1 || month > 12) {
        throw ConfigParseError("Invalid month '" + text + "', month must be 01-12");
    }
    return YearMonth(year, month);
}

Profile parse_profile_json(const std::string& json_string) {
    Profile profile;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Profile document must be a JSON object");
        }
        if (!j.contains("as_of")) {
            throw ConfigParseError("Missing required field: as_of");
        }

        profile.id = get_string(j, "id", "profile");
        profile.name = get_string(j, "name");
        profile.as_of = parse_year_month(j["as_of"].get<std::string>());

        profile.incomes = parse_list<Income>(j, "incomes", parse_income);
        profile.debts = parse_list<Debt>(j, "debts", parse_debt);
        profile.assets = parse_list<Asset>(j, "assets", parse_asset);
        profile.obligations = parse_list<Obligation>(j, "obligations", parse_obligation);
        profile.goals = parse_list<Goal>(j, "goals", parse_goal);
        profile.assumptions = parse_assumptions(j.contains("assumptions") ? j["assumptions"] : json(),
                                                profile.as_of.year);

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_profile(profile);

    return profile;
}

Profile load_profile_json(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open profile file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_profile_json(buffer.str());
}

} // namespace io
} // namespace lifeplan
