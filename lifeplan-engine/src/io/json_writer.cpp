#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace lifeplan {
namespace io {

using json = nlohmann::ordered_json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

double dollars(Cents amount) {
    return cents_to_dollars(amount);
}

template <typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_dollars(const std::optional<Cents>& value) {
    return value ? json(dollars(*value)) : json(nullptr);
}

json debt_state_json(const DebtState& d) {
    json j;
    j["debt_id"] = d.debt_id;
    j["name"] = d.name;
    j["remaining_principal"] = dollars(d.remaining_principal);
    j["interest_paid"] = dollars(d.interest_paid);
    j["principal_paid"] = dollars(d.principal_paid);
    j["pmi_paid"] = dollars(d.pmi_paid);
    j["escrow_paid"] = dollars(d.escrow_paid);
    j["total_paid"] = dollars(d.total_paid);
    j["months_remaining"] = d.months_remaining;
    j["is_paid_off"] = d.is_paid_off;
    j["property_value"] = optional_dollars(d.property_value);
    j["paying_pmi"] = d.paying_pmi;
    return j;
}

json asset_state_json(const AssetState& a) {
    json j;
    j["asset_id"] = a.asset_id;
    j["name"] = a.name;
    j["type"] = to_string(a.kind);
    j["balance"] = dollars(a.balance);
    j["contributions"] = dollars(a.contributions);
    j["employer_match"] = dollars(a.employer_match);
    j["growth"] = dollars(a.growth);
    return j;
}

json year_json(const TrajectoryYear& y) {
    json j;
    j["year"] = y.year;
    j["age"] = y.age;

    j["gross_income"] = dollars(y.gross_income);
    j["federal_tax"] = dollars(y.federal_tax);
    j["state_tax"] = dollars(y.state_tax);
    j["fica_tax"] = dollars(y.fica_tax);
    j["total_tax"] = dollars(y.total_tax);
    j["net_income"] = dollars(y.net_income);
    j["effective_tax_rate"] = y.effective_tax_rate;
    j["marginal_tax_rate"] = y.marginal_tax_rate;

    j["debts"] = json::array();
    for (const auto& d : y.debts) {
        j["debts"].push_back(debt_state_json(d));
    }
    j["assets"] = json::array();
    for (const auto& a : y.assets) {
        j["assets"].push_back(asset_state_json(a));
    }

    j["total_debt"] = dollars(y.total_debt);
    j["total_assets"] = dollars(y.total_assets);
    j["net_worth"] = dollars(y.net_worth);
    j["total_debt_payment"] = dollars(y.total_debt_payment);
    j["total_interest_paid"] = dollars(y.total_interest_paid);
    j["total_contributions"] = dollars(y.total_contributions);
    j["total_employer_match"] = dollars(y.total_employer_match);

    j["total_obligations"] = dollars(y.total_obligations);
    j["discretionary_income"] = dollars(y.discretionary_income);
    j["savings_rate"] = y.savings_rate;

    j["home_equity"] = optional_dollars(y.home_equity);
    j["ltv_ratio"] = optional_value(y.ltv_ratio);
    j["paying_pmi"] = y.paying_pmi;

    j["work_hours"] = y.work_hours;
    j["effective_hourly_rate"] = dollars(y.effective_hourly_rate);
    return j;
}

json milestone_json(const Milestone& m) {
    json j;
    j["type"] = to_string(m.kind);
    j["year"] = m.year;
    j["month"] = m.month;
    j["description"] = m.description;
    j["related_id"] = optional_value(m.related_id);
    return j;
}

json summary_json(const TrajectorySummary& s) {
    json j;
    j["total_years"] = s.total_years;
    j["retirement_year"] = optional_value(s.retirement_year);
    j["retirement_age"] = optional_value(s.retirement_age);
    j["lifetime_income"] = dollars(s.lifetime_income);
    j["lifetime_taxes"] = dollars(s.lifetime_taxes);
    j["lifetime_interest"] = dollars(s.lifetime_interest);
    j["lifetime_net_income"] = dollars(s.lifetime_net_income);
    j["lifetime_employer_match"] = dollars(s.lifetime_employer_match);
    j["lifetime_contributions"] = dollars(s.lifetime_contributions);
    j["net_worth_at_retirement"] = dollars(s.net_worth_at_retirement);
    j["net_worth_at_end"] = dollars(s.net_worth_at_end);
    j["lifetime_work_hours"] = s.lifetime_work_hours;
    j["average_effective_hourly_rate"] = dollars(s.average_effective_hourly_rate);
    j["goals_achieved"] = s.goals_achieved;
    j["goals_missed"] = s.goals_missed;
    return j;
}

json trajectory_json(const Trajectory& t) {
    json j;
    j["profile_id"] = t.profile_id;
    j["generated_at"] = t.generated_at;
    j["summary"] = summary_json(t.summary);
    j["milestones"] = json::array();
    for (const auto& m : t.milestones) {
        j["milestones"].push_back(milestone_json(m));
    }
    j["years"] = json::array();
    for (const auto& y : t.years) {
        j["years"].push_back(year_json(y));
    }
    return j;
}

json change_json(const Change& change) {
    json j = std::visit(overloaded{
        [](const IncomeAmountChange& c) {
            return json{{"type", "income_amount"}, {"income_id", c.income_id},
                        {"old_value", dollars(c.old_amount)}, {"new_value", dollars(c.new_amount)}};
        },
        [](const IncomeGrowthChange& c) {
            return json{{"type", "income_growth"}, {"income_id", c.income_id},
                        {"old_value", optional_value(c.old_rate)}, {"new_value", c.new_rate}};
        },
        [](const DebtRateChange& c) {
            return json{{"type", "debt_rate"}, {"debt_id", c.debt_id},
                        {"old_value", c.old_rate}, {"new_value", c.new_rate}};
        },
        [](const DebtPaymentChange& c) {
            return json{{"type", "debt_payment"}, {"debt_id", c.debt_id},
                        {"old_value", dollars(c.old_payment)}, {"new_value", dollars(c.new_payment)}};
        },
        [](const AssetContributionChange& c) {
            return json{{"type", "asset_contribution"}, {"asset_id", c.asset_id},
                        {"old_value", dollars(c.old_contribution)},
                        {"new_value", dollars(c.new_contribution)}};
        },
        [](const AssetReturnChange& c) {
            return json{{"type", "asset_return"}, {"asset_id", c.asset_id},
                        {"old_value", optional_value(c.old_return)}, {"new_value", c.new_return}};
        },
        [](const AssumptionChange& c) {
            return json{{"type", "assumption"}, {"field", to_string(c.field)},
                        {"old_value", c.old_value}, {"new_value", c.new_value}};
        },
        [](const FilingStatusChange& c) {
            return json{{"type", "filing_status"},
                        {"old_value", to_string(c.old_status)}, {"new_value", to_string(c.new_status)}};
        },
        [](const StateChange& c) {
            return json{{"type", "state"}, {"old_value", c.old_state}, {"new_value", c.new_state}};
        }
    }, change.detail);
    j["description"] = change.description;
    return j;
}

json retirement_delta_json(const RetirementDateDelta& delta) {
    return std::visit(overloaded{
        [](const RetirementNeither&) { return json{{"status", "neither"}}; },
        [](const RetirementShift& s) { return json{{"status", "shift"}, {"months", s.months}}; },
        [](const RetirementEnabled&) { return json{{"status", "enabled"}}; },
        [](const RetirementDisabled&) { return json{{"status", "disabled"}}; }
    }, delta);
}

json comparison_json(const Comparison& c) {
    json j;
    j["name"] = c.name;

    j["changes"] = json::array();
    for (const auto& change : c.changes) {
        j["changes"].push_back(change_json(change));
    }

    json summary;
    summary["retirement_date_delta"] = retirement_delta_json(c.summary.retirement_date_delta);
    summary["lifetime_interest_delta"] = dollars(c.summary.lifetime_interest_delta);
    summary["net_worth_at_retirement_delta"] = dollars(c.summary.net_worth_at_retirement_delta);
    summary["work_hours_delta"] = c.summary.work_hours_delta;
    summary["net_worth_at_end_delta"] = dollars(c.summary.net_worth_at_end_delta);
    summary["key_insight"] = c.summary.key_insight;
    j["summary"] = summary;

    j["deltas"] = json::array();
    for (const auto& d : c.deltas) {
        j["deltas"].push_back(json{
            {"year", d.year},
            {"age", d.age},
            {"net_worth_delta", dollars(d.net_worth_delta)},
            {"income_delta", dollars(d.income_delta)},
            {"net_income_delta", dollars(d.net_income_delta)},
            {"taxes_delta", dollars(d.taxes_delta)},
            {"debt_delta", dollars(d.debt_delta)},
            {"assets_delta", dollars(d.assets_delta)},
            {"work_hours_delta", d.work_hours_delta}
        });
    }

    j["baseline"] = trajectory_json(c.baseline);
    j["alternate"] = trajectory_json(c.alternate);
    return j;
}

void write_document(std::ostream& os, const json& document, bool pretty_print) {
    os << document.dump(pretty_print ? 2 : -1) << "\n";
}

} // anonymous namespace

void write_trajectory_json(std::ostream& os, const Trajectory& trajectory, bool pretty_print) {
    write_document(os, trajectory_json(trajectory), pretty_print);
}

void write_trajectory_json(const std::string& filepath, const Trajectory& trajectory,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_trajectory_json(file, trajectory, pretty_print);
}

void write_comparison_json(std::ostream& os, const Comparison& comparison, bool pretty_print) {
    write_document(os, comparison_json(comparison), pretty_print);
}

void write_comparison_json(const std::string& filepath, const Comparison& comparison,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_comparison_json(file, comparison, pretty_print);
}

} // namespace io
} // namespace lifeplan
