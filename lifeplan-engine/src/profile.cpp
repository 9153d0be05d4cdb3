#include "profile.hpp"
#include <cctype>
#include <sstream>

namespace lifeplan {

// ============================================================================
// Enum names
// ============================================================================

std::string to_string(FilingStatus status) {
    switch (status) {
        case FilingStatus::Single: return "single";
        case FilingStatus::MarriedJoint: return "married_joint";
        case FilingStatus::MarriedSeparate: return "married_separate";
        case FilingStatus::HeadOfHousehold: return "head_of_household";
    }
    return "single";
}

std::string to_string(IncomeKind kind) {
    switch (kind) {
        case IncomeKind::Salary: return "salary";
        case IncomeKind::Hourly: return "hourly";
        case IncomeKind::Variable: return "variable";
        case IncomeKind::Passive: return "passive";
    }
    return "salary";
}

std::string to_string(DebtKind kind) {
    switch (kind) {
        case DebtKind::Mortgage: return "mortgage";
        case DebtKind::Student: return "student";
        case DebtKind::Auto: return "auto";
        case DebtKind::Credit: return "credit";
        case DebtKind::Personal: return "personal";
        case DebtKind::Other: return "other";
    }
    return "other";
}

std::string to_string(AssetKind kind) {
    switch (kind) {
        case AssetKind::RetirementPretax: return "retirement_pretax";
        case AssetKind::RetirementRoth: return "retirement_roth";
        case AssetKind::Savings: return "savings";
        case AssetKind::Investment: return "investment";
        case AssetKind::Property: return "property";
        case AssetKind::Other: return "other";
    }
    return "other";
}

FilingStatus parse_filing_status(const std::string& name) {
    if (name == "single") return FilingStatus::Single;
    if (name == "married_joint") return FilingStatus::MarriedJoint;
    if (name == "married_separate") return FilingStatus::MarriedSeparate;
    if (name == "head_of_household") return FilingStatus::HeadOfHousehold;
    throw std::invalid_argument("Unknown filing status: " + name);
}

IncomeKind parse_income_kind(const std::string& name) {
    if (name == "salary") return IncomeKind::Salary;
    if (name == "hourly") return IncomeKind::Hourly;
    if (name == "variable") return IncomeKind::Variable;
    if (name == "passive") return IncomeKind::Passive;
    throw std::invalid_argument("Unknown income type: " + name);
}

DebtKind parse_debt_kind(const std::string& name) {
    if (name == "mortgage") return DebtKind::Mortgage;
    if (name == "student") return DebtKind::Student;
    if (name == "auto") return DebtKind::Auto;
    if (name == "credit") return DebtKind::Credit;
    if (name == "personal") return DebtKind::Personal;
    if (name == "other") return DebtKind::Other;
    throw std::invalid_argument("Unknown debt type: " + name);
}

AssetKind parse_asset_kind(const std::string& name) {
    if (name == "retirement_pretax") return AssetKind::RetirementPretax;
    if (name == "retirement_roth") return AssetKind::RetirementRoth;
    if (name == "savings") return AssetKind::Savings;
    if (name == "investment") return AssetKind::Investment;
    if (name == "property") return AssetKind::Property;
    if (name == "other") return AssetKind::Other;
    throw std::invalid_argument("Unknown asset type: " + name);
}

// ============================================================================
// Profile
// ============================================================================

bool Assumptions::operator==(const Assumptions& other) const {
    return inflation_rate == other.inflation_rate &&
           market_return == other.market_return &&
           home_appreciation == other.home_appreciation &&
           salary_growth == other.salary_growth &&
           retirement_withdrawal_rate == other.retirement_withdrawal_rate &&
           income_replacement_ratio == other.income_replacement_ratio &&
           life_expectancy == other.life_expectancy &&
           current_age == other.current_age &&
           filing_status == other.filing_status &&
           state == other.state &&
           tax_year == other.tax_year;
}

const Asset* Profile::find_asset(const std::string& asset_id) const {
    for (const auto& asset : assets) {
        if (asset.id == asset_id) {
            return &asset;
        }
    }
    return nullptr;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

template <typename T>
std::string describe(const T& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

std::string entity_path(const char* collection, size_t index, const std::string& name) {
    std::string path = std::string(collection) + "[" + std::to_string(index) + "]";
    if (!name.empty()) {
        path += " (" + name + ")";
    }
    return path;
}

template <typename T>
void require_non_negative(const std::string& field, T value) {
    if (value < 0) {
        throw ProfileValidationError(field, "must be >= 0 (got " + describe(value) + ")");
    }
}

// Rates below -100% would flip balances negative
void require_above_minus_one(const std::string& field, Rate value) {
    if (!(value > -1.0)) {
        throw ProfileValidationError(field, "must be > -1 (got " + describe(value) + ")");
    }
}

void require_fraction(const std::string& field, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ProfileValidationError(field, "must be between 0 and 1 (got " + describe(value) + ")");
    }
}

void require_month(const std::string& field, const YearMonth& date) {
    if (date.month < 1 || date.month > 12) {
        throw ProfileValidationError(field + ".month", "must be between 1 and 12 (got " +
                                     std::to_string(date.month) + ")");
    }
}

void validate_assumptions(const Assumptions& a) {
    require_above_minus_one("assumptions.inflation_rate", a.inflation_rate);
    require_above_minus_one("assumptions.market_return", a.market_return);
    require_above_minus_one("assumptions.home_appreciation", a.home_appreciation);
    require_above_minus_one("assumptions.salary_growth", a.salary_growth);
    require_non_negative("assumptions.retirement_withdrawal_rate", a.retirement_withdrawal_rate);
    require_non_negative("assumptions.income_replacement_ratio", a.income_replacement_ratio);
    require_non_negative("assumptions.current_age", a.current_age);
    if (a.life_expectancy <= a.current_age) {
        throw ProfileValidationError("assumptions.life_expectancy",
                                     "must exceed current_age (got " + std::to_string(a.life_expectancy) +
                                     " <= " + std::to_string(a.current_age) + ")");
    }
    if (a.state.size() != 2 ||
        !std::isalpha(static_cast<unsigned char>(a.state[0])) ||
        !std::isalpha(static_cast<unsigned char>(a.state[1]))) {
        throw ProfileValidationError("assumptions.state", "must be a two-letter state code (got '" + a.state + "')");
    }
    if (a.tax_year <= 0) {
        throw ProfileValidationError("assumptions.tax_year", "must be positive (got " + std::to_string(a.tax_year) + ")");
    }
}

} // anonymous namespace

void validate_profile(const Profile& profile) {
    require_month("as_of", profile.as_of);
    validate_assumptions(profile.assumptions);

    for (size_t i = 0; i < profile.incomes.size(); ++i) {
        const Income& income = profile.incomes[i];
        const std::string path = entity_path("incomes", i, income.name);
        require_non_negative(path + ".amount", income.amount);
        require_non_negative(path + ".hours_per_week", income.hours_per_week);
        require_fraction(path + ".variability", income.variability);
        if (income.kind == IncomeKind::Hourly && income.hours_per_week <= 0.0) {
            throw ProfileValidationError(path + ".hours_per_week", "must be positive for hourly income");
        }
        if (income.growth_rate) {
            require_above_minus_one(path + ".growth_rate", *income.growth_rate);
        }
        if (income.end) {
            require_month(path + ".end", *income.end);
        }
    }

    for (size_t i = 0; i < profile.debts.size(); ++i) {
        const Debt& debt = profile.debts[i];
        const std::string path = entity_path("debts", i, debt.name);
        require_non_negative(path + ".principal", debt.principal);
        require_non_negative(path + ".interest_rate", debt.interest_rate);
        require_non_negative(path + ".minimum_payment", debt.minimum_payment);
        require_non_negative(path + ".actual_payment", debt.actual_payment);
        require_non_negative(path + ".term_months", debt.term_months);
        require_non_negative(path + ".months_remaining", debt.months_remaining);
        if (debt.term_months > 0 && debt.months_remaining > debt.term_months) {
            throw ProfileValidationError(path + ".months_remaining",
                                         "must not exceed term_months (got " + std::to_string(debt.months_remaining) +
                                         " > " + std::to_string(debt.term_months) + ")");
        }
        if (debt.property_value) {
            require_non_negative(path + ".property_value", *debt.property_value);
        }
        if (debt.pmi_threshold) {
            require_fraction(path + ".pmi_threshold", *debt.pmi_threshold);
        }
        require_non_negative(path + ".pmi_monthly", debt.pmi_monthly);
        require_non_negative(path + ".escrow_monthly", debt.escrow_monthly);
    }

    for (size_t i = 0; i < profile.assets.size(); ++i) {
        const Asset& asset = profile.assets[i];
        const std::string path = entity_path("assets", i, asset.name);
        require_non_negative(path + ".balance", asset.balance);
        require_non_negative(path + ".monthly_contribution", asset.monthly_contribution);
        if (asset.expected_return) {
            require_above_minus_one(path + ".expected_return", *asset.expected_return);
        }
        if (asset.employer_match) {
            require_non_negative(path + ".employer_match", *asset.employer_match);
        }
        if (asset.match_limit) {
            require_fraction(path + ".match_limit", *asset.match_limit);
        }
    }

    for (size_t i = 0; i < profile.obligations.size(); ++i) {
        const Obligation& obligation = profile.obligations[i];
        const std::string path = entity_path("obligations", i, obligation.name);
        require_non_negative(path + ".monthly_amount", obligation.monthly_amount);
        if (obligation.end) {
            require_month(path + ".end", *obligation.end);
        }
    }

    for (size_t i = 0; i < profile.goals.size(); ++i) {
        const Goal& goal = profile.goals[i];
        const std::string path = entity_path("goals", i, goal.name);
        require_non_negative(path + ".target_amount", goal.target_amount);
        require_month(path + ".target_date", goal.target_date);
        if (goal.linked_asset_id && profile.find_asset(*goal.linked_asset_id) == nullptr) {
            throw ProfileValidationError(path + ".linked_asset_id",
                                         "refers to unknown asset '" + *goal.linked_asset_id + "'");
        }
    }
}

} // namespace lifeplan
