#include "amortization.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lifeplan {

// ============================================================================
// Level payment
// ============================================================================

Cents monthly_payment(Cents principal, Rate annual_rate, int term_months) {
    if (principal < 0) {
        throw std::invalid_argument("principal must be >= 0 (got " + std::to_string(principal) + ")");
    }
    if (annual_rate < 0.0) {
        throw std::invalid_argument("interest_rate must be >= 0 (got " + std::to_string(annual_rate) + ")");
    }
    if (term_months <= 0) {
        throw std::invalid_argument("term_months must be positive (got " + std::to_string(term_months) + ")");
    }

    if (annual_rate == 0.0) {
        return round_cents(static_cast<double>(principal) / term_months);
    }

    const double r = annual_rate / 12.0;
    const double payment = static_cast<double>(principal) * r / (1.0 - std::pow(1.0 + r, -term_months));
    return round_cents(payment);
}

// ============================================================================
// AmortizationSchedule
// ============================================================================

AmortizationSchedule::AmortizationSchedule(Cents principal, Rate annual_rate, int term_months, Cents extra_payment)
    : principal_(principal),
      monthly_rate_(annual_rate / 12.0),
      term_months_(term_months),
      payment_(monthly_payment(principal, annual_rate, term_months))
{
    if (extra_payment < 0) {
        throw std::invalid_argument("extra_payment must be >= 0 (got " + std::to_string(extra_payment) + ")");
    }
    payment_ += extra_payment;
}

AmortizationSchedule::const_iterator AmortizationSchedule::begin() const {
    if (principal_ == 0) {
        return end();
    }
    return const_iterator(this, principal_);
}

AmortizationSchedule::const_iterator::const_iterator(const AmortizationSchedule* schedule, Cents balance)
    : schedule_(schedule), balance_(balance)
{
    step();
}

void AmortizationSchedule::const_iterator::step() {
    const int month = row_.month + 1;
    const Cents interest = round_cents(static_cast<double>(balance_) * schedule_->monthly_rate_);
    Cents principal = schedule_->payment_ - interest;

    // Final month (or overpayment) clears the remaining balance exactly
    if (principal >= balance_ || month >= schedule_->term_months_) {
        principal = balance_;
    }

    balance_ -= principal;
    row_ = AmortizationRow{month, principal, interest, balance_};
}

AmortizationSchedule::const_iterator& AmortizationSchedule::const_iterator::operator++() {
    if (schedule_ == nullptr) {
        return *this;
    }
    if (balance_ == 0) {
        schedule_ = nullptr;
        row_ = AmortizationRow{0, 0, 0, 0};
        return *this;
    }
    step();
    return *this;
}

AmortizationSchedule::const_iterator AmortizationSchedule::const_iterator::operator++(int) {
    const_iterator previous = *this;
    ++(*this);
    return previous;
}

bool AmortizationSchedule::const_iterator::operator==(const const_iterator& other) const {
    if (schedule_ == nullptr || other.schedule_ == nullptr) {
        return schedule_ == other.schedule_;
    }
    return schedule_ == other.schedule_ && row_.month == other.row_.month;
}

Cents total_interest(Cents principal, Rate annual_rate, int term_months, Cents extra_payment) {
    Cents total = 0;
    for (const auto& row : AmortizationSchedule(principal, annual_rate, term_months, extra_payment)) {
        total += row.interest;
    }
    return total;
}

// ============================================================================
// One year of a debt
// ============================================================================

Cents scheduled_payment(const Debt& debt, Cents balance, int months_remaining) {
    if (debt.actual_payment > 0) {
        return debt.actual_payment;
    }
    if (debt.minimum_payment > 0) {
        return debt.minimum_payment;
    }
    if (months_remaining > 0 && balance > 0) {
        return monthly_payment(balance, debt.interest_rate, months_remaining);
    }
    return 0;
}

DebtYearResult debt_year(const Debt& debt, Cents starting_balance, int months_remaining) {
    if (starting_balance < 0) {
        throw std::invalid_argument(debt.name + ": balance must be >= 0 (got " +
                                    std::to_string(starting_balance) + ")");
    }
    if (debt.interest_rate < 0.0) {
        throw std::invalid_argument(debt.name + ": interest_rate must be >= 0 (got " +
                                    std::to_string(debt.interest_rate) + ")");
    }
    if (debt.actual_payment < 0 || debt.minimum_payment < 0) {
        throw std::invalid_argument(debt.name + ": payments must be >= 0");
    }
    if (months_remaining < 0) {
        throw std::invalid_argument(debt.name + ": months_remaining must be >= 0 (got " +
                                    std::to_string(months_remaining) + ")");
    }

    DebtYearResult result;
    result.starting_balance = starting_balance;
    result.months_remaining = months_remaining;

    if (starting_balance == 0) {
        result.is_paid_off = true;
        result.months_remaining = 0;
        return result;
    }

    const double monthly_rate = debt.interest_rate / 12.0;
    const Cents payment = scheduled_payment(debt, starting_balance, months_remaining);
    Cents balance = starting_balance;

    for (int month = 1; month <= 12 && balance > 0; ++month) {
        const Cents interest = round_cents(static_cast<double>(balance) * monthly_rate);
        const bool final_scheduled = (result.months_remaining == 1);

        Cents paid = payment;
        if (final_scheduled || paid >= balance + interest) {
            paid = balance + interest;
        }

        balance = balance + interest - paid;
        result.interest_paid += interest;
        result.principal_paid += paid - interest;
        result.total_paid += paid;
        if (paid > 0) {
            ++result.months_paid;
        }
        if (result.months_remaining > 0) {
            --result.months_remaining;
        }

        if (balance == 0) {
            result.is_paid_off = true;
            result.payoff_month = month;
            result.months_remaining = 0;
        }
    }

    result.end_balance = std::max<Cents>(balance, 0);
    return result;
}

DebtYearResult debt_year(const Debt& debt, Cents starting_balance) {
    return debt_year(debt, starting_balance, debt.months_remaining);
}

// ============================================================================
// Mortgage ratios
// ============================================================================

double ltv(Cents balance, Cents property_value) {
    if (property_value <= 0) {
        return 0.0;
    }
    return static_cast<double>(balance) / static_cast<double>(property_value);
}

bool should_pay_pmi(Cents balance, Cents property_value, Rate threshold) {
    if (property_value <= 0 || balance <= 0) {
        return false;
    }
    return ltv(balance, property_value) > threshold;
}

} // namespace lifeplan
