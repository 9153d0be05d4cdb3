#ifndef LIFEPLAN_AMORTIZATION_HPP
#define LIFEPLAN_AMORTIZATION_HPP

#include "money.hpp"
#include "profile.hpp"
#include <cstddef>
#include <iterator>
#include <optional>

namespace lifeplan {

// Level monthly payment for a fully amortizing loan
// Degrades to principal / term_months when annual_rate is 0.
// Throws std::invalid_argument for negative principal or rate, or term_months <= 0.
Cents monthly_payment(Cents principal, Rate annual_rate, int term_months);

struct AmortizationRow {
    int month;                          // 1-based
    Cents principal;                    // Principal portion of this payment
    Cents interest;                     // Interest portion of this payment
    Cents balance;                      // Balance after the payment
};

// Month-by-month schedule for one loan, iterated lazily
//
// Each month interest is rounded to cents and the payment applied; the
// final payment is clipped so the balance lands on exactly 0. Iterating
// again restarts from the original principal.
class AmortizationSchedule {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = AmortizationRow;
        using difference_type = std::ptrdiff_t;
        using pointer = const AmortizationRow*;
        using reference = const AmortizationRow&;

        const_iterator() = default;

        reference operator*() const { return row_; }
        pointer operator->() const { return &row_; }
        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class AmortizationSchedule;
        const_iterator(const AmortizationSchedule* schedule, Cents balance);

        void step();

        const AmortizationSchedule* schedule_ = nullptr;   // nullptr = end
        Cents balance_ = 0;
        AmortizationRow row_{0, 0, 0, 0};
    };

    AmortizationSchedule(Cents principal, Rate annual_rate, int term_months, Cents extra_payment = 0);

    const_iterator begin() const;
    const_iterator end() const { return const_iterator(); }

    Cents principal() const { return principal_; }
    Cents payment() const { return payment_; }        // Level payment plus extra
    int term_months() const { return term_months_; }

private:
    Cents principal_;
    Rate monthly_rate_;
    int term_months_;
    Cents payment_;
};

// Sum of interest over the whole schedule
Cents total_interest(Cents principal, Rate annual_rate, int term_months, Cents extra_payment = 0);

// Result of advancing a debt through one year
struct DebtYearResult {
    Cents starting_balance = 0;
    Cents end_balance = 0;              // Never negative
    Cents interest_paid = 0;
    Cents principal_paid = 0;           // Negative when payments do not cover interest
    Cents total_paid = 0;
    int months_paid = 0;                // Months with a payment this year
    int months_remaining = 0;           // Scheduled months left after this year, 0 = open-ended
    bool is_paid_off = false;
    std::optional<int> payoff_month;    // 1-12 when paid off this year
};

// Payment used when advancing a debt
// actual_payment, else minimum_payment, else the level payment over the remaining term.
Cents scheduled_payment(const Debt& debt, Cents balance, int months_remaining);

// Apply up to 12 months of payments against starting_balance
//
// A debt with months_remaining > 0 settles its whole balance in the last
// scheduled month, so repeated calls land on exactly 0 at the end of the term.
// Throws std::invalid_argument for a negative balance, rate or payment.
DebtYearResult debt_year(const Debt& debt, Cents starting_balance, int months_remaining);
DebtYearResult debt_year(const Debt& debt, Cents starting_balance);

// Loan-to-value ratio; 0 when property_value is not positive
double ltv(Cents balance, Cents property_value);

// PMI is required while LTV exceeds threshold
bool should_pay_pmi(Cents balance, Cents property_value, Rate threshold);

} // namespace lifeplan

#endif // LIFEPLAN_AMORTIZATION_HPP
