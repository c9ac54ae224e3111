/// @file src/dcf/dcf.cpp
/// @brief DCF intrinsic value, per-share value, schedule and margin of safety.

#include "valuelens/dcf.hpp"
#include "valuelens/guard.hpp"

#include <cmath>

namespace valuelens::dcf {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// One projected year. Shared by the accumulator and the schedule so both
/// evaluate exactly the same floating-point expressions.
struct YearTerm {
    double future_earnings;
    double discount_factor;
    double present_value;
};

[[nodiscard]] YearTerm year_term(double        initial_owners_earnings,
                                 double        growth_rate,
                                 double        discount_rate,
                                 std::uint64_t t) noexcept {
    const double t_f = static_cast<double>(t);

    YearTerm term{};
    term.future_earnings = initial_owners_earnings * std::pow(1.0 + growth_rate, t_f);
    term.discount_factor = std::pow(1.0 + discount_rate, t_f);
    // Unguarded: d = −1 gives a zero factor and an infinite term.
    term.present_value   = term.future_earnings / term.discount_factor;
    return term;
}

} // anonymous namespace

// ─── intrinsic_value ──────────────────────────────────────────────────────────

double intrinsic_value(double        initial_owners_earnings,
                       double        growth_rate,
                       double        discount_rate,
                       std::uint32_t years) noexcept {
    double total_value = 0.0;

    // 64-bit counter so that years == UINT32_MAX terminates.
    for (std::uint64_t t = 1; t <= years; ++t) {
        total_value += year_term(initial_owners_earnings, growth_rate,
                                 discount_rate, t).present_value;
    }
    return total_value;
}

// ─── intrinsic_value_per_share ────────────────────────────────────────────────

std::optional<double>
intrinsic_value_per_share(double        initial_owners_earnings,
                          double        growth_rate,
                          double        discount_rate,
                          std::uint32_t years,
                          double        shares_outstanding) noexcept {
    if (guard::is_zero(shares_outstanding)) {
        return std::nullopt;
    }

    const double total = intrinsic_value(initial_owners_earnings, growth_rate,
                                         discount_rate, years);
    return total / shares_outstanding;
}

// ─── project_cash_flows ───────────────────────────────────────────────────────

DcfSchedule project_cash_flows(double        initial_owners_earnings,
                               double        growth_rate,
                               double        discount_rate,
                               std::uint32_t years) {
    const auto n = static_cast<Eigen::Index>(years);

    DcfSchedule schedule;
    schedule.future_earnings.resize(n);
    schedule.discount_factors.resize(n);
    schedule.present_values.resize(n);

    for (std::uint64_t t = 1; t <= years; ++t) {
        const YearTerm term = year_term(initial_owners_earnings, growth_rate,
                                        discount_rate, t);
        const auto row = static_cast<Eigen::Index>(t - 1);

        schedule.future_earnings(row)  = term.future_earnings;
        schedule.discount_factors(row) = term.discount_factor;
        schedule.present_values(row)   = term.present_value;

        // Running sum, not present_values.sum(): Eigen may reorder the
        // reduction, and the total must match intrinsic_value exactly.
        schedule.total += term.present_value;
    }
    return schedule;
}

// ─── margin_of_safety ─────────────────────────────────────────────────────────

std::optional<double>
margin_of_safety(double intrinsic_value_per_share, double market_price) noexcept {
    const auto discount = guard::safe_divide(
        intrinsic_value_per_share - market_price, intrinsic_value_per_share);
    if (!discount) {
        return std::nullopt;
    }
    return guard::to_percent(*discount);
}

} // namespace valuelens::dcf
