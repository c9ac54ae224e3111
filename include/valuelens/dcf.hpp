#pragma once

/// @file include/valuelens/dcf.hpp
/// @brief Discounted-cash-flow intrinsic value estimator.
///
/// # Module: DCF
///
/// ## Responsibility
/// Project owner's earnings forward at a constant growth rate and discount
/// each year back to the present at a constant discount rate.
///
/// ## Core Formula
/// ```
/// IV = Σ_{t=1}^{years}  E₀ · (1 + g)^t / (1 + d)^t
/// ```
/// The sum is accumulated in ascending `t` (1, 2, …, years). Each term is
/// computed as `(E₀ · (1 + g)^t) / (1 + d)^t` with two separate `std::pow`
/// calls; the expression is never folded into `((1 + g)/(1 + d))^t`, which
/// rounds differently. Results are bit-reproducible for identical inputs.
///
/// ## Guarantees
/// - `intrinsic_value` is total: `years == 0` yields `0.0` for any rates
/// - `project_cash_flows(...).total` equals `intrinsic_value(...)` bit for bit
/// - Rates are not validated. A discount rate of −1 divides by zero inside
///   the sum and yields ±Inf/NaN, which is returned as-is
///
/// ## NOT Responsible For
/// - Terminal value beyond the projection window
/// - Estimating growth or discount rates

#include "valuelens/types.hpp"

#include <cstdint>
#include <optional>

namespace valuelens::dcf {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Year-by-year breakdown of a DCF projection.
///
/// Row `i` of every column describes year `i + 1`.
struct DcfSchedule {
    CashFlowVector future_earnings;   ///< E₀ · (1 + g)^t
    CashFlowVector discount_factors;  ///< (1 + d)^t
    CashFlowVector present_values;    ///< future_earnings / discount_factors
    double         total = 0.0;       ///< Ascending running sum of present_values

    /// Number of projected years.
    [[nodiscard]] std::uint32_t years() const noexcept {
        return static_cast<std::uint32_t>(present_values.size());
    }
};

// ─── Estimator ────────────────────────────────────────────────────────────────

/// Intrinsic value of the whole company over a finite projection window.
///
/// # Arguments
/// * `initial_owners_earnings` — Owner's earnings for the base year (E₀)
/// * `growth_rate`             — Annual growth g (fractional, 0.05 = 5%)
/// * `discount_rate`           — Annual discount rate d (fractional)
/// * `years`                   — Number of projected years
///
/// # Returns
/// Sum of the discounted yearly earnings; `0.0` when `years == 0`.
[[nodiscard]] double intrinsic_value(double        initial_owners_earnings,
                                     double        growth_rate,
                                     double        discount_rate,
                                     std::uint32_t years) noexcept;

/// Intrinsic value divided by the share count.
///
/// # Returns
/// - `nullopt` if `shares_outstanding == 0`
/// - `intrinsic_value(...) / shares_outstanding` otherwise
[[nodiscard]] std::optional<double>
intrinsic_value_per_share(double        initial_owners_earnings,
                          double        growth_rate,
                          double        discount_rate,
                          std::uint32_t years,
                          double        shares_outstanding) noexcept;

/// Build the year-by-year table that `intrinsic_value` sums.
///
/// Allocates three vectors of length `years`.
[[nodiscard]] DcfSchedule project_cash_flows(double        initial_owners_earnings,
                                             double        growth_rate,
                                             double        discount_rate,
                                             std::uint32_t years);

/// Margin of safety as a percentage of intrinsic value.
///
/// # Formula
///   MoS = (intrinsic − price) / intrinsic × 100
///
/// Positive when the market price is below the estimate, negative when the
/// market price exceeds it.
///
/// # Returns
/// - `nullopt` if `intrinsic_value_per_share == 0`
[[nodiscard]] std::optional<double>
margin_of_safety(double intrinsic_value_per_share, double market_price) noexcept;

} // namespace valuelens::dcf
