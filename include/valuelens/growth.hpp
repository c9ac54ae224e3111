#pragma once

/// @file include/valuelens/growth.hpp
/// @brief Compound annual growth rate of earnings per share.
///
/// # Module: Growth
///
/// ## Core Formula
/// ```
/// CAGR = ((final / initial)^(1 / years) − 1) × 100
/// ```
///
/// ## Guarantees
/// - `std::nullopt` iff `initial == 0` or `years <= 0`
/// - A negative `final / initial` is not trapped: `std::pow` of a negative base
///   with a fractional exponent yields NaN, and that NaN is returned as a
///   defined value
///
/// ## NOT Responsible For
/// - Fitting a growth rate to noisy data (only the endpoints are used)

#include <optional>
#include <span>

namespace valuelens::growth {

/// Compound annual growth rate of EPS, as a percentage.
///
/// # Arguments
/// * `initial_eps` — EPS at the start of the period (must be non-zero)
/// * `final_eps`   — EPS at the end of the period
/// * `years`       — Length of the period in years (must be > 0, may be fractional)
///
/// # Returns
/// - `nullopt` if `initial_eps == 0` or `years <= 0`
[[nodiscard]] std::optional<double>
eps_cagr(double initial_eps, double final_eps, double years) noexcept;

/// CAGR across a yearly EPS history, first entry to last.
///
/// The history is chronological with one entry per year, so the period is
/// `eps_history.size() − 1` years. Intermediate entries do not affect the
/// result.
///
/// # Returns
/// - `nullopt` if the history has fewer than two entries
/// - otherwise the same as `eps_cagr(front, back, size − 1)`
[[nodiscard]] std::optional<double>
eps_cagr_from_history(std::span<const double> eps_history) noexcept;

} // namespace valuelens::growth
