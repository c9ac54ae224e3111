#pragma once

/// @file include/valuelens/guard.hpp
/// @brief Numeric-safety policy shared by every ValueLens formula.
///
/// # Module: Guard
///
/// ## Responsibility
/// Decide, in one place, when a formula result is undefined. Every division
/// performed by a ValueLens formula goes through `safe_divide`.
///
/// ## Policy
/// A divisor is rejected only when it compares equal to exactly `0.0`
/// (`-0.0` included). There is no epsilon band: a denominator of `1e-300`
/// divides normally. NaN is not zero, so NaN inputs propagate through the
/// arithmetic and come back as a defined NaN result.
///
/// ## Guarantees
/// - All functions are `noexcept` and pure
/// - Undefined is always `std::nullopt`, never a sentinel value
///
/// ## NOT Responsible For
/// - Validating signs or ranges of inputs (formulas accept any real value)

#include <optional>

namespace valuelens::guard {

/// Return true iff `value` compares equal to `0.0`.
[[nodiscard]] bool is_zero(double value) noexcept;

/// Divide `numerator` by `denominator`.
///
/// # Returns
/// - `nullopt` if `denominator == 0.0`
/// - `numerator / denominator` otherwise
[[nodiscard]] std::optional<double>
safe_divide(double numerator, double denominator) noexcept;

/// Scale a fractional ratio to a percentage: `ratio * 100`.
[[nodiscard]] double to_percent(double ratio) noexcept;

} // namespace valuelens::guard
