/// @file src/guard/guard.cpp
/// @brief Exact-zero division policy.

#include "valuelens/guard.hpp"
#include "valuelens/constants.hpp"

namespace valuelens::guard {

bool is_zero(double value) noexcept {
    // Exact comparison. -0.0 == 0.0 holds; NaN == 0.0 does not.
    return value == 0.0;
}

std::optional<double>
safe_divide(double numerator, double denominator) noexcept {
    if (is_zero(denominator)) {
        return std::nullopt;
    }
    return numerator / denominator;
}

double to_percent(double ratio) noexcept {
    return ratio * constants::PERCENT_SCALE;
}

} // namespace valuelens::guard
