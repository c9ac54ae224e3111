/// @file src/growth/growth.cpp
/// @brief EPS compound annual growth rate.

#include "valuelens/growth.hpp"
#include "valuelens/constants.hpp"
#include "valuelens/guard.hpp"

#include <cmath>

namespace valuelens::growth {

// ─── eps_cagr ─────────────────────────────────────────────────────────────────

std::optional<double>
eps_cagr(double initial_eps, double final_eps, double years) noexcept {
    if (guard::is_zero(initial_eps) || years <= 0.0) {
        return std::nullopt;
    }

    const double growth_multiple = final_eps / initial_eps;
    // CAGR = (multiple^(1/years) − 1) × 100
    return guard::to_percent(std::pow(growth_multiple, 1.0 / years) - 1.0);
}

// ─── eps_cagr_from_history ────────────────────────────────────────────────────

std::optional<double>
eps_cagr_from_history(std::span<const double> eps_history) noexcept {
    if (eps_history.size() < constants::MIN_HISTORY_LENGTH) {
        return std::nullopt;
    }

    const double years = static_cast<double>(eps_history.size() - 1);
    return eps_cagr(eps_history.front(), eps_history.back(), years);
}

} // namespace valuelens::growth
