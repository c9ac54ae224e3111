/// @file src/ratios/ratios.cpp
/// @brief Owner's earnings, ROE, RONTA, debt-to-equity and EPS.

#include "valuelens/ratios.hpp"
#include "valuelens/guard.hpp"

namespace valuelens::ratios {

// ─── owners_earnings ──────────────────────────────────────────────────────────

double owners_earnings(double net_income,
                       double depreciation_amortization,
                       double maintenance_capex) noexcept {
    return net_income + depreciation_amortization - maintenance_capex;
}

// ─── return_on_equity ─────────────────────────────────────────────────────────

std::optional<double>
return_on_equity(double net_income, double shareholders_equity) noexcept {
    const auto ratio = guard::safe_divide(net_income, shareholders_equity);
    if (!ratio) {
        return std::nullopt;
    }
    return guard::to_percent(*ratio);
}

// ─── net_tangible_assets ──────────────────────────────────────────────────────

double net_tangible_assets(double total_assets,
                           double total_liabilities,
                           double intangible_assets) noexcept {
    return total_assets - total_liabilities - intangible_assets;
}

// ─── return_on_net_tangible_assets ────────────────────────────────────────────

std::optional<double>
return_on_net_tangible_assets(double net_income,
                              double total_assets,
                              double total_liabilities,
                              double intangible_assets) noexcept {
    const double nta =
        net_tangible_assets(total_assets, total_liabilities, intangible_assets);

    const auto ratio = guard::safe_divide(net_income, nta);
    if (!ratio) {
        return std::nullopt;
    }
    return guard::to_percent(*ratio);
}

// ─── debt_to_equity ───────────────────────────────────────────────────────────

std::optional<double>
debt_to_equity(double total_liabilities, double shareholders_equity) noexcept {
    return guard::safe_divide(total_liabilities, shareholders_equity);
}

// ─── earnings_per_share ───────────────────────────────────────────────────────

std::optional<double>
earnings_per_share(double net_income, double shares_outstanding) noexcept {
    return guard::safe_divide(net_income, shares_outstanding);
}

} // namespace valuelens::ratios
