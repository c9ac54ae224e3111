#pragma once

/// @file include/valuelens/types.hpp
/// @brief Shared value types for the ValueLens valuation library.
///
/// Defines the statement input aggregate, the DCF assumption set and the
/// Eigen-based vector alias used by the cash-flow schedule.

#include "valuelens/constants.hpp"

#include <Eigen/Dense>
#include <cstdint>

namespace valuelens {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A per-year column of a cash-flow projection. Index 0 is year 1.
using CashFlowVector = Eigen::VectorXd;

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// One reporting period of accounting figures for a single company.
///
/// All monetary fields share one currency and unit; ValueLens never converts.
struct FinancialStatement {
    double net_income                = 0.0;
    double depreciation_amortization = 0.0;
    double maintenance_capex         = 0.0;
    double shareholders_equity       = 0.0;
    double total_assets              = 0.0;
    double total_liabilities         = 0.0;
    double intangible_assets         = 0.0;
    double shares_outstanding        = 0.0; ///< Count, not a monetary amount
};

// ─── Configuration ────────────────────────────────────────────────────────────

/// Assumptions driving the discounted-cash-flow projection.
///
/// Rates are fractional (0.05 = 5%). Any real value is accepted; nothing here
/// is validated.
struct ValuationConfig {
    double        growth_rate   = constants::DEFAULT_GROWTH_RATE;
    double        discount_rate = constants::DEFAULT_DISCOUNT_RATE;
    std::uint32_t years         = constants::DEFAULT_PROJECTION_YEARS;
};

} // namespace valuelens
