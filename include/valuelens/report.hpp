#pragma once

/// @file include/valuelens/report.hpp
/// @brief One-call evaluation of a financial statement.
///
/// # Module: Report
///
/// ## Responsibility
/// Run every ValueLens formula over a single `FinancialStatement` and collect
/// the results in a `ValuationReport`. The DCF is seeded with the statement's
/// own owner's earnings.
///
/// ## Guarantees
/// - Each field is produced by the same function a caller would call directly
///   (ratios.hpp, dcf.hpp); the report adds no arithmetic of its own
/// - Undefined metrics stay `std::nullopt`; nothing is defaulted to zero
///
/// ## NOT Responsible For
/// - Sourcing statements or market prices
/// - Comparing or ranking several companies

#include "valuelens/types.hpp"

#include <optional>
#include <string>

namespace valuelens::report {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Every metric derived from one statement under one set of DCF assumptions.
struct ValuationReport {
    double                owners_earnings = 0.0;           ///< NI + D&A − maintenance capex
    std::optional<double> return_on_equity;            ///< Percent
    std::optional<double> return_on_net_tangible_assets; ///< Percent
    std::optional<double> debt_to_equity;              ///< Plain ratio
    std::optional<double> earnings_per_share;
    double                intrinsic_value = 0.0;           ///< Whole company
    std::optional<double> intrinsic_value_per_share;
    std::optional<double> margin_of_safety;            ///< Percent; needs a market price

    ValuationConfig       config;                      ///< Assumptions used

    /// Multi-line human-readable summary. Undefined metrics print as `n/a`.
    [[nodiscard]] std::string to_string() const;
};

// ─── Evaluation ───────────────────────────────────────────────────────────────

/// Evaluate a statement. `margin_of_safety` is left empty.
[[nodiscard]] ValuationReport
evaluate(const FinancialStatement& statement,
         const ValuationConfig&    config = {}) noexcept;

/// Evaluate a statement and compare the per-share value to `market_price`.
///
/// `margin_of_safety` is `nullopt` when the per-share value is undefined or
/// exactly zero.
[[nodiscard]] ValuationReport
evaluate(const FinancialStatement& statement,
         const ValuationConfig&    config,
         double                    market_price) noexcept;

} // namespace valuelens::report
