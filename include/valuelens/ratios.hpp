#pragma once

/// @file include/valuelens/ratios.hpp
/// @brief Single-period accounting ratios and owner's earnings.
///
/// # Module: Ratios
///
/// ## Responsibility
/// Turn raw financial-statement figures for one reporting period into the
/// ratios a value investor screens on: owner's earnings, return on equity,
/// return on net tangible assets, leverage and earnings per share.
///
/// ## Guarantees
/// - All functions are `noexcept` pure functions
/// - A ratio is `std::nullopt` exactly when its divisor is `0.0`
///   (see guard.hpp for the policy)
/// - Percent-valued ratios are scaled by 100 after the division
///
/// ## NOT Responsible For
/// - Multi-period growth (see growth.hpp)
/// - Valuation (see dcf.hpp)

#include <optional>

namespace valuelens::ratios {

/// Owner's earnings: net income + depreciation & amortization − maintenance capex.
///
/// Total over all real inputs. A negative result is a valid answer.
[[nodiscard]] double owners_earnings(double net_income,
                                     double depreciation_amortization,
                                     double maintenance_capex) noexcept;

/// Return on equity as a percentage: (net_income / shareholders_equity) × 100.
///
/// # Returns
/// - `nullopt` if `shareholders_equity == 0`
[[nodiscard]] std::optional<double>
return_on_equity(double net_income, double shareholders_equity) noexcept;

/// Net tangible assets: total_assets − total_liabilities − intangible_assets.
///
/// Evaluated left to right with no compensation for cancellation.
[[nodiscard]] double net_tangible_assets(double total_assets,
                                         double total_liabilities,
                                         double intangible_assets) noexcept;

/// Return on net tangible assets as a percentage.
///
/// # Formula
///   RONTA = net_income / (total_assets − total_liabilities − intangible_assets) × 100
///
/// Only the final divisor is checked. A near-zero divisor left behind by
/// cancellation in the subtraction divides normally and may produce a very
/// large result.
///
/// # Returns
/// - `nullopt` if the net tangible assets are exactly `0.0`
[[nodiscard]] std::optional<double>
return_on_net_tangible_assets(double net_income,
                              double total_assets,
                              double total_liabilities,
                              double intangible_assets) noexcept;

/// Debt-to-equity ratio: total_liabilities / shareholders_equity (not a percentage).
///
/// # Returns
/// - `nullopt` if `shareholders_equity == 0`
[[nodiscard]] std::optional<double>
debt_to_equity(double total_liabilities, double shareholders_equity) noexcept;

/// Earnings per share: net_income / shares_outstanding.
///
/// # Returns
/// - `nullopt` if `shares_outstanding == 0`
[[nodiscard]] std::optional<double>
earnings_per_share(double net_income, double shares_outstanding) noexcept;

} // namespace valuelens::ratios
