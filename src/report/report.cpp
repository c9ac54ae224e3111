/// @file src/report/report.cpp
/// @brief ValuationReport assembly and formatting.

#include "valuelens/report.hpp"
#include "valuelens/dcf.hpp"
#include "valuelens/ratios.hpp"

#include <fmt/format.h>

namespace valuelens::report {

namespace {

[[nodiscard]] std::string format_metric(const std::optional<double>& value,
                                        const char*                  suffix = "") {
    if (!value) {
        return "n/a";
    }
    return fmt::format("{:.4f}{}", *value, suffix);
}

} // anonymous namespace

// ─── evaluate ─────────────────────────────────────────────────────────────────

ValuationReport evaluate(const FinancialStatement& statement,
                         const ValuationConfig&    config) noexcept {
    const double oe = ratios::owners_earnings(statement.net_income,
                                              statement.depreciation_amortization,
                                              statement.maintenance_capex);

    ValuationReport out{
        .owners_earnings    = oe,
        .return_on_equity   = ratios::return_on_equity(statement.net_income,
                                                       statement.shareholders_equity),
        .return_on_net_tangible_assets =
            ratios::return_on_net_tangible_assets(statement.net_income,
                                                  statement.total_assets,
                                                  statement.total_liabilities,
                                                  statement.intangible_assets),
        .debt_to_equity     = ratios::debt_to_equity(statement.total_liabilities,
                                                     statement.shareholders_equity),
        .earnings_per_share = ratios::earnings_per_share(statement.net_income,
                                                         statement.shares_outstanding),
        .intrinsic_value    = dcf::intrinsic_value(oe, config.growth_rate,
                                                   config.discount_rate, config.years),
        .intrinsic_value_per_share =
            dcf::intrinsic_value_per_share(oe, config.growth_rate,
                                           config.discount_rate, config.years,
                                           statement.shares_outstanding),
        .margin_of_safety   = std::nullopt,
        .config             = config,
    };
    return out;
}

ValuationReport evaluate(const FinancialStatement& statement,
                         const ValuationConfig&    config,
                         double                    market_price) noexcept {
    ValuationReport out = evaluate(statement, config);
    if (out.intrinsic_value_per_share) {
        out.margin_of_safety =
            dcf::margin_of_safety(*out.intrinsic_value_per_share, market_price);
    }
    return out;
}

// ─── ValuationReport::to_string ───────────────────────────────────────────────

std::string ValuationReport::to_string() const {
    return fmt::format(
        "Owner's earnings        {:.4f}\n"
        "Return on equity        {}\n"
        "Return on NTA           {}\n"
        "Debt to equity          {}\n"
        "Earnings per share      {}\n"
        "Intrinsic value         {:.4f}  (g={:.4f} d={:.4f} years={})\n"
        "Intrinsic value/share   {}\n"
        "Margin of safety        {}\n",
        owners_earnings,
        format_metric(return_on_equity, "%"),
        format_metric(return_on_net_tangible_assets, "%"),
        format_metric(debt_to_equity),
        format_metric(earnings_per_share),
        intrinsic_value, config.growth_rate, config.discount_rate, config.years,
        format_metric(intrinsic_value_per_share),
        format_metric(margin_of_safety, "%"));
}

} // namespace valuelens::report
