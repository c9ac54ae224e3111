#include <gtest/gtest.h>
#include "valuelens/report.hpp"
#include "valuelens/dcf.hpp"
#include "valuelens/constants.hpp"

#include <string>

using namespace valuelens;
using namespace valuelens::report;
using namespace valuelens::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static FinancialStatement make_statement() {
    return FinancialStatement{
        .net_income                = 1000.0,
        .depreciation_amortization = 200.0,
        .maintenance_capex         = 150.0,
        .shareholders_equity       = 2000.0,
        .total_assets              = 3000.0,
        .total_liabilities         = 1000.0,
        .intangible_assets         = 500.0,
        .shares_outstanding        = 100.0,
    };
}

// ─── Defaults ─────────────────────────────────────────────────────────────────

TEST(Report_Config, DefaultsFromConstants) {
    const ValuationConfig cfg;
    EXPECT_EQ(cfg.growth_rate,   DEFAULT_GROWTH_RATE);
    EXPECT_EQ(cfg.discount_rate, DEFAULT_DISCOUNT_RATE);
    EXPECT_EQ(cfg.years,         DEFAULT_PROJECTION_YEARS);
}

TEST(Report_Defaults, DefaultConstructed_ZeroedAndEmpty) {
    const ValuationReport r{};
    EXPECT_EQ(r.owners_earnings, 0.0);
    EXPECT_EQ(r.intrinsic_value, 0.0);
    EXPECT_FALSE(r.return_on_equity.has_value());
    EXPECT_FALSE(r.intrinsic_value_per_share.has_value());
    EXPECT_FALSE(r.margin_of_safety.has_value());
    EXPECT_EQ(r.config.years, DEFAULT_PROJECTION_YEARS);
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

TEST(Report_Evaluate, AllRatiosFilled) {
    const auto r = evaluate(make_statement());

    EXPECT_EQ(r.owners_earnings, 1050.0);
    ASSERT_TRUE(r.return_on_equity.has_value());
    EXPECT_EQ(*r.return_on_equity, 50.0);
    ASSERT_TRUE(r.return_on_net_tangible_assets.has_value());
    EXPECT_DOUBLE_EQ(*r.return_on_net_tangible_assets, (1000.0 / 1500.0) * 100.0);
    ASSERT_TRUE(r.debt_to_equity.has_value());
    EXPECT_EQ(*r.debt_to_equity, 0.5);
    ASSERT_TRUE(r.earnings_per_share.has_value());
    EXPECT_EQ(*r.earnings_per_share, 10.0);
    EXPECT_FALSE(r.margin_of_safety.has_value());
}

TEST(Report_Evaluate, DcfSeededWithOwnersEarnings) {
    const ValuationConfig cfg{.growth_rate = 0.04, .discount_rate = 0.09, .years = 12};
    const auto r = evaluate(make_statement(), cfg);

    EXPECT_EQ(r.intrinsic_value, dcf::intrinsic_value(1050.0, 0.04, 0.09, 12));
    ASSERT_TRUE(r.intrinsic_value_per_share.has_value());
    EXPECT_EQ(*r.intrinsic_value_per_share,
              *dcf::intrinsic_value_per_share(1050.0, 0.04, 0.09, 12, 100.0));
    EXPECT_EQ(r.config.years, 12u);
}

TEST(Report_Evaluate, ZeroEquityAndShares_OnlyThoseUndefined) {
    auto st = make_statement();
    st.shareholders_equity = 0.0;
    st.shares_outstanding  = 0.0;

    const auto r = evaluate(st, ValuationConfig{}, 50.0);

    EXPECT_FALSE(r.return_on_equity.has_value());
    EXPECT_FALSE(r.debt_to_equity.has_value());
    EXPECT_FALSE(r.earnings_per_share.has_value());
    EXPECT_FALSE(r.intrinsic_value_per_share.has_value());
    EXPECT_FALSE(r.margin_of_safety.has_value());

    // Unaffected by equity or share count.
    EXPECT_TRUE(r.return_on_net_tangible_assets.has_value());
    EXPECT_GT(r.intrinsic_value, 0.0);
}

TEST(Report_Evaluate, MarketPrice_FillsMarginOfSafety) {
    const ValuationConfig cfg;
    const auto r = evaluate(make_statement(), cfg, 40.0);

    ASSERT_TRUE(r.intrinsic_value_per_share.has_value());
    ASSERT_TRUE(r.margin_of_safety.has_value());
    EXPECT_EQ(*r.margin_of_safety,
              *dcf::margin_of_safety(*r.intrinsic_value_per_share, 40.0));
    EXPECT_GT(*r.margin_of_safety, 0.0);
}

TEST(Report_Evaluate, ZeroProjectionYears_ZeroValueNoMargin) {
    const ValuationConfig cfg{.years = 0};
    const auto r = evaluate(make_statement(), cfg, 40.0);

    EXPECT_EQ(r.intrinsic_value, 0.0);
    ASSERT_TRUE(r.intrinsic_value_per_share.has_value());
    EXPECT_EQ(*r.intrinsic_value_per_share, 0.0);
    // Per-share value of zero leaves the margin undefined.
    EXPECT_FALSE(r.margin_of_safety.has_value());
}

// ─── to_string ────────────────────────────────────────────────────────────────

TEST(Report_ToString, ContainsFormattedMetrics) {
    const auto text = evaluate(make_statement()).to_string();
    EXPECT_NE(text.find("Owner's earnings"), std::string::npos);
    EXPECT_NE(text.find("1050.0000"), std::string::npos);
    EXPECT_NE(text.find("50.0000%"), std::string::npos);
    EXPECT_NE(text.find("years=10"), std::string::npos);
}

TEST(Report_ToString, UndefinedRendersAsNa) {
    auto st = make_statement();
    st.shareholders_equity = 0.0;
    const auto text = evaluate(st).to_string();
    EXPECT_NE(text.find("n/a"), std::string::npos);
}
