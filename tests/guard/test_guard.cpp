#include <gtest/gtest.h>
#include "valuelens/guard.hpp"

#include <cmath>
#include <limits>

using namespace valuelens::guard;

// ─── is_zero ──────────────────────────────────────────────────────────────────

TEST(Guard_IsZero, PositiveAndNegativeZero_True) {
    EXPECT_TRUE(is_zero(0.0));
    EXPECT_TRUE(is_zero(-0.0));
}

TEST(Guard_IsZero, SmallestSubnormal_False) {
    // No epsilon band: anything that is not exactly zero is a valid divisor.
    EXPECT_FALSE(is_zero(std::numeric_limits<double>::denorm_min()));
    EXPECT_FALSE(is_zero(-1e-300));
}

TEST(Guard_IsZero, NaN_False) {
    EXPECT_FALSE(is_zero(std::numeric_limits<double>::quiet_NaN()));
}

// ─── safe_divide ──────────────────────────────────────────────────────────────

TEST(Guard_SafeDivide, NonZeroDenominator_Quotient) {
    auto q = safe_divide(6.0, 3.0);
    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(*q, 2.0);
}

TEST(Guard_SafeDivide, ZeroDenominator_Nullopt) {
    EXPECT_FALSE(safe_divide(1.0, 0.0).has_value());
    EXPECT_FALSE(safe_divide(0.0, 0.0).has_value());
    EXPECT_FALSE(safe_divide(-5.0, -0.0).has_value());
}

TEST(Guard_SafeDivide, TinyDenominator_DividesNormally) {
    auto q = safe_divide(1.0, 1e-300);
    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(*q, 1e300);
}

TEST(Guard_SafeDivide, NaNDenominator_DefinedNaN) {
    auto q = safe_divide(1.0, std::numeric_limits<double>::quiet_NaN());
    ASSERT_TRUE(q.has_value());
    EXPECT_TRUE(std::isnan(*q));
}

// ─── to_percent ───────────────────────────────────────────────────────────────

TEST(Guard_ToPercent, ScalesByHundred) {
    EXPECT_DOUBLE_EQ(to_percent(0.25), 25.0);
    EXPECT_DOUBLE_EQ(to_percent(-0.5), -50.0);
    EXPECT_DOUBLE_EQ(to_percent(0.0), 0.0);
}
