#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/valuelens/constants.hpp
/// @brief Numeric constants and configuration defaults for ValueLens.

namespace valuelens::constants {

// ─── Scaling ──────────────────────────────────────────────────────────────────

/// Multiplier that turns a fractional ratio into a percentage (0.25 → 25.0).
static constexpr double PERCENT_SCALE = 100.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
///
/// Used by tests and callers only. Guard conditions inside the library compare
/// against exact zero and never consult this value.
static constexpr double FLOAT_EPSILON = 1e-12;

// ─── Valuation Defaults ───────────────────────────────────────────────────────

/// Default annual growth rate of owner's earnings (5%).
static constexpr double DEFAULT_GROWTH_RATE = 0.05;

/// Default annual discount rate (10%), a common required rate of return.
static constexpr double DEFAULT_DISCOUNT_RATE = 0.10;

/// Default length of the DCF projection window in years.
static constexpr std::uint32_t DEFAULT_PROJECTION_YEARS = 10;

// ─── Growth ───────────────────────────────────────────────────────────────────

/// Minimum number of yearly observations needed to derive a growth rate.
static constexpr std::size_t MIN_HISTORY_LENGTH = 2;

} // namespace valuelens::constants
