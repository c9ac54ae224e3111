/**
 * @file  fuzz_valuation.cpp
 * @brief libFuzzer target for the ValueLens formula set
 *
 * Build:
 *   cmake -DVALUELENS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_valuation
 *
 * Run for 60 seconds:
 *   ./fuzz_valuation -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. Each ratio is undefined iff its divisor is exactly 0.0.
 *   3. The DCF schedule total equals intrinsic_value bit for bit.
 *   4. The report agrees with the individual formulas.
 *
 * Fuzzer strategy:
 *   The input bytes are interpreted as raw doubles via memcpy, so every
 *   IEEE 754 bit pattern (NaN, ±Inf, ±0, denormals) reaches the formulas.
 *   The trailing byte, if any, selects the projection length.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <algorithm>

#include "valuelens/dcf.hpp"
#include "valuelens/growth.hpp"
#include "valuelens/ratios.hpp"
#include "valuelens/report.hpp"

using namespace valuelens;

namespace {

constexpr std::size_t kFields = 11;

bool same_double(double a, double b) {
    return a == b || (std::isnan(a) && std::isnan(b));
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    double f[kFields] = {};
    const size_t n_doubles = std::min(size / sizeof(double), kFields);
    for (size_t i = 0; i < n_doubles; ++i) {
        std::memcpy(&f[i], data + i * sizeof(double), sizeof(double));
    }

    std::uint32_t years = 10;
    if ((size % sizeof(double)) > 0) {
        years = data[size - 1u];  // 0 … 255
    }

    const FinancialStatement st{
        .net_income                = f[0],
        .depreciation_amortization = f[1],
        .maintenance_capex         = f[2],
        .shareholders_equity       = f[3],
        .total_assets              = f[4],
        .total_liabilities         = f[5],
        .intangible_assets         = f[6],
        .shares_outstanding        = f[7],
    };
    const ValuationConfig cfg{.growth_rate = f[8], .discount_rate = f[9], .years = years};

    // Invariant 2: exact-zero guards.
    assert(ratios::return_on_equity(st.net_income, st.shareholders_equity).has_value()
           == (st.shareholders_equity != 0.0));
    assert(ratios::debt_to_equity(st.total_liabilities, st.shareholders_equity).has_value()
           == (st.shareholders_equity != 0.0));
    assert(ratios::earnings_per_share(st.net_income, st.shares_outstanding).has_value()
           == (st.shares_outstanding != 0.0));

    const double nta = ratios::net_tangible_assets(st.total_assets, st.total_liabilities,
                                                   st.intangible_assets);
    assert(ratios::return_on_net_tangible_assets(st.net_income, st.total_assets,
                                                 st.total_liabilities,
                                                 st.intangible_assets).has_value()
           == (nta != 0.0));

    const auto cagr = growth::eps_cagr(f[0], f[1], f[10]);
    // NaN years is not <= 0, so it yields a defined NaN rather than nullopt.
    assert(cagr.has_value() == !(f[0] == 0.0 || f[10] <= 0.0));

    // Invariant 3: schedule reconciles with the accumulator.
    const double oe = ratios::owners_earnings(st.net_income, st.depreciation_amortization,
                                              st.maintenance_capex);
    const double iv = dcf::intrinsic_value(oe, cfg.growth_rate, cfg.discount_rate, years);
    const auto schedule = dcf::project_cash_flows(oe, cfg.growth_rate,
                                                  cfg.discount_rate, years);
    assert(schedule.years() == years);
    assert(same_double(schedule.total, iv));

    // Invariant 4: report is a pure composition.
    const auto rep = report::evaluate(st, cfg, f[10]);
    assert(same_double(rep.owners_earnings, oe));
    assert(same_double(rep.intrinsic_value, iv));
    assert(rep.intrinsic_value_per_share.has_value() == (st.shares_outstanding != 0.0));
    (void)rep.to_string();

    (void)cagr;
    (void)iv;
    return 0;
}
