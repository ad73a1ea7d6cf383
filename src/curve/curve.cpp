#include <fxr/curve/curve.hpp>

#include <fxr/config/forex_config.hpp>
#include <fxr/core/grid.hpp>

namespace fxr {
namespace curve {

CurveData generate_curve(const fxr::market::ConversionInputs& in,
                         const fxr::market::RateRange& range) {
  constexpr std::size_t N = fxr::config::kCurveSamples;

  CurveData out;
  out.direct_yield    = in.budget / in.direct_rate;
  out.slope           = in.budget / in.home_to_intermediate_rate;
  out.range_min       = range.min;
  out.range_max       = range.max;
  out.break_even_rate = fxr::market::break_even_i2f_rate(in.direct_rate,
                                                         in.home_to_intermediate_rate);

  const std::vector<double> rates = fxr::core::linspace(range.min, range.max, N);
  out.samples.reserve(rates.size());
  for (double r : rates) out.samples.push_back({r, out.slope * r});
  return out;
}

CurveData generate_curve(double budget, double direct_rate,
                         double home_to_intermediate_rate,
                         double range_min, double range_max) {
  const fxr::market::ConversionInputs in(budget, direct_rate, home_to_intermediate_rate);
  const fxr::market::RateRange range(range_min, range_max);
  return generate_curve(in, range);
}

void emit_curve(const CurveData& curve, CurveSink& sink) {
  sink.direct_level(curve.direct_yield);
  for (const auto& p : curve.samples) sink.sample(p.rate, p.indirect_yield);
  sink.break_even(curve.break_even_rate);
}

} // namespace curve
} // namespace fxr
