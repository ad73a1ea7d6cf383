#include <fxr/routing/comparator.hpp>

#include <algorithm> // std::max
#include <cmath>     // std::abs

namespace fxr {
namespace routing {

ComparisonResult compare(const fxr::market::ConversionInputs& in, double i2f_rate) {
  fxr::market::require_finite("compare: i2f_rate", i2f_rate);

  const double direct       = in.budget / in.direct_rate;
  const double intermediate = in.budget / in.home_to_intermediate_rate;
  const double indirect     = intermediate * i2f_rate;

  // Non défini si la route pivot ne rapporte rien
  std::optional<double> be_direct;
  if (indirect > 0.0) be_direct = in.budget / indirect;

  return ComparisonResult{
      direct, intermediate, indirect, be_direct,
      fxr::market::break_even_i2f_rate(in.direct_rate, in.home_to_intermediate_rate)};
}

ComparisonResult compare(double budget, double direct_rate,
                         double home_to_intermediate_rate, double i2f_rate) {
  const fxr::market::ConversionInputs in(budget, direct_rate, home_to_intermediate_rate);
  return compare(in, i2f_rate);
}

Route better_route(const ComparisonResult& res, double rel_tol) noexcept {
  const double a = res.direct_yield;
  const double b = res.indirect_yield;
  const double scale = std::max(std::abs(a), std::abs(b));
  if (std::abs(a - b) <= rel_tol * scale) return Route::Tie;
  return (a > b) ? Route::Direct : Route::Indirect;
}

const char* to_string(Route route) noexcept {
  switch (route) {
    case Route::Direct:   return "direct";
    case Route::Indirect: return "intermediate";
    case Route::Tie:      return "tie";
  }
  return "tie";
}

} // namespace routing
} // namespace fxr
