#include <fxr/market/conversion_inputs.hpp>

#include <cmath>   // std::isfinite
#include <sstream>

namespace fxr {
namespace market {

void require_finite(const char* name, double value) {
  if (!std::isfinite(value)) {
    std::ostringstream os;
    os << name << " must be a finite number";
    throw InvalidInput(os.str());
  }
}

void require_positive(const char* name, double value) {
  require_finite(name, value);
  if (value <= 0.0) {
    std::ostringstream os;
    os << name << " must be > 0 (got " << value << ")";
    throw InvalidInput(os.str());
  }
}

RateRange::RateRange(double min, double max) : min(min), max(max) {
  require_positive("RateRange: min", min);
  require_positive("RateRange: max", max);
  if (min > max) {
    std::ostringstream os;
    os << "RateRange: min must be <= max (got [" << min << ", " << max << "])";
    throw InvalidInput(os.str());
  }
}

double midpoint(const RateRange& range) noexcept {
  return 0.5 * (range.min + range.max);
}

double break_even_i2f_rate(double direct_rate, double home_to_intermediate_rate) noexcept {
  return home_to_intermediate_rate / direct_rate;
}

ConversionInputs::ConversionInputs(double budget, double direct_rate,
                                   double home_to_intermediate_rate)
    : budget(budget),
      direct_rate(direct_rate),
      home_to_intermediate_rate(home_to_intermediate_rate) {
  require_positive("ConversionInputs: budget", budget);
  require_positive("ConversionInputs: direct_rate", direct_rate);
  require_positive("ConversionInputs: home_to_intermediate_rate", home_to_intermediate_rate);
}

} // namespace market
} // namespace fxr
