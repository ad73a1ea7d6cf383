#include <fxr/core/grid.hpp>

namespace fxr {
namespace core {

double linspace_at(double lo, double hi, std::size_t n, std::size_t i) noexcept {
  if (n <= 1 || i == 0) return lo;
  if (i >= n - 1) return hi;
  const double step = (hi - lo) / static_cast<double>(n - 1);
  return lo + step * static_cast<double>(i);
}

std::vector<double> linspace(double lo, double hi, std::size_t n) {
  std::vector<double> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) out.push_back(linspace_at(lo, hi, n, i));
  return out;
}

} // namespace core
} // namespace fxr
