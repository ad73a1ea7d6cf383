#include <fxr/routing/report.hpp>

#include <iomanip>
#include <sstream>

namespace fxr::routing {

std::vector<ResultRow> result_rows(const ComparisonResult& res) {
  return {
    {"Foreign via direct route",       res.direct_yield},
    {"Foreign via intermediate route", res.indirect_yield},
    {"Break-even direct rate",         res.break_even_direct_rate},
    {"Break-even intermediate rate",   res.break_even_i2f_rate},
  };
}

std::string format_value(const std::optional<double>& v, int precision) {
  if (!v) return "undefined";
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(precision < 0 ? 0 : precision) << *v;
  return os.str();
}

} // namespace fxr::routing
