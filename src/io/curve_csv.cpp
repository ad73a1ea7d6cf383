#include <fxr/io/curve_csv.hpp>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string fixed10(double v) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(10) << v;
  return os.str();
}

} // namespace

namespace fxr::io {

void CsvCurveSink::direct_level(double yield) {
  direct_ = yield;
  body_.clear();
  rows_ = 0;
}

void CsvCurveSink::sample(double rate, double indirect_yield) {
  body_ += fixed10(rate);
  body_ += ',';
  body_ += fixed10(indirect_yield);
  body_ += ',';
  body_ += fixed10(direct_);
  body_ += '\n';
  ++rows_;
}

void CsvCurveSink::break_even(double rate) {
  os_ << "# direct_yield=" << fixed10(direct_) << '\n'
      << "# break_even_rate=" << fixed10(rate) << '\n'
      << "rate,indirect_yield,direct_yield\n"
      << body_;
  body_.clear();
}

void write_curve_csv(const std::string& path, const fxr::curve::CurveData& curve) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Cannot open CSV file: " + path);
  }
  CsvCurveSink sink(ofs);
  fxr::curve::emit_curve(curve, sink);
  ofs.flush();
  if (!ofs) {
    throw std::runtime_error("Write failed: " + path);
  }
}

} // namespace fxr::io
