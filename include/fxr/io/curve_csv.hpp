#pragma once
#include <fxr/curve/curve.hpp>

#include <ostream>
#include <string>

namespace fxr::io {

// Écrit une courbe en CSV :
//   # direct_yield=<v>
//   # break_even_rate=<v>
//   rate,indirect_yield,direct_yield
//   <r>,<y>,<direct>        (une ligne par point)
// Notation fixe, 10 décimales. Les lignes "#" sont émises en tête : la sortie
// est tamponnée jusqu’au point mort (dernier appel de emit_curve).
class CsvCurveSink : public fxr::curve::CurveSink {
public:
  explicit CsvCurveSink(std::ostream& os) : os_(os) {}

  void direct_level(double yield) override;
  void sample(double rate, double indirect_yield) override;
  void break_even(double rate) override;

  std::size_t rows_written() const noexcept { return rows_; }

private:
  std::ostream& os_;
  double direct_{0.0};
  std::string body_;
  std::size_t rows_{0};
};

// Ouvre path et y écrit la courbe. Lève std::runtime_error si le fichier
// ne peut pas être ouvert ou écrit.
void write_curve_csv(const std::string& path, const fxr::curve::CurveData& curve);

} // namespace fxr::io
