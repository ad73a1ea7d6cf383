#include "fxr/routing/report.hpp"
#include <cassert>
#include <iostream>
#include <string>
using namespace std;

int main() {
  const auto res  = fxr::routing::compare(100000.0, 1.41, 89.1, 72.5);
  const auto rows = fxr::routing::result_rows(res);

  // Ordre et libellés du tableau
  assert(rows.size() == 4);
  assert(rows[0].label == "Foreign via direct route");
  assert(rows[1].label == "Foreign via intermediate route");
  assert(rows[2].label == "Break-even direct rate");
  assert(rows[3].label == "Break-even intermediate rate");
  assert(rows[0].value && *rows[0].value == res.direct_yield);
  assert(rows[1].value && *rows[1].value == res.indirect_yield);
  assert(rows[2].value == res.break_even_direct_rate);
  assert(rows[3].value && *rows[3].value == res.break_even_i2f_rate);

  // Formatage
  assert(fxr::routing::format_value(rows[0].value, 2) == "70921.99");
  assert(fxr::routing::format_value(rows[1].value, 2) == "81369.25");
  assert(fxr::routing::format_value(rows[2].value, 4) == "1.2290");
  assert(fxr::routing::format_value(rows[3].value, 3) == "63.191");
  assert(fxr::routing::format_value(1.76, 1) == "1.8");

  // Valeur absente : "undefined", jamais 0 / inf / nan
  const auto z = fxr::routing::compare(100000.0, 1.41, 89.1, 0.0);
  const auto zrows = fxr::routing::result_rows(z);
  assert(!zrows[2].value);
  const string txt = fxr::routing::format_value(zrows[2].value, 4);
  assert(txt == "undefined");
  assert(txt.find("inf") == string::npos && txt.find("nan") == string::npos);

  cout << "Report OK.\n";
  return 0;
}
