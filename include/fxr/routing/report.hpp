#pragma once
#include <fxr/routing/comparator.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fxr::routing {

// Ligne du tableau de résultats (libellé, valeur éventuellement absente).
struct ResultRow {
  std::string label;
  std::optional<double> value;
};

// Tableau affiché par les shells, dans l’ordre :
// direct, via pivot, point mort direct, point mort pivot → étrangère.
std::vector<ResultRow> result_rows(const ComparisonResult& res);

// Formatage à précision fixe ; une valeur absente devient "undefined".
std::string format_value(const std::optional<double>& v, int precision);

} // namespace fxr::routing
