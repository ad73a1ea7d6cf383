#pragma once
/**
 * @file grid.hpp
 * @brief Grilles uniformes sur un intervalle fermé.
 *
 * - Le premier point vaut exactement lo, le dernier exactement hi.
 * - lo == hi : tous les points coïncident (cas valide).
 * - n == 1 : un seul point, lo.
 */

#include <cstddef> // std::size_t
#include <vector>

namespace fxr {
namespace core {

/// @brief i-ème point d’une grille uniforme de n points sur [lo, hi].
/// @note Le dernier point (i == n-1) est forcé à hi (pas d’erreur d’arrondi).
double linspace_at(double lo, double hi, std::size_t n, std::size_t i) noexcept;

/// @brief Grille uniforme de n points sur [lo, hi], bornes incluses.
std::vector<double> linspace(double lo, double hi, std::size_t n);

} // namespace core
} // namespace fxr
