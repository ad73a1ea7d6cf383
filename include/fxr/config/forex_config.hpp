#pragma once
/**
 * @file forex_config.hpp
 * @brief Configuration standard d’une comparaison de routes de change.
 *
 * # Contenu
 * - budget, direct_rate, home_to_intermediate_rate : scénario par défaut.
 * - i2f_min, i2f_max : plage de taux pivot → étrangère explorée par la courbe.
 * - precision        : nombre de décimales affichées dans le tableau de résultats.
 *
 * # Résolution de la courbe
 * - kCurveSamples = 100 points, bornes incluses (pas = (max - min) / 99).
 *   Constante : la résolution n’est pas paramétrable.
 */

#include <cstddef> // std::size_t

namespace fxr {
namespace config {

/// @brief Nombre de points de la courbe (bornes incluses).
constexpr std::size_t kCurveSamples = 100;

/// @brief Configuration d’un run (valeurs par défaut = scénario de référence).
struct ForexConfig {
  double budget                    = 100000.0; ///< Devise domestique.
  double direct_rate               = 1.41;     ///< Domestique par étrangère.
  double home_to_intermediate_rate = 89.1;     ///< Domestique par pivot.
  double i2f_min                   = 60.0;     ///< Borne basse pivot → étrangère.
  double i2f_max                   = 85.0;     ///< Borne haute pivot → étrangère.

  int precision = 4; ///< Décimales du tableau de résultats.
};

} // namespace config
} // namespace fxr
