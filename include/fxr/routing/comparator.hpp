#pragma once
/**
 * @file comparator.hpp
 * @brief Comparaison route directe vs route via devise pivot, et points morts.
 *
 * # Formules
 *   direct_yield        = budget / direct_rate
 *   intermediate_amount = budget / home_to_intermediate_rate
 *   indirect_yield      = intermediate_amount * i2f_rate
 *   break_even_direct   = budget / indirect_yield      (si indirect_yield > 0)
 *   break_even_i2f      = home_to_intermediate_rate / direct_rate
 *
 * # Points morts
 * - break_even_direct : taux direct pour lequel la route directe rapporterait
 *   exactement autant que la route pivot. Non défini si indirect_yield <= 0 :
 *   std::nullopt (jamais 0, inf ni NaN).
 * - break_even_i2f : taux pivot → étrangère égalisant les deux routes.
 *   Indépendant du budget, toujours défini pour des entrées valides.
 *
 * # Erreurs
 * - budget, direct_rate, home_to_intermediate_rate : fini et > 0, sinon InvalidInput.
 * - i2f_rate : fini, sinon InvalidInput. Une valeur <= 0 est acceptée
 *   (cas dégénéré, break_even_direct absent).
 */

#include <fxr/market/conversion_inputs.hpp>

#include <optional>

namespace fxr {
namespace routing {

/// @brief Résultat d’une comparaison (immuable).
struct ComparisonResult {
  const double direct_yield;         ///< Devise étrangère obtenue en direct.
  const double intermediate_amount;  ///< Devise pivot obtenue à la 1re étape.
  const double indirect_yield;       ///< Devise étrangère obtenue via le pivot.
  const std::optional<double> break_even_direct_rate; ///< Absent si indirect_yield <= 0.
  const double break_even_i2f_rate;  ///< Taux pivot → étrangère d’égalité.
};

/// @brief Route la plus avantageuse.
enum class Route {
  Direct,   ///< La route directe rapporte plus.
  Indirect, ///< La route via le pivot rapporte plus.
  Tie       ///< Égalité (tolérance relative 1e-9).
};

/**
 * @brief Compare les deux routes pour un taux pivot → étrangère donné.
 * @param budget                    Budget domestique (> 0)
 * @param direct_rate               Domestique par étrangère (> 0)
 * @param home_to_intermediate_rate Domestique par pivot (> 0)
 * @param i2f_rate                  Étrangère par pivot (fini)
 * @throws fxr::market::InvalidInput avant tout calcul si une entrée est invalide.
 */
ComparisonResult compare(double budget, double direct_rate,
                         double home_to_intermediate_rate, double i2f_rate);

/// @brief Surcharge sur des entrées déjà validées.
ComparisonResult compare(const fxr::market::ConversionInputs& in, double i2f_rate);

/// @brief Verdict : quelle route rapporte le plus.
/// @param rel_tol Tolérance relative pour déclarer l’égalité.
Route better_route(const ComparisonResult& res, double rel_tol = 1e-9) noexcept;

/// @return "direct", "intermediate" ou "tie".
const char* to_string(Route route) noexcept;

} // namespace routing
} // namespace fxr
