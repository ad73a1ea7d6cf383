#pragma once
/**
 * @file curve.hpp
 * @brief Courbe du rendement de la route pivot en fonction du taux pivot → étrangère.
 *
 * # Échantillonnage
 * - kCurveSamples (= 100) points uniformes sur [min, max], bornes incluses.
 * - min == max : 100 points confondus (valide).
 *
 * # Contenu
 * - indirect_yield(r) = (budget / home_to_intermediate_rate) * r : droite en r.
 * - direct_yield      = budget / direct_rate : constante.
 * - break_even_rate   = home_to_intermediate_rate / direct_rate, toujours
 *   renseigné, même hors de [min, max] (visibilité laissée à l’appelant).
 *
 * # Rendu
 * Le cœur ne dessine rien. CurveSink reçoit trois éléments :
 * niveau horizontal (direct), points (r, rendement), marqueur vertical (point mort).
 */

#include <fxr/market/conversion_inputs.hpp>

#include <cstddef>
#include <vector>

namespace fxr {
namespace curve {

/// @brief Un point de la courbe.
struct CurvePoint {
  double rate;           ///< Taux pivot → étrangère.
  double indirect_yield; ///< Devise étrangère obtenue via le pivot.
};

/// @brief Données de tracé (immuables, produites à chaque appel).
struct CurveData {
  double direct_yield{0.0};          ///< Niveau constant de la route directe.
  double slope{0.0};                 ///< budget / home_to_intermediate_rate.
  double range_min{0.0};             ///< Borne basse échantillonnée.
  double range_max{0.0};             ///< Borne haute échantillonnée.
  std::vector<CurvePoint> samples;   ///< kCurveSamples points, taux croissants.
  double break_even_rate{0.0};       ///< Taux pivot → étrangère d’égalité.

  /// @return true si le point mort tombe dans [range_min, range_max].
  bool break_even_in_range() const noexcept {
    return break_even_rate >= range_min && break_even_rate <= range_max;
  }
};

/**
 * @brief Génère la courbe sur une plage de taux.
 * @throws fxr::market::InvalidInput avant tout calcul si une entrée est invalide
 *         (y compris min > max ou borne <= 0).
 */
CurveData generate_curve(double budget, double direct_rate,
                         double home_to_intermediate_rate,
                         double range_min, double range_max);

/// @brief Surcharge sur des entrées déjà validées.
CurveData generate_curve(const fxr::market::ConversionInputs& in,
                         const fxr::market::RateRange& range);

/// @brief Récepteur de données de tracé (graphique, CSV, …).
class CurveSink {
public:
  virtual ~CurveSink() = default;

  /// Ligne horizontale : rendement constant de la route directe.
  virtual void direct_level(double yield) = 0;
  /// Un point de la courbe pivot (appelé dans l’ordre des taux).
  virtual void sample(double rate, double indirect_yield) = 0;
  /// Ligne verticale : taux pivot → étrangère d’égalité.
  virtual void break_even(double rate) = 0;
};

/// @brief Pousse une courbe dans un récepteur : niveau, points, puis point mort.
void emit_curve(const CurveData& curve, CurveSink& sink);

} // namespace curve
} // namespace fxr
