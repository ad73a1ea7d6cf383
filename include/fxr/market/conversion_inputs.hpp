#pragma once
/**
 * @file conversion_inputs.hpp
 * @brief Entrées d’une comparaison de routes de change (directe vs via une devise pivot).
 *
 * # Contenu
 * - budget                    : montant en devise domestique (> 0).
 * - direct_rate               : unités domestiques par unité étrangère (> 0).
 * - home_to_intermediate_rate : unités domestiques par unité pivot (> 0).
 * - RateRange [min, max]      : taux pivot → étrangère (unités étrangères par unité pivot).
 *
 * # Domaines valides
 * - Tous les champs finis et strictement positifs.
 * - min <= max (min == max autorisé : plage dégénérée).
 *
 * # Erreurs
 * - Toute violation lève InvalidInput (dérivée de std::invalid_argument),
 *   **avant** tout calcul.
 */

#include <stdexcept> // std::invalid_argument
#include <string>

namespace fxr {
namespace market {

/// @brief Entrée invalide (valeur non finie, <= 0, ou plage inversée).
class InvalidInput : public std::invalid_argument {
public:
  explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

/// @brief Vérifie qu’une valeur est finie et > 0.
/// @param name  Nom du champ (repris dans le message d’erreur).
/// @throws InvalidInput sinon.
void require_positive(const char* name, double value);

/// @brief Vérifie qu’une valeur est finie (le signe n’est pas contraint).
/// @throws InvalidInput si NaN ou infini.
void require_finite(const char* name, double value);

/// @brief Plage [min, max] de taux pivot → étrangère.
/// @details Immuable après construction.
struct RateRange {
public:
  const double min; ///< Borne basse (> 0).
  const double max; ///< Borne haute (>= min).

  /// @throws InvalidInput si une borne est <= 0 ou si min > max.
  RateRange(double min, double max);

  /// @return Largeur max - min (0 pour une plage dégénérée).
  double width() const noexcept { return max - min; }

  /// @return true si x appartient à [min, max].
  bool contains(double x) const noexcept { return x >= min && x <= max; }
};

/// @brief Taux représentatif d’une plage : (min + max) / 2.
double midpoint(const RateRange& range) noexcept;

/// @brief Taux pivot → étrangère égalisant les deux routes :
/// home_to_intermediate_rate / direct_rate (indépendant du budget).
double break_even_i2f_rate(double direct_rate, double home_to_intermediate_rate) noexcept;

/// @brief Paramètres communs aux deux routes.
/// @details Budget et taux définissant les routes, validés à la construction.
struct ConversionInputs {
public:
  const double budget;                    ///< Budget en devise domestique (> 0).
  const double direct_rate;               ///< Domestique par étrangère (> 0).
  const double home_to_intermediate_rate; ///< Domestique par pivot (> 0).

  /// @throws InvalidInput si un champ n’est pas fini et > 0.
  ConversionInputs(double budget, double direct_rate, double home_to_intermediate_rate);
};

} // namespace market
} // namespace fxr
