/**
 * @file DiscountCurveEstimator.hpp
 * @brief Estimation Monte Carlo de la courbe zéro-coupon à partir d'un ensemble.
 */

#pragma once
#include "simulation/PathSimulator.hpp"
#include <vector>
#include <string>

namespace shortrate {

/**
 * @brief Courbe de taux spot en composition continue.
 *
 * L'entrée i correspond à la maturité (i+1)*dt ; rates[0] vaut r_0 par
 * convention. Une valeur +inf signale un facteur d'actualisation dégénéré.
 */
struct SpotCurve {
    std::vector<double> rates;            /**< Taux spot par maturité */
    std::vector<double> discountFactors;  /**< Estimation MC de P(0, (i+1)dt) */
    std::vector<double> standardErrors;   /**< Erreur standard de P̂ */
    double dt{};                          /**< Pas de la grille */

    size_t size() const { return rates.size(); }
    double operator[](size_t i) const { return rates[i]; }

    /**
     * @brief Taux spot pour la maturité m*dt (1 <= m <= N)
     */
    double atMaturityStep(size_t m) const;

    double maturity(size_t i) const { return (i + 1) * dt; }

    bool isFinite() const;
};

/**
 * @class DiscountCurveEstimator
 * @brief Convertit un PathEnsemble en SpotCurve (fonction pure de la matrice).
 *
 * Pour chaque maturité i >= 1 :
 *   I_j = dt * sum_{k=0..i} r_{k,j}        (somme de Riemann à gauche)
 *   P̂   = moyenne_j exp(-I_j)
 *   spot[i] = -ln(P̂) / ((i+1) * dt)
 */
class DiscountCurveEstimator {
public:
    /**
     * @param paths Ensemble N x M
     * @param dt Pas de la grille utilisée pour simuler l'ensemble
     * @throws std::invalid_argument si l'ensemble est vide ou dt <= 0
     */
    static SpotCurve estimate(const PathEnsemble& paths, double dt);

    static SpotCurve estimate(const PathEnsemble& paths, const TimeGrid& grid) {
        return estimate(paths, grid.getTimeStep());
    }

    /**
     * @brief Exporte la courbe (maturité, taux, P̂, erreur standard) en CSV.
     */
    static void exportToCSV(const SpotCurve& curve, const std::string& filename);
};

} // namespace shortrate
