#pragma once
#include "core/Errors.hpp"
#include <vector>
#include <stdexcept>
#include <string>
#include <cmath>

namespace shortrate {

/**
 * @brief Maillage temporel régulier partagé par le simulateur et l'estimateur
 *
 * La grille contient t0 = 0 < t1 < ... < tN avec un pas constant dt = horizon / N.
 *
 * Exemple : 5 ans en pas mensuels
 *   TimeGrid grid(5.0, 60);   // dt = 1/12
 */
class TimeGrid {
private:
    double horizon_;             // Horizon en années
    size_t nSteps_;              // Nombre de pas N
    double dt_;                  // Pas de temps constant
    std::vector<double> times_;  // Grille complète [t0, t1, ..., tN]

public:
    // ========================================================================
    // CONSTRUCTEURS
    // ========================================================================

    /**
     * @brief Constructeur avec pas de temps régulier
     * @param horizon Horizon en années (strictement positif)
     * @param nSteps Nombre de pas de temps (strictement positif)
     * @throws ConfigurationError si horizon <= 0 ou nSteps == 0
     */
    TimeGrid(double horizon, size_t nSteps)
        : horizon_(horizon), nSteps_(nSteps) {

        if (!(horizon > 0.0) || !std::isfinite(horizon)) {
            throw ConfigurationError("Horizon must be a positive finite number of years, got "
                                     + std::to_string(horizon));
        }
        if (nSteps == 0) {
            throw ConfigurationError("Number of grid steps must be positive");
        }

        dt_ = horizon / static_cast<double>(nSteps);

        times_.reserve(nSteps_ + 1);
        for (size_t i = 0; i <= nSteps_; ++i) {
            times_.push_back(i * dt_);
        }
    }

    /**
     * @brief Grille mensuelle sur nYears années (12 pas par an)
     */
    static TimeGrid monthlyGrid(double nYears) {
        return TimeGrid(nYears, static_cast<size_t>(std::lround(12 * nYears)));
    }

    // ========================================================================
    // ACCESSEURS
    // ========================================================================

    double getHorizon() const { return horizon_; }
    double getTimeStep() const { return dt_; }
    size_t getNumSteps() const { return nSteps_; }
    size_t size() const { return times_.size(); }

    /**
     * @brief Accès au temps à l'index i (0 <= i <= nSteps)
     */
    double operator[](size_t i) const {
        if (i >= times_.size()) {
            throw std::out_of_range("Time index out of range");
        }
        return times_[i];
    }

    /**
     * @brief Maturité (en années) associée au pas m, soit m * dt
     */
    double maturity(size_t m) const { return (*this)[m]; }

    const std::vector<double>& getTimes() const { return times_; }

    /**
     * @brief Index du point de grille le plus proche de t
     */
    size_t findNearestIndex(double t) const {
        if (t <= 0.0) return 0;
        if (t >= horizon_) return nSteps_;
        return static_cast<size_t>(std::lround(t / dt_));
    }

};

}
