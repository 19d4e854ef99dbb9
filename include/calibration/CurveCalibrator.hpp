#pragma once
#include "../core/ShortRateModel.hpp"
#include "../data/ObservedCurve.hpp"
#include "../simulation/PathSimulator.hpp"
#include "../simulation/DiscountCurveEstimator.hpp"
#include "NelderMeadOptimizer.hpp"
#include <vector>
#include <string>
#include <memory>

namespace shortrate {

/**
 * @brief Calibration d'un modèle de taux court sur une courbe observée.
 *
 * Objectif : SSE(θ) = Σ_m (y_m - spot_θ[m])² sur les maturités observées,
 * chaque essai re-simulant l'ensemble avec la même graine. Les essais
 * invalides ou numériquement dégénérés reçoivent une pénalité finie.
 */
class CurveCalibrator {
public:
    enum class Mode { SCALAR, VECTOR_PARAMETER };

    struct CalibrationConfig {
        size_t maxIterations = 1000;
        size_t maxEvaluations = 0;        // 0 = pas de limite
        double tolerance = 1e-12;         // sur l'écart des SSE du simplexe
        double pointTolerance = 1e-8;
        double initialStep = 0.05;
        size_t restarts = 0;              // relances depuis le meilleur point
        double penalty = 1e10;
        bool verbose = false;
    };

    struct CalibrationResult {
        Mode mode{};
        std::vector<std::string> parameterNames;
        std::vector<double> parameters;
        double objective{};
        double initialObjective{};
        std::vector<double> restartObjectives;  // meilleur SSE après chaque passe
        bool converged{};
        size_t iterations{};
        size_t evaluations{};
        double elapsedSeconds{};
        std::shared_ptr<ShortRateModel> fittedModel;
    };

    /**
     * @throws ConfigurationError si la courbe observée est vide, si une maturité
     *         dépasse la grille ou si le modèle est incompatible avec la grille.
     */
    CurveCalibrator(std::shared_ptr<const ShortRateModel> model,
                    const ObservedCurve& observed,
                    const PathSimulator::SimulationConfig& simulation,
                    const CalibrationConfig& config);

    /**
     * @brief Calibre à partir des paramètres courants du modèle.
     */
    CalibrationResult calibrate() const;

    /**
     * @brief Calibre à partir d'un point de départ explicite.
     * @throws ConfigurationError si la dimension ne correspond pas au modèle.
     */
    CalibrationResult calibrate(const std::vector<double>& initialGuess) const;

    /**
     * @brief SSE pour un vecteur de paramètres (pénalité si invalide ou non fini).
     */
    double objective(const std::vector<double>& params) const;

    /**
     * @brief Courbe spot simulée pour un modèle (même grille et même graine).
     */
    SpotCurve simulateCurve(std::shared_ptr<const ShortRateModel> model) const;

    Mode getMode() const;

private:
    std::shared_ptr<const ShortRateModel> model_;
    ObservedCurve observed_;
    PathSimulator::SimulationConfig simulation_;
    CalibrationConfig config_;

    double sumSquaredErrors(const SpotCurve& curve) const;
};

}
