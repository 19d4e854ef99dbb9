// src/calibration/CurveCalibrator.cpp
#include "calibration/CurveCalibrator.hpp"
#include "core/Errors.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <iomanip>

namespace shortrate {

CurveCalibrator::CurveCalibrator(std::shared_ptr<const ShortRateModel> model,
                                 const ObservedCurve& observed,
                                 const PathSimulator::SimulationConfig& simulation,
                                 const CalibrationConfig& config)
    : model_(std::move(model)), observed_(observed), simulation_(simulation), config_(config)
{
    if (!model_) {
        throw ConfigurationError("CurveCalibrator requires a model");
    }
    if (observed_.empty()) {
        throw ConfigurationError("Observed curve is empty");
    }
    if (observed_.maxMaturity() > simulation_.nSteps) {
        throw ConfigurationError("Observed maturity step " + std::to_string(observed_.maxMaturity())
                                 + " exceeds the grid size " + std::to_string(simulation_.nSteps));
    }
    // Validation anticipée de la configuration de simulation
    PathSimulator check(model_, simulation_);
    (void)check;
}

CurveCalibrator::Mode CurveCalibrator::getMode() const {
    return model_->hasTimeDependentParameters() ? Mode::VECTOR_PARAMETER : Mode::SCALAR;
}

// ============================================================================
// FONCTION OBJECTIF
// ============================================================================

SpotCurve CurveCalibrator::simulateCurve(std::shared_ptr<const ShortRateModel> model) const {
    PathSimulator simulator(std::move(model), simulation_);
    PathEnsemble paths = simulator.simulate();
    return DiscountCurveEstimator::estimate(paths, simulator.getTimeGrid());
}

double CurveCalibrator::sumSquaredErrors(const SpotCurve& curve) const {
    double sse = 0.0;
    for (const auto& [m, y] : observed_) {
        double diff = y - curve.atMaturityStep(m);
        sse += diff * diff;
    }
    return sse;
}

double CurveCalibrator::objective(const std::vector<double>& params) const {
    auto trial = model_->clone();
    try {
        trial->setParametersVector(params);
    } catch (const ConfigurationError&) {
        // Paramètres hors domaine (β < 0, σ < 0, ...)
        return config_.penalty;
    }

    double sse = sumSquaredErrors(simulateCurve(trial));
    return std::isfinite(sse) ? sse : config_.penalty;
}

// ============================================================================
// CALIBRATION
// ============================================================================

CurveCalibrator::CalibrationResult CurveCalibrator::calibrate() const {
    return calibrate(model_->getParametersVector());
}

CurveCalibrator::CalibrationResult CurveCalibrator::calibrate(const std::vector<double>& initialGuess) const {
    auto names = model_->getParameterNames();
    if (initialGuess.size() != names.size()) {
        throw ConfigurationError("Initial guess has " + std::to_string(initialGuess.size())
                                 + " values, " + model_->getName() + " expects " + std::to_string(names.size()));
    }

    // Un point de départ invalide est une erreur de configuration
    model_->clone()->setParametersVector(initialGuess);

    auto start = std::chrono::steady_clock::now();

    CalibrationResult res;
    res.mode = getMode();
    res.parameterNames = names;
    res.initialObjective = objective(initialGuess);
    res.evaluations = 1;

    NelderMeadOptimizer::Options options;
    options.maxIterations = config_.maxIterations;
    options.functionTolerance = config_.tolerance;
    options.pointTolerance = config_.pointTolerance;
    options.initialStep = config_.initialStep;

    NelderMeadOptimizer::Objective f = [this](const Eigen::VectorXd& x) {
        return objective(std::vector<double>(x.data(), x.data() + x.size()));
    };

    Eigen::VectorXd best = Eigen::Map<const Eigen::VectorXd>(initialGuess.data(), initialGuess.size());
    double bestValue = res.initialObjective;

    for (size_t pass = 0; pass <= config_.restarts; ++pass) {
        if (config_.maxEvaluations > 0) {
            if (res.evaluations >= config_.maxEvaluations) break;
            // Une relance doit au moins pouvoir évaluer son simplexe initial
            if (pass > 0 && config_.maxEvaluations - res.evaluations < names.size()) break;
            options.maxEvaluations = config_.maxEvaluations - res.evaluations;
        }

        // Le meilleur point est déjà évalué : il devient le sommet 0 sans nouvelle simulation
        NelderMeadOptimizer optimizer(options);
        auto run = optimizer.minimize(f, best, bestValue);
        res.iterations += run.iterations;
        res.evaluations += run.evaluations;
        res.converged = run.converged;

        if (run.value < bestValue) {
            best = run.best;
            bestValue = run.value;
        }
        res.restartObjectives.push_back(bestValue);

        if (config_.verbose) {
            std::cout << "  pass " << pass << " : SSE = " << std::scientific << std::setprecision(6)
                      << bestValue << " (" << run.iterations << " iterations, "
                      << run.evaluations << " evaluations)" << std::defaultfloat << "\n";
        }
    }

    res.parameters.assign(best.data(), best.data() + best.size());
    res.objective = bestValue;

    auto fitted = model_->clone();
    fitted->setParametersVector(res.parameters);
    res.fittedModel = fitted;

    auto end = std::chrono::steady_clock::now();
    res.elapsedSeconds = std::chrono::duration<double>(end - start).count();

    if (!res.converged) {
        std::cerr << "[warning] " << model_->getName() << " calibration stopped after "
                  << res.iterations << " iterations without reaching the tolerance; "
                  << "best SSE = " << res.objective << "\n";
    }
    if (res.objective >= config_.penalty) {
        std::cerr << "[warning] every trial parameter vector was invalid or numerically degenerate\n";
    }
    return res;
}

}
