#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../include/calibration/CurveCalibrator.hpp"
#include "../include/models/Vasicek.hpp"
#include "../include/models/HullWhite.hpp"
#include "../include/models/CoxIngersollRoss.hpp"
#include "../include/models/Dothan.hpp"
#include "../include/models/TwoFactorGaussian.hpp"
#include "VasicekReference.hpp"

#include <cmath>

using namespace shortrate;
using Catch::Approx;

namespace {

PathSimulator::SimulationConfig vasicekGrid(size_t nPaths) {
    PathSimulator::SimulationConfig cfg;
    cfg.nPaths = nPaths;
    cfg.nSteps = 60;
    cfg.horizon = 5.0;
    cfg.seed = 42;
    return cfg;
}

// Courbe « observée » produite par le même simulateur aux pas 5, 10, ..., 60
ObservedCurve observedFrom(const SpotCurve& curve) {
    ObservedCurve observed;
    for (size_t m = 5; m <= 60; m += 5) {
        observed.push_back(m, curve.atMaturityStep(m));
    }
    return observed;
}

ObservedCurve observedFrom(const std::shared_ptr<const ShortRateModel>& model,
                           const PathSimulator::SimulationConfig& sim) {
    PathSimulator simulator(model, sim);
    return observedFrom(DiscountCurveEstimator::estimate(simulator.simulate(), simulator.getTimeGrid()));
}

}

// Test 1 : auto-cohérence
TEST_CASE("Calibration on its own curve keeps a zero objective", "[CurveCalibrator]")
{
    auto truth = std::make_shared<Vasicek>(0.03, 0.03, 0.5, 0.005);
    auto sim = vasicekGrid(2000);

    PathSimulator simulator(truth, sim);
    ObservedCurve observed = observedFrom(
        DiscountCurveEstimator::estimate(simulator.simulate(), simulator.getTimeGrid()));

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 300;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto result = calibrator.calibrate();

    REQUIRE(result.mode == CurveCalibrator::Mode::SCALAR);
    REQUIRE(result.initialObjective == Approx(0.0).margin(1e-18));
    REQUIRE(result.objective == Approx(0.0).margin(1e-18));
    REQUIRE(result.parameters[0] == Approx(0.03).margin(1e-6));
    REQUIRE(result.parameters[1] == Approx(0.5).margin(1e-6));
    REQUIRE(result.parameters[2] == Approx(0.005).margin(1e-6));
}

TEST_CASE("True Vasicek parameters fit the closed-form curve", "[CurveCalibrator][Vasicek]")
{
    const double r0 = 0.03, alpha = 0.03, beta = 0.5, sigma = 0.005;
    auto truth = std::make_shared<Vasicek>(r0, alpha, beta, sigma);
    auto sim = vasicekGrid(5000);

    ObservedCurve observed;
    for (size_t m = 5; m <= 60; m += 5) {
        observed.push_back(m, vasicek_reference::spotRate(r0, alpha, beta, sigma, m / 12.0));
    }

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 40;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto result = calibrator.calibrate();

    REQUIRE(result.initialObjective < 1e-6);
    REQUIRE(result.objective <= result.initialObjective);
    REQUIRE(result.iterations <= 40);
}

// Test 2 : retrouver les paramètres depuis un point perturbé
TEST_CASE("Calibration from a perturbed start reduces the error", "[CurveCalibrator]")
{
    auto truth = std::make_shared<Vasicek>(0.03, 0.03, 0.5, 0.005);
    auto sim = vasicekGrid(2000);

    PathSimulator simulator(truth, sim);
    ObservedCurve observed = observedFrom(
        DiscountCurveEstimator::estimate(simulator.simulate(), simulator.getTimeGrid()));

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 400;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto result = calibrator.calibrate({0.045, 0.3, 0.008});

    REQUIRE(result.initialObjective > 0.0);
    REQUIRE(result.objective < 0.01 * result.initialObjective);
    REQUIRE(result.fittedModel->getParametersVector() == result.parameters);
    REQUIRE(result.restartObjectives.size() == 1);
}

// Test 3 : pénalités
TEST_CASE("Invalid or degenerate parameters receive the penalty", "[CurveCalibrator]")
{
    auto model = std::make_shared<Vasicek>(0.03, 0.03, 0.5, 0.005);
    auto sim = vasicekGrid(200);
    ObservedCurve observed(std::vector<std::pair<size_t, double>>{{12, 0.031}, {60, 0.034}});

    CurveCalibrator::CalibrationConfig cal;
    CurveCalibrator calibrator(model, observed, sim, cal);

    REQUIRE(calibrator.objective({0.03, 0.5, -0.01}) == cal.penalty);
    REQUIRE(calibrator.objective({0.03, -0.5, 0.01}) == cal.penalty);

    // Taux explosifs : P̂ sous-dépasse, le spot est infini
    REQUIRE(calibrator.objective({1e5, 10.0, 0.01}) == cal.penalty);

    double sse = calibrator.objective({0.03, 0.5, 0.005});
    REQUIRE(std::isfinite(sse));
    REQUIRE(sse < cal.penalty);
}

// Test 4 : erreurs de construction
TEST_CASE("Calibrator rejects inconsistent inputs", "[CurveCalibrator]")
{
    auto model = std::make_shared<Vasicek>(0.03, 0.03, 0.5, 0.005);
    auto sim = vasicekGrid(100);
    CurveCalibrator::CalibrationConfig cal;

    REQUIRE_THROWS_AS(CurveCalibrator(model, ObservedCurve(), sim, cal), ConfigurationError);
    ObservedCurve beyondGrid;
    beyondGrid.push_back(61, 0.03);
    REQUIRE_THROWS_AS(CurveCalibrator(model, beyondGrid, sim, cal), ConfigurationError);

    ObservedCurve single;
    single.push_back(60, 0.03);
    CurveCalibrator calibrator(model, single, sim, cal);
    REQUIRE_THROWS_AS(calibrator.calibrate({0.03, 0.5}), ConfigurationError);
    REQUIRE_THROWS_AS(calibrator.calibrate({0.03, 0.5, -1.0}), ConfigurationError);
}

// Test 5 : Hull-White, un α par pas
TEST_CASE("Hull-White calibration fits the per-step mean level", "[CurveCalibrator][HullWhite]")
{
    const size_t nSteps = 360;
    auto model = HullWhite::withFlatMean(0.02, nSteps, 0.02, 0.3, 0.005);

    PathSimulator::SimulationConfig sim;
    sim.nPaths = 64;
    sim.nSteps = nSteps;
    sim.horizon = 30.0;
    sim.seed = 11;

    ObservedCurve observed;
    for (size_t i = 0; i < 12; ++i) {
        observed.push_back(30 * (i + 1), 0.025 + 0.02 * static_cast<double>(i) / 11.0);
    }

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 1500;
    cal.maxEvaluations = 6000;
    cal.restarts = 2;
    CurveCalibrator calibrator(model, observed, sim, cal);

    REQUIRE(calibrator.getMode() == CurveCalibrator::Mode::VECTOR_PARAMETER);

    auto result = calibrator.calibrate();

    REQUIRE(result.mode == CurveCalibrator::Mode::VECTOR_PARAMETER);
    REQUIRE(result.parameters.size() == nSteps + 2);
    REQUIRE(result.parameterNames.size() == nSteps + 2);
    REQUIRE(result.evaluations <= 6001);
    REQUIRE(result.objective < result.initialObjective);

    REQUIRE_FALSE(result.restartObjectives.empty());
    for (size_t i = 1; i < result.restartObjectives.size(); ++i) {
        REQUIRE(result.restartObjectives[i] <= result.restartObjectives[i - 1]);
    }
    REQUIRE(result.restartObjectives.back() == result.objective);

    // La courbe recalculée avec les paramètres retenus redonne l'objectif
    SpotCurve fitted = calibrator.simulateCurve(result.fittedModel);
    double sse = 0.0;
    for (const auto& [m, y] : observed) {
        double diff = y - fitted.atMaturityStep(m);
        sse += diff * diff;
    }
    REQUIRE(sse == Approx(result.objective));
}

// Test 6 : budget d'évaluations inférieur à la taille du simplexe
TEST_CASE("Evaluation budget caps a high-dimensional calibration", "[CurveCalibrator][HullWhite]")
{
    auto model = HullWhite::withFlatMean(0.02, 12, 0.02, 0.3, 0.005);

    PathSimulator::SimulationConfig sim;
    sim.nPaths = 32;
    sim.nSteps = 12;
    sim.horizon = 1.0;

    ObservedCurve observed;
    observed.push_back(6, 0.025);
    observed.push_back(12, 0.03);

    CurveCalibrator::CalibrationConfig cal;
    cal.maxEvaluations = 5;
    cal.restarts = 2;
    CurveCalibrator calibrator(model, observed, sim, cal);

    auto result = calibrator.calibrate();

    REQUIRE(result.evaluations <= cal.maxEvaluations + 1);
    REQUIRE_FALSE(result.converged);
    REQUIRE(result.objective <= result.initialObjective);
    REQUIRE(result.parameters.size() == 14);
}

// Test 7 : non-convergence
TEST_CASE("Exhausted iteration budget still returns the best point", "[CurveCalibrator]")
{
    auto truth = std::make_shared<Vasicek>(0.03, 0.03, 0.5, 0.005);
    auto sim = vasicekGrid(500);
    ObservedCurve observed = observedFrom(truth, sim);

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 2;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto result = calibrator.calibrate({0.045, 0.3, 0.008});

    REQUIRE_FALSE(result.converged);
    REQUIRE(result.iterations == 2);
    REQUIRE(result.objective <= result.initialObjective);
    REQUIRE(result.parameters.size() == 3);
    for (double p : result.parameters) {
        REQUIRE(std::isfinite(p));
    }
    REQUIRE(result.fittedModel != nullptr);
    REQUIRE(result.fittedModel->getParametersVector() == result.parameters);
}

// Test 8 : autres modèles en mode scalaire
TEST_CASE("Two-factor calibration keeps the correlation fixed", "[CurveCalibrator][TwoFactor]")
{
    auto truth = std::make_shared<TwoFactorGaussian>(0.01, 0.005, 0.02, 0.5, 0.01, 0.01, 0.1, 0.005, -0.3);
    auto sim = vasicekGrid(500);
    ObservedCurve observed = observedFrom(truth, sim);

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 300;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto result = calibrator.calibrate({0.03, 0.4, 0.01, 0.01, 0.1, 0.005});

    REQUIRE(result.mode == CurveCalibrator::Mode::SCALAR);
    REQUIRE(result.parameters.size() == 6);
    REQUIRE(result.objective < result.initialObjective);

    auto fitted = std::dynamic_pointer_cast<TwoFactorGaussian>(result.fittedModel);
    REQUIRE(fitted != nullptr);
    REQUIRE(fitted->getRho() == -0.3);
    REQUIRE(fitted->getInitialRate() == Approx(0.015));
}

TEST_CASE("CIR calibration recovers from a perturbed start", "[CurveCalibrator][CIR]")
{
    auto truth = std::make_shared<CoxIngersollRoss>(0.02, 0.04, 0.4, 0.08);
    auto sim = vasicekGrid(1000);
    ObservedCurve observed = observedFrom(truth, sim);

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 300;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto self = calibrator.calibrate();
    REQUIRE(self.objective == Approx(0.0).margin(1e-18));

    auto result = calibrator.calibrate({0.03, 0.2, 0.15});
    REQUIRE(result.objective < 0.05 * result.initialObjective);
    for (double p : result.parameters) {
        REQUIRE(std::isfinite(p));
    }
}

TEST_CASE("Dothan calibration searches a single volatility", "[CurveCalibrator][Dothan]")
{
    auto truth = std::make_shared<Dothan>(0.03, 0.3);
    auto sim = vasicekGrid(1000);
    ObservedCurve observed = observedFrom(truth, sim);

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 200;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    auto result = calibrator.calibrate({0.1});

    REQUIRE(result.parameters.size() == 1);
    REQUIRE(result.objective < result.initialObjective);
    REQUIRE(result.parameters[0] > 0.1);
}

// Test 9 : recherche traversant une région pénalisée
TEST_CASE("Search across negative volatility stays on valid parameters", "[CurveCalibrator]")
{
    // Courbe déterministe (σ = 0) : l'optimum est sur le bord σ = 0
    auto truth = std::make_shared<Vasicek>(0.02, 0.04, 0.5, 0.0);
    auto sim = vasicekGrid(200);
    ObservedCurve observed = observedFrom(truth, sim);

    CurveCalibrator::CalibrationConfig cal;
    cal.maxIterations = 300;
    cal.initialStep = 0.5;
    CurveCalibrator calibrator(truth, observed, sim, cal);

    REQUIRE(calibrator.objective({0.04, 0.5, -0.001}) == cal.penalty);

    auto result = calibrator.calibrate({0.04, 0.5, 0.002});

    REQUIRE(result.objective < cal.penalty);
    REQUIRE(result.objective <= result.initialObjective);
    REQUIRE(result.parameters[2] >= 0.0);
    for (double p : result.parameters) {
        REQUIRE(std::isfinite(p));
    }
}
