#include "core/TimeGrid.hpp"
#include "core/Errors.hpp"
#include "simulation/PathSimulator.hpp"
#include "simulation/DiscountCurveEstimator.hpp"
#include "calibration/CurveCalibrator.hpp"
#include "data/ConfigLoader.hpp"

#include <iostream>
#include <iomanip>
#include <memory>
#include <chrono>
#include <string>

using namespace shortrate;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <config.json> [simulate|calibrate]\n";
}

void printCurve(const SpotCurve& curve, const ObservedCurve* observed) {
    std::cout << "\n  " << std::setw(10) << "maturité" << std::setw(14) << "spot";
    if (observed) std::cout << std::setw(14) << "observé";
    std::cout << "\n";

    for (size_t i = 0; i < curve.size(); ++i) {
        size_t m = i + 1;
        if (observed && !observed->contains(m)) continue;

        std::cout << "  " << std::setw(10) << std::fixed << std::setprecision(4) << curve.maturity(i)
                  << std::setw(14) << std::setprecision(6) << curve[i];
        if (observed) std::cout << std::setw(14) << observed->at(m);
        std::cout << "\n";
    }
    std::cout << std::defaultfloat;
}

void printResult(const CurveCalibrator::CalibrationResult& res) {
    std::cout << "\n=== RÉSULTATS DE CALIBRATION ===\n";
    std::cout << "Mode               : "
              << (res.mode == CurveCalibrator::Mode::VECTOR_PARAMETER ? "vector-parameter" : "scalar") << "\n";
    std::cout << "SSE initial / final: " << std::scientific << std::setprecision(6)
              << res.initialObjective << " / " << res.objective << std::defaultfloat << "\n";
    std::cout << "Convergence        : " << (res.converged ? "oui" : "non") << " ("
              << res.iterations << " itérations, " << res.evaluations << " évaluations, "
              << std::fixed << std::setprecision(2) << res.elapsedSeconds << " s)\n\n";

    std::cout << "Modèle calibré : " << res.fittedModel->toString() << "\n";

    // Hull-White : N + 2 composantes, résumé seulement
    if (res.mode == CurveCalibrator::Mode::VECTOR_PARAMETER) return;

    std::cout << "Paramètres estimés :\n";
    for (size_t i = 0; i < res.parameters.size(); ++i) {
        std::cout << "  " << std::setw(12) << res.parameterNames[i] << " = "
                  << std::fixed << std::setprecision(6) << res.parameters[i] << "\n";
    }
    std::cout << std::defaultfloat;
}

int runSimulation(const RunConfig& cfg) {
    PathSimulator simulator(cfg.model, cfg.simulation);
    PathEnsemble paths = simulator.simulate();
    SpotCurve curve = DiscountCurveEstimator::estimate(paths, simulator.getTimeGrid());

    auto stats = PathSimulator::computeStatistics(paths);
    std::cout << "Taux terminal : moyenne = " << stats.terminalMean
              << ", écart-type = " << stats.terminalStd
              << ", [min, max] = [" << stats.terminalMin << ", " << stats.terminalMax << "]\n";
    if (!cfg.model->canBeNegative() && stats.negativeCount > 0) {
        std::cerr << "[warning] " << stats.negativeCount << " negative states in a "
                  << cfg.model->getName() << " ensemble\n";
    }
    if (!curve.isFinite()) {
        std::cerr << "[warning] discount factor underflow: some spot rates are infinite\n";
    }

    printCurve(curve, nullptr);

    if (!cfg.pathsOutput.empty()) {
        PathSimulator::exportToCSV(paths, simulator.getTimeGrid(), cfg.pathsOutput);
        std::cout << "\nTrajectoires exportées : " << cfg.pathsOutput << "\n";
    }
    if (!cfg.curveOutput.empty()) {
        DiscountCurveEstimator::exportToCSV(curve, cfg.curveOutput);
        std::cout << "Courbe exportée : " << cfg.curveOutput << "\n";
    }
    return 0;
}

int runCalibration(const RunConfig& cfg) {
    if (cfg.observed.empty()) {
        std::cerr << "[error] calibration requires an 'observed' curve in the configuration\n";
        return 1;
    }

    CurveCalibrator calibrator(cfg.model, cfg.observed, cfg.simulation, cfg.calibration);
    auto result = calibrator.calibrate();
    printResult(result);

    // Courbe de comparaison avec les paramètres calibrés (même grille, même graine)
    SpotCurve fitted = calibrator.simulateCurve(result.fittedModel);
    printCurve(fitted, &cfg.observed);

    if (!cfg.curveOutput.empty()) {
        DiscountCurveEstimator::exportToCSV(fitted, cfg.curveOutput);
        std::cout << "\nCourbe calibrée exportée : " << cfg.curveOutput << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string mode = argc == 3 ? argv[2] : "simulate";
    if (mode != "simulate" && mode != "calibrate") {
        printUsage(argv[0]);
        return 1;
    }

    try {
        RunConfig cfg = ConfigLoader::loadFromFile(argv[1]);

        std::cout << "Modèle : " << cfg.model->getName()
                  << " | horizon = " << cfg.simulation.horizon << " ans"
                  << " | N = " << cfg.simulation.nSteps
                  << " | M = " << cfg.simulation.nPaths
                  << " | seed = " << cfg.simulation.seed << "\n";

        auto start = std::chrono::steady_clock::now();
        int rc = mode == "calibrate" ? runCalibration(cfg) : runSimulation(cfg);
        auto end = std::chrono::steady_clock::now();

        std::cout << "\nTerminé en "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count()
                  << " ms.\n";
        return rc;
    } catch (const ConfigurationError& e) {
        std::cerr << "[error] configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}
