#include "simulation/PathSimulator.hpp"
#include "core/RandomSource.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <future>
#include <fstream>
#include <iomanip>
#include <cmath>
#include <stdexcept>

namespace shortrate {

namespace {

TimeGrid makeGrid(const PathSimulator::SimulationConfig& cfg) {
    if (cfg.nPaths == 0) {
        throw ConfigurationError("Ensemble size (nPaths) must be positive");
    }
    if (cfg.nSteps == 0) {
        throw ConfigurationError("Number of grid steps (nSteps) must be positive");
    }
    return TimeGrid(cfg.horizon, cfg.nSteps);
}

double quantileSorted(const std::vector<double>& sorted, double q) {
    size_t idx = static_cast<size_t>(q * (sorted.size() - 1));
    return sorted[idx];
}

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

PathSimulator::PathSimulator(std::shared_ptr<const ShortRateModel> model,
                             const SimulationConfig& cfg)
    : model_(std::move(model)), config_(cfg), grid_(makeGrid(cfg))
{
    if (!model_) {
        throw ConfigurationError("PathSimulator requires a model");
    }
    model_->validateParameters();
    model_->validateForGrid(grid_);
}

// ============================================================================
// SIMULATION
// ============================================================================

PathEnsemble PathSimulator::simulate() const {
    PathEnsemble paths(config_.nSteps, config_.nPaths);

    size_t nThreads = effectiveThreads();
    if (nThreads <= 1) {
        simulateBlock(paths, 0, config_.nPaths);
        return paths;
    }

    // Blocs de colonnes contigus, écritures disjointes dans la matrice
    size_t blockSize = (config_.nPaths + nThreads - 1) / nThreads;
    std::vector<std::future<void>> futures;
    futures.reserve(nThreads);

    for (size_t first = 0; first < config_.nPaths; first += blockSize) {
        size_t count = std::min(blockSize, config_.nPaths - first);
        futures.push_back(std::async(std::launch::async, [this, &paths, first, count]() {
            simulateBlock(paths, first, count);
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    return paths;
}

void PathSimulator::simulateBlock(PathEnsemble& paths, size_t firstColumn, size_t nColumns) const {
    const double dt = grid_.getTimeStep();
    const bool correlated = model_->factorCount() > 1;
    const double rho = model_->shockCorrelation();

    for (size_t j = firstColumn; j < firstColumn + nColumns; ++j) {
        RandomSource rng = RandomSource::forStream(config_.seed, j);
        std::vector<double> factors = model_->initialFactors();
        paths(0, j) = model_->shortRate(factors);

        for (size_t k = 1; k < config_.nSteps; ++k) {
            if (correlated) {
                auto [z1, z2] = rng.nextCorrelatedPair(rho);
                model_->advanceFactors(factors, dt, z1, z2, k - 1);
            } else {
                model_->advanceFactors(factors, dt, rng.nextNormal(), 0.0, k - 1);
            }
            paths(k, j) = model_->shortRate(factors);
        }
    }
}

size_t PathSimulator::effectiveThreads() const {
    size_t n = config_.nThreads;
    if (n == 0) {
        n = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::min(n, config_.nPaths);
}

// ============================================================================
// STATISTIQUES
// ============================================================================

PathSimulator::SimulationStatistics PathSimulator::computeStatistics(const PathEnsemble& paths) {
    if (paths.rows() == 0 || paths.cols() == 0) {
        throw std::invalid_argument("Cannot compute statistics of an empty ensemble");
    }

    SimulationStatistics stats;
    const size_t nSteps = static_cast<size_t>(paths.rows());
    const size_t nPaths = static_cast<size_t>(paths.cols());
    stats.nPaths = nPaths;

    stats.meanPath.resize(nSteps);
    stats.stdPath.resize(nSteps);
    stats.quant05.resize(nSteps);
    stats.quant50.resize(nSteps);
    stats.quant95.resize(nSteps);

    std::vector<double> row(nPaths);
    for (size_t k = 0; k < nSteps; ++k) {
        for (size_t j = 0; j < nPaths; ++j) {
            row[j] = paths(k, j);
            if (row[j] < 0.0) ++stats.negativeCount;
        }

        double mean = paths.row(k).mean();
        double var = nPaths > 1
            ? (paths.row(k).array() - mean).square().sum() / (nPaths - 1)
            : 0.0;
        stats.meanPath[k] = mean;
        stats.stdPath[k] = std::sqrt(var);

        std::sort(row.begin(), row.end());
        stats.quant05[k] = quantileSorted(row, 0.05);
        stats.quant50[k] = quantileSorted(row, 0.50);
        stats.quant95[k] = quantileSorted(row, 0.95);

        if (k + 1 == nSteps) {
            stats.terminalMin = row.front();
            stats.terminalMax = row.back();
        }
    }

    stats.terminalMean = stats.meanPath.back();
    stats.terminalStd = stats.stdPath.back();
    stats.standardError = stats.terminalStd / std::sqrt(static_cast<double>(nPaths));
    return stats;
}

// ============================================================================
// EXPORT
// ============================================================================

void PathSimulator::exportToCSV(const PathEnsemble& paths, const TimeGrid& grid,
                                const std::string& filename) {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    out << std::setprecision(10);
    for (Eigen::Index k = 0; k < paths.rows(); ++k) {
        out << grid[static_cast<size_t>(k)];
        for (Eigen::Index j = 0; j < paths.cols(); ++j) {
            out << ',' << paths(k, j);
        }
        out << '\n';
    }
}

} // namespace shortrate
