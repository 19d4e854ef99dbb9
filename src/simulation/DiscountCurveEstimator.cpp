#include "simulation/DiscountCurveEstimator.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace shortrate {

double SpotCurve::atMaturityStep(size_t m) const {
    if (m == 0 || m > rates.size()) {
        throw std::out_of_range("Maturity step " + std::to_string(m)
                                + " outside curve range [1, " + std::to_string(rates.size()) + "]");
    }
    return rates[m - 1];
}

bool SpotCurve::isFinite() const {
    for (double r : rates) {
        if (!std::isfinite(r)) return false;
    }
    return true;
}

// ============================================================================
// ESTIMATION
// ============================================================================

SpotCurve DiscountCurveEstimator::estimate(const PathEnsemble& paths, double dt) {
    if (paths.rows() == 0 || paths.cols() == 0) {
        throw std::invalid_argument("Cannot estimate a curve from an empty ensemble");
    }
    if (!(dt > 0.0)) {
        throw std::invalid_argument("Time step must be positive");
    }

    const Eigen::Index nSteps = paths.rows();
    const double nPaths = static_cast<double>(paths.cols());

    SpotCurve curve;
    curve.dt = dt;
    curve.rates.resize(nSteps);
    curve.discountFactors.resize(nSteps);
    curve.standardErrors.resize(nSteps);

    // Intégrale cumulée du taux par trajectoire
    Eigen::ArrayXd integral = dt * paths.row(0).transpose().array();

    // Convention : spot[0] = r_0, pas d'intégrale sur un intervalle nul
    const double r0 = paths(0, 0);
    curve.rates[0] = r0;
    curve.discountFactors[0] = std::exp(-r0 * dt);
    curve.standardErrors[0] = 0.0;

    for (Eigen::Index i = 1; i < nSteps; ++i) {
        integral += dt * paths.row(i).transpose().array();

        Eigen::ArrayXd discount = (-integral).exp();
        double price = discount.mean();
        double variance = nPaths > 1.0
            ? (discount - price).square().sum() / (nPaths - 1.0)
            : 0.0;

        curve.discountFactors[i] = price;
        curve.standardErrors[i] = std::sqrt(variance / nPaths);

        // P̂ nul (underflow) ou non fini : valeur sentinelle
        if (!(price > 0.0) || !std::isfinite(price)) {
            curve.rates[i] = std::numeric_limits<double>::infinity();
        } else {
            curve.rates[i] = -std::log(price) / ((i + 1) * dt);
        }
    }

    return curve;
}

// ============================================================================
// EXPORT
// ============================================================================

void DiscountCurveEstimator::exportToCSV(const SpotCurve& curve, const std::string& filename) {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    out << "maturity,spot,discount_factor,std_error\n";
    out << std::setprecision(10);
    for (size_t i = 0; i < curve.size(); ++i) {
        out << curve.maturity(i) << ',' << curve.rates[i] << ','
            << curve.discountFactors[i] << ',' << curve.standardErrors[i] << '\n';
    }
}

} // namespace shortrate
