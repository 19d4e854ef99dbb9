#pragma once
#include <eigen3/Eigen/Dense>
#include <functional>
#include <vector>
#include <cstddef>

namespace shortrate {

/**
 * @brief Minimisation sans dérivées par simplexe de Nelder-Mead.
 *
 * Coefficients adaptatifs (Gao & Han, 2012) en dimension >= 2 lorsque `adaptive` est actif,
 * indispensables en grande dimension (Hull-White : N + 2 paramètres).
 */
class NelderMeadOptimizer {
public:
    using Objective = std::function<double(const Eigen::VectorXd&)>;

    struct Options {
        size_t maxIterations = 1000;
        size_t maxEvaluations = 0;        // 0 = pas de limite
        double functionTolerance = 1e-10; // écart max des valeurs sur le simplexe
        double pointTolerance = 1e-8;     // diamètre max du simplexe
        double initialStep = 0.05;        // pas relatif des sommets initiaux
        double zeroStep = 0.00025;        // pas absolu pour les composantes nulles
        bool adaptive = true;
    };

    struct Result {
        Eigen::VectorXd best;
        double value{};
        bool converged{};
        size_t iterations{};
        size_t evaluations{};
    };

    explicit NelderMeadOptimizer(const Options& options) : options_(options) {}

    Result minimize(const Objective& f, const Eigen::VectorXd& start) const;

    /**
     * @brief Variante où f(start) est déjà connu : le sommet 0 n'est pas réévalué
     *        et n'est pas compté dans Result::evaluations.
     */
    Result minimize(const Objective& f, const Eigen::VectorXd& start, double startValue) const;

private:
    Options options_;

    std::vector<Eigen::VectorXd> initialSimplex(const Eigen::VectorXd& start) const;
};

}
