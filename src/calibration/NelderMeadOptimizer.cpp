// src/calibration/NelderMeadOptimizer.cpp
#include "calibration/NelderMeadOptimizer.hpp"

#include <algorithm>
#include <numeric>
#include <cmath>
#include <stdexcept>
#include <limits>

namespace shortrate {

std::vector<Eigen::VectorXd> NelderMeadOptimizer::initialSimplex(const Eigen::VectorXd& start) const {
    const Eigen::Index n = start.size();
    std::vector<Eigen::VectorXd> simplex(n + 1, start);
    for (Eigen::Index i = 0; i < n; ++i) {
        double& x = simplex[i + 1](i);
        x += (x != 0.0) ? options_.initialStep * x : options_.zeroStep;
    }
    return simplex;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective& f,
                                                          const Eigen::VectorXd& start) const {
    return minimize(f, start, std::numeric_limits<double>::quiet_NaN());
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective& f,
                                                          const Eigen::VectorXd& start,
                                                          double startValue) const {
    const Eigen::Index n = start.size();
    if (n == 0) {
        throw std::invalid_argument("Nelder-Mead requires at least one parameter");
    }

    // Coefficients de Gao-Han en dimension >= 2, classiques sinon (σ = 0 pour n = 1)
    const double dim = static_cast<double>(n);
    const bool adaptive = options_.adaptive && n >= 2;
    const double alpha = 1.0;
    const double gamma = adaptive ? 1.0 + 2.0 / dim : 2.0;
    const double rho = adaptive ? 0.75 - 1.0 / (2.0 * dim) : 0.5;
    const double sigma = adaptive ? 1.0 - 1.0 / dim : 0.5;

    Result result;
    auto evaluate = [&](const Eigen::VectorXd& x) {
        ++result.evaluations;
        return f(x);
    };
    auto budgetExhausted = [&]() {
        return options_.maxEvaluations > 0 && result.evaluations >= options_.maxEvaluations;
    };

    // 1. Initialisation du simplexe (le point de départ est le sommet 0)
    std::vector<Eigen::VectorXd> simplex = initialSimplex(start);
    std::vector<double> scores(n + 1, std::numeric_limits<double>::infinity());

    Eigen::Index evaluated = 0;
    if (!std::isnan(startValue)) {
        scores[0] = startValue;
        evaluated = 1;
    }
    for (; evaluated <= n && !budgetExhausted(); ++evaluated) {
        scores[evaluated] = evaluate(simplex[evaluated]);
    }

    // Budget épuisé avant la fin de l'initialisation : meilleur sommet évalué
    if (evaluated <= n) {
        auto first = scores.begin();
        size_t best = static_cast<size_t>(std::min_element(first, first + evaluated) - first);
        result.best = simplex[best];
        result.value = scores[best];
        return result;
    }

    std::vector<size_t> idxs(n + 1);
    Eigen::VectorXd centroid(n);

    // 2. Boucle d'optimisation
    for (; result.iterations < options_.maxIterations && !budgetExhausted(); ++result.iterations) {
        std::iota(idxs.begin(), idxs.end(), 0);
        std::stable_sort(idxs.begin(), idxs.end(), [&](size_t a, size_t b) {
            return scores[a] < scores[b];
        });

        const size_t bestIdx = idxs[0];
        const size_t worst = idxs[n];
        const size_t secondWorst = idxs[n - 1];

        double diameter = 0.0;
        for (Eigen::Index i = 1; i <= n; ++i) {
            diameter = std::max(diameter,
                                (simplex[idxs[i]] - simplex[bestIdx]).lpNorm<Eigen::Infinity>());
        }
        if (std::abs(scores[worst] - scores[bestIdx]) <= options_.functionTolerance
            && diameter <= options_.pointTolerance) {
            result.converged = true;
            break;
        }

        // Centroïde des n meilleurs points
        centroid.setZero();
        for (Eigen::Index i = 0; i < n; ++i) {
            centroid += simplex[idxs[i]];
        }
        centroid /= dim;

        // Réflexion du pire point
        Eigen::VectorXd reflected = centroid + alpha * (centroid - simplex[worst]);
        double rScore = evaluate(reflected);

        if (rScore < scores[secondWorst] && rScore >= scores[bestIdx]) {
            simplex[worst] = reflected;
            scores[worst] = rScore;
        } else if (rScore < scores[bestIdx]) {
            // Expansion
            Eigen::VectorXd expanded = centroid + gamma * (reflected - centroid);
            double eScore = evaluate(expanded);
            if (eScore < rScore) {
                simplex[worst] = expanded;
                scores[worst] = eScore;
            } else {
                simplex[worst] = reflected;
                scores[worst] = rScore;
            }
        } else {
            // Contraction (extérieure si le réfléchi améliore le pire point)
            const bool outside = rScore < scores[worst];
            const Eigen::VectorXd& towards = outside ? reflected : simplex[worst];
            Eigen::VectorXd contracted = centroid + rho * (towards - centroid);
            double cScore = evaluate(contracted);

            if (cScore < std::min(rScore, scores[worst])) {
                simplex[worst] = contracted;
                scores[worst] = cScore;
            } else if (outside) {
                simplex[worst] = reflected;
                scores[worst] = rScore;
            } else {
                // Rétrécissement vers le meilleur sommet
                for (Eigen::Index i = 1; i <= n && !budgetExhausted(); ++i) {
                    size_t current = idxs[i];
                    simplex[current] = simplex[bestIdx] + sigma * (simplex[current] - simplex[bestIdx]);
                    scores[current] = evaluate(simplex[current]);
                }
            }
        }
    }

    size_t best = static_cast<size_t>(
        std::min_element(scores.begin(), scores.end()) - scores.begin());
    result.best = simplex[best];
    result.value = scores[best];
    return result;
}

}
