#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../include/calibration/NelderMeadOptimizer.hpp"

#include <cmath>

using namespace shortrate;
using Catch::Approx;

namespace {

double rosenbrock(const Eigen::VectorXd& x) {
    double a = 1.0 - x(0);
    double b = x(1) - x(0) * x(0);
    return a * a + 100.0 * b * b;
}

}

TEST_CASE("Nelder-Mead finds the Rosenbrock minimum", "[NelderMead]")
{
    NelderMeadOptimizer::Options options;
    options.maxIterations = 5000;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start(2);
    start << -1.2, 1.0;
    auto result = optimizer.minimize(rosenbrock, start);

    REQUIRE(result.converged);
    REQUIRE(result.best(0) == Approx(1.0).margin(1e-3));
    REQUIRE(result.best(1) == Approx(1.0).margin(1e-3));
    REQUIRE(result.value < 1e-6);
}

TEST_CASE("Nelder-Mead handles a ten-dimensional quadratic", "[NelderMead]")
{
    Eigen::VectorXd target = Eigen::VectorXd::LinSpaced(10, 0.1, 1.0);
    auto quadratic = [&](const Eigen::VectorXd& x) { return (x - target).squaredNorm(); };

    NelderMeadOptimizer::Options options;
    options.maxIterations = 20000;
    options.initialStep = 0.5;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start = Eigen::VectorXd::Constant(10, 0.5);
    auto result = optimizer.minimize(quadratic, start);

    REQUIRE(result.value < 1e-8);
    REQUIRE((result.best - target).lpNorm<Eigen::Infinity>() < 1e-3);
}

TEST_CASE("Best value never exceeds the starting value", "[NelderMead]")
{
    NelderMeadOptimizer::Options options;
    options.maxIterations = 3;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start(2);
    start << 1.0, 1.0;
    auto result = optimizer.minimize(rosenbrock, start);

    REQUIRE(result.value == 0.0);
    REQUIRE(result.best == start);
}

TEST_CASE("Evaluation budget stops the search without convergence", "[NelderMead]")
{
    NelderMeadOptimizer::Options options;
    options.maxEvaluations = 50;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start(2);
    start << -1.2, 1.0;
    auto result = optimizer.minimize(rosenbrock, start);

    REQUIRE_FALSE(result.converged);
    REQUIRE(result.evaluations <= 52);
    REQUIRE(result.value <= rosenbrock(start));
}

TEST_CASE("Nelder-Mead rejects an empty parameter vector", "[NelderMead]")
{
    NelderMeadOptimizer optimizer(NelderMeadOptimizer::Options{});
    REQUIRE_THROWS_AS(optimizer.minimize(rosenbrock, Eigen::VectorXd()), std::invalid_argument);
}

TEST_CASE("Evaluation budget smaller than the simplex is respected", "[NelderMead]")
{
    auto quadratic = [](const Eigen::VectorXd& x) { return x.squaredNorm(); };

    NelderMeadOptimizer::Options options;
    options.maxEvaluations = 3;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start = Eigen::VectorXd::Constant(10, 0.5);
    auto result = optimizer.minimize(quadratic, start);

    REQUIRE(result.evaluations <= 4);
    REQUIRE_FALSE(result.converged);
    REQUIRE(result.iterations == 0);
    REQUIRE(result.value <= quadratic(start));
}

TEST_CASE("Known starting value is not evaluated again", "[NelderMead]")
{
    size_t calls = 0;
    auto counted = [&](const Eigen::VectorXd& x) {
        ++calls;
        return rosenbrock(x);
    };

    NelderMeadOptimizer::Options options;
    options.maxIterations = 50;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start(2);
    start << -1.2, 1.0;
    auto result = optimizer.minimize(counted, start, rosenbrock(start));

    REQUIRE(calls == result.evaluations);
    REQUIRE(result.value < rosenbrock(start));
}

TEST_CASE("One-dimensional search uses the classic coefficients", "[NelderMead]")
{
    auto parabola = [](const Eigen::VectorXd& x) { return (x(0) - 3.0) * (x(0) - 3.0); };

    NelderMeadOptimizer::Options options;
    options.maxIterations = 500;
    NelderMeadOptimizer optimizer(options);

    Eigen::VectorXd start(1);
    start << 1.0;
    auto result = optimizer.minimize(parabola, start);

    // Un rétrécissement ne doit pas écraser le simplexe sur un point non optimal
    REQUIRE(result.converged);
    REQUIRE(result.best(0) == Approx(3.0).margin(1e-4));
}
