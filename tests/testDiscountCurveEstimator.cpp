#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../include/simulation/DiscountCurveEstimator.hpp"
#include "../include/models/Vasicek.hpp"
#include "VasicekReference.hpp"

#include <cmath>
#include <limits>

using namespace shortrate;
using Catch::Approx;

TEST_CASE("Left-point estimate on a small ensemble", "[DiscountCurve]")
{
    // 3 pas, 2 trajectoires, dt = 0.5
    PathEnsemble paths(3, 2);
    paths << 0.02, 0.02,
             0.04, 0.00,
             0.06, 0.02;

    SpotCurve curve = DiscountCurveEstimator::estimate(paths, 0.5);

    REQUIRE(curve.size() == 3);
    REQUIRE(curve[0] == 0.02);

    double p2 = 0.5 * (std::exp(-0.03) + std::exp(-0.01));
    REQUIRE(curve[1] == Approx(-std::log(p2) / 1.0));

    double p3 = 0.5 * (std::exp(-0.06) + std::exp(-0.02));
    REQUIRE(curve[2] == Approx(-std::log(p3) / 1.5));
    REQUIRE(curve.discountFactors[2] == Approx(p3));

    REQUIRE(curve.atMaturityStep(3) == curve[2]);
    REQUIRE(curve.maturity(2) == Approx(1.5));
    REQUIRE_THROWS_AS(curve.atMaturityStep(0), std::out_of_range);
    REQUIRE_THROWS_AS(curve.atMaturityStep(4), std::out_of_range);
}

TEST_CASE("Constant rate gives a flat curve", "[DiscountCurve]")
{
    PathEnsemble paths = PathEnsemble::Constant(12, 50, 0.035);
    SpotCurve curve = DiscountCurveEstimator::estimate(paths, 1.0 / 12.0);

    for (size_t i = 0; i < curve.size(); ++i) {
        REQUIRE(curve[i] == Approx(0.035));
        REQUIRE(curve.standardErrors[i] == Approx(0.0).margin(1e-15));
    }
    REQUIRE(curve.isFinite());
}

TEST_CASE("Discount factor underflow yields an infinite spot rate", "[DiscountCurve]")
{
    PathEnsemble paths = PathEnsemble::Constant(4, 10, 1e6);
    SpotCurve curve;
    REQUIRE_NOTHROW(curve = DiscountCurveEstimator::estimate(paths, 0.5));

    REQUIRE(curve[0] == 1e6);
    REQUIRE(std::isinf(curve[1]));
    REQUIRE(std::isinf(curve[3]));
    REQUIRE_FALSE(curve.isFinite());
}

TEST_CASE("Empty ensemble or non-positive step is rejected", "[DiscountCurve]")
{
    PathEnsemble empty;
    REQUIRE_THROWS_AS(DiscountCurveEstimator::estimate(empty, 0.1), std::invalid_argument);

    PathEnsemble paths = PathEnsemble::Constant(3, 3, 0.01);
    REQUIRE_THROWS_AS(DiscountCurveEstimator::estimate(paths, 0.0), std::invalid_argument);
}

TEST_CASE("Vasicek curve matches the closed form at five years", "[DiscountCurve][Vasicek]")
{
    const double r0 = 0.015, alpha = 0.03, beta = 0.01, sigma = 0.002;
    auto model = std::make_shared<Vasicek>(r0, alpha, beta, sigma);

    PathSimulator::SimulationConfig cfg;
    cfg.nPaths = 100000;
    cfg.nSteps = 60;
    cfg.horizon = 5.0;
    cfg.seed = 42;
    cfg.nThreads = 0;

    PathSimulator simulator(model, cfg);
    SpotCurve curve = DiscountCurveEstimator::estimate(simulator.simulate(), simulator.getTimeGrid());

    REQUIRE(curve.size() == 60);
    REQUIRE(curve.maturity(59) == Approx(5.0));
    double analytic = vasicek_reference::spotRate(r0, alpha, beta, sigma, 5.0);
    REQUIRE(std::abs(curve[59] - analytic) < 5e-4);
}

TEST_CASE("Vasicek curve converges at every maturity", "[DiscountCurve][Vasicek]")
{
    const double r0 = 0.015, alpha = 0.03, beta = 0.5, sigma = 0.01;
    auto model = std::make_shared<Vasicek>(r0, alpha, beta, sigma);

    PathSimulator::SimulationConfig cfg;
    cfg.nPaths = 20000;
    cfg.nSteps = 60;
    cfg.horizon = 5.0;
    cfg.seed = 2024;
    cfg.nThreads = 0;

    PathSimulator simulator(model, cfg);
    SpotCurve curve = DiscountCurveEstimator::estimate(simulator.simulate(), simulator.getTimeGrid());

    for (size_t i = 0; i < curve.size(); ++i) {
        double analytic = vasicek_reference::spotRate(r0, alpha, beta, sigma, curve.maturity(i));
        REQUIRE(std::abs(curve[i] - analytic) < 1e-3);
    }
}
