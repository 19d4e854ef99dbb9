#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>

namespace shortrate {

/**
 * @brief Modèle gaussien à deux facteurs (G2)
 *
 * Deux facteurs latents x et y suivent chacun une dynamique de Vasicek, avec
 * des chocs corrélés (ρ = -0.1 par défaut). Le taux observé est r = x + y.
 * La corrélation est fixée à la construction et ne fait pas partie du vecteur
 * calibré.
 */
class TwoFactorGaussian : public ShortRateModel {
private:
    TwoFactorParameters* g2Params_;
    double x0_;
    double y0_;

public:
    static constexpr double kDefaultRho = -0.1;

    explicit TwoFactorGaussian(
        double x0 = 0.01,
        double y0 = 0.005,
        double alphaX = 0.02, double betaX = 0.5, double sigmaX = 0.01,
        double alphaY = 0.01, double betaY = 0.1, double sigmaY = 0.005,
        double rho = kDefaultRho
    ) : ShortRateModel(x0 + y0), x0_(x0), y0_(y0) {
        auto params = std::make_unique<TwoFactorParameters>(
            alphaX, betaX, sigmaX, alphaY, betaY, sigmaY, rho);
        params->validate();
        g2Params_ = params.get();
        params_ = std::move(params);
    }

    std::vector<double> initialFactors() const override {
        return {x0_, y0_};
    }

    void advanceFactors(std::vector<double>& factors, double dt,
                        double z1, double z2, size_t stepIndex) const override {
        (void)stepIndex;
        double sqrtDt = std::sqrt(dt);
        double x = factors[0];
        double y = factors[1];

        factors[0] = x + g2Params_->getBetaX() * (g2Params_->getAlphaX() - x) * dt
                       + g2Params_->getSigmaX() * z1 * sqrtDt;
        factors[1] = y + g2Params_->getBetaY() * (g2Params_->getAlphaY() - y) * dt
                       + g2Params_->getSigmaY() * z2 * sqrtDt;
    }

    double shortRate(const std::vector<double>& factors) const override {
        return factors[0] + factors[1];
    }

    size_t factorCount() const override { return 2; }

    double shockCorrelation() const override { return g2Params_->getRho(); }

    std::string getName() const override {
        return "Two-factor Gaussian (G2)";
    }

    void validateParameters() const override {
        g2Params_->validate();
    }

    std::vector<std::string> getParameterNames() const override {
        return {"alphaX", "betaX", "sigmaX", "alphaY", "betaY", "sigmaY"};
    }

    std::vector<double> getParametersVector() const override {
        return {
            g2Params_->getAlphaX(), g2Params_->getBetaX(), g2Params_->getSigmaX(),
            g2Params_->getAlphaY(), g2Params_->getBetaY(), g2Params_->getSigmaY()
        };
    }

    void setParametersVector(const std::vector<double>& params) override {
        if (params.size() != 6) {
            throw ConfigurationError(
                "Two-factor model requires 6 parameters: alphaX, betaX, sigmaX, alphaY, betaY, sigmaY");
        }
        auto newParams = std::make_unique<TwoFactorParameters>(
            params[0], params[1], params[2], params[3], params[4], params[5], g2Params_->getRho());
        newParams->validate();
        g2Params_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<TwoFactorGaussian>(
            x0_, y0_,
            g2Params_->getAlphaX(), g2Params_->getBetaX(), g2Params_->getSigmaX(),
            g2Params_->getAlphaY(), g2Params_->getBetaY(), g2Params_->getSigmaY(),
            g2Params_->getRho()
        );
    }

    double getX0() const { return x0_; }
    double getY0() const { return y0_; }
    double getRho() const { return g2Params_->getRho(); }
};

}
