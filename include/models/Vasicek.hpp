#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>

namespace shortrate {

/**
 * @brief Modèle de Vasicek : dr_t = β(α - r_t)*dt + σ*dW_t
 *
 * Processus d'Ornstein-Uhlenbeck appliqué au taux court ; le taux peut
 * devenir négatif.
 */
class Vasicek : public OneFactorModel {
private:
    MeanReversionParameters* vasicekParams_;

public:
    explicit Vasicek(
        double initialRate = 0.03,
        double alpha = 0.03,
        double beta = 0.5,
        double sigma = 0.01
    ) : OneFactorModel(initialRate) {
        auto params = std::make_unique<MeanReversionParameters>(alpha, beta, sigma);
        params->validate();
        vasicekParams_ = params.get();
        params_ = std::move(params);
    }

    double drift(double r, size_t stepIndex) const override {
        (void)stepIndex;
        return vasicekParams_->getBeta() * (vasicekParams_->getAlpha() - r);
    }

    double diffusion(double r, size_t stepIndex) const override {
        (void)r; (void)stepIndex;
        return vasicekParams_->getSigma();
    }

    std::string getName() const override {
        return "Vasicek";
    }

    void validateParameters() const override {
        vasicekParams_->validate();
    }

    std::vector<std::string> getParameterNames() const override {
        return {"alpha", "beta", "sigma"};
    }

    std::vector<double> getParametersVector() const override {
        return {vasicekParams_->getAlpha(), vasicekParams_->getBeta(), vasicekParams_->getSigma()};
    }

    void setParametersVector(const std::vector<double>& params) override {
        if (params.size() != 3) {
            throw ConfigurationError("Vasicek requires 3 parameters: alpha, beta, sigma");
        }
        auto newParams = std::make_unique<MeanReversionParameters>(params[0], params[1], params[2]);
        newParams->validate();
        vasicekParams_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<Vasicek>(
            initialRate_, vasicekParams_->getAlpha(),
            vasicekParams_->getBeta(), vasicekParams_->getSigma()
        );
    }

    // Moments du processus continu
    double theoreticalMean(double t) const {
        double beta = vasicekParams_->getBeta();
        double alpha = vasicekParams_->getAlpha();
        return alpha + (initialRate_ - alpha) * std::exp(-beta * t);
    }

    double theoreticalVariance(double t) const {
        double beta = vasicekParams_->getBeta();
        double sigma = vasicekParams_->getSigma();
        if (beta == 0.0) return sigma * sigma * t;
        return sigma * sigma / (2.0 * beta) * (1.0 - std::exp(-2.0 * beta * t));
    }

    double getAlpha() const { return vasicekParams_->getAlpha(); }
    double getBeta() const { return vasicekParams_->getBeta(); }
    double getSigma() const { return vasicekParams_->getSigma(); }
};

}
