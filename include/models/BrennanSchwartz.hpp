#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>

namespace shortrate {

/**
 * @brief Modèle de Brennan-Schwartz : dr_t = β(α - r_t)*dt + σ*r_t*dW_t
 */
class BrennanSchwartz : public OneFactorModel {
private:
    MeanReversionParameters* bsParams_;

public:
    explicit BrennanSchwartz(
        double initialRate = 0.03,
        double alpha = 0.03,
        double beta = 0.5,
        double sigma = 0.1
    ) : OneFactorModel(initialRate) {
        auto params = std::make_unique<MeanReversionParameters>(alpha, beta, sigma);
        params->validate();
        bsParams_ = params.get();
        params_ = std::move(params);
    }

    double drift(double r, size_t stepIndex) const override {
        (void)stepIndex;
        return bsParams_->getBeta() * (bsParams_->getAlpha() - r);
    }

    double diffusion(double r, size_t stepIndex) const override {
        (void)stepIndex;
        return bsParams_->getSigma() * r;
    }

    std::string getName() const override {
        return "Brennan-Schwartz";
    }

    void validateParameters() const override {
        bsParams_->validate();
    }

    bool canBeNegative() const override {
        return false;
    }

    std::vector<std::string> getParameterNames() const override {
        return {"alpha", "beta", "sigma"};
    }

    std::vector<double> getParametersVector() const override {
        return {bsParams_->getAlpha(), bsParams_->getBeta(), bsParams_->getSigma()};
    }

    void setParametersVector(const std::vector<double>& params) override {
        if (params.size() != 3) {
            throw ConfigurationError("Brennan-Schwartz requires 3 parameters: alpha, beta, sigma");
        }
        auto newParams = std::make_unique<MeanReversionParameters>(params[0], params[1], params[2]);
        newParams->validate();
        bsParams_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<BrennanSchwartz>(
            initialRate_, bsParams_->getAlpha(), bsParams_->getBeta(), bsParams_->getSigma()
        );
    }

    double getAlpha() const { return bsParams_->getAlpha(); }
    double getBeta() const { return bsParams_->getBeta(); }
    double getSigma() const { return bsParams_->getSigma(); }
};

}
