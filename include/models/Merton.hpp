#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>

namespace shortrate {

/**
 * @brief Modèle de Merton : dr_t = α*dt + σ*dW_t (sans retour à la moyenne)
 */
class Merton : public OneFactorModel {
private:
    MertonParameters* mertonParams_;

public:
    explicit Merton(
        double initialRate = 0.03,
        double alpha = 0.0,
        double sigma = 0.01
    ) : OneFactorModel(initialRate) {
        auto params = std::make_unique<MertonParameters>(alpha, sigma);
        params->validate();
        mertonParams_ = params.get();
        params_ = std::move(params);
    }

    double drift(double r, size_t stepIndex) const override {
        (void)r; (void)stepIndex;
        return mertonParams_->getAlpha();
    }

    double diffusion(double r, size_t stepIndex) const override {
        (void)r; (void)stepIndex;
        return mertonParams_->getSigma();
    }

    std::string getName() const override {
        return "Merton";
    }

    void validateParameters() const override {
        mertonParams_->validate();
    }

    std::vector<std::string> getParameterNames() const override {
        return {"alpha", "sigma"};
    }

    std::vector<double> getParametersVector() const override {
        return {mertonParams_->getAlpha(), mertonParams_->getSigma()};
    }

    void setParametersVector(const std::vector<double>& params) override {
        if (params.size() != 2) {
            throw ConfigurationError("Merton requires 2 parameters: alpha, sigma");
        }
        auto newParams = std::make_unique<MertonParameters>(params[0], params[1]);
        newParams->validate();
        mertonParams_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<Merton>(
            initialRate_, mertonParams_->getAlpha(), mertonParams_->getSigma()
        );
    }

    double getAlpha() const { return mertonParams_->getAlpha(); }
    double getSigma() const { return mertonParams_->getSigma(); }
};

}
