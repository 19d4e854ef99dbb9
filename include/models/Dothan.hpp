#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>

namespace shortrate {

/**
 * @brief Modèle de Dothan : dr_t = σ*r_t*dW_t
 *
 * Diffusion multiplicative sans dérive : tant que 1 + σ*z*√dt > 0, le signe
 * du taux est conservé. Aucun plancher n'est appliqué.
 */
class Dothan : public OneFactorModel {
private:
    DothanParameters* dothanParams_;

public:
    explicit Dothan(
        double initialRate = 0.03,
        double sigma = 0.1
    ) : OneFactorModel(initialRate) {
        auto params = std::make_unique<DothanParameters>(sigma);
        params->validate();
        dothanParams_ = params.get();
        params_ = std::move(params);
    }

    double drift(double r, size_t stepIndex) const override {
        (void)r; (void)stepIndex;
        return 0.0;
    }

    double diffusion(double r, size_t stepIndex) const override {
        (void)stepIndex;
        return dothanParams_->getSigma() * r;
    }

    std::string getName() const override {
        return "Dothan";
    }

    void validateParameters() const override {
        dothanParams_->validate();
    }

    bool canBeNegative() const override {
        return false;
    }

    std::vector<std::string> getParameterNames() const override {
        return {"sigma"};
    }

    std::vector<double> getParametersVector() const override {
        return {dothanParams_->getSigma()};
    }

    void setParametersVector(const std::vector<double>& params) override {
        if (params.size() != 1) {
            throw ConfigurationError("Dothan requires 1 parameter: sigma");
        }
        auto newParams = std::make_unique<DothanParameters>(params[0]);
        newParams->validate();
        dothanParams_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<Dothan>(initialRate_, dothanParams_->getSigma());
    }

    double getSigma() const { return dothanParams_->getSigma(); }
};

}
