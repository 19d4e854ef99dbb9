#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>
#include <algorithm>

namespace shortrate {

/**
 * @brief Modèle de Cox-Ingersoll-Ross : dr_t = β(α - r_t)*dt + σ*√r_t*dW_t
 *
 * Schéma d'Euler avec plancher absorbant : si l'état précédent est strictement
 * négatif, l'état courant vaut exactement 0 et aucune mise à jour stochastique
 * n'est faite sur ce pas. Le pas suivant repart normalement de 0.
 */
class CoxIngersollRoss : public OneFactorModel {
private:
    MeanReversionParameters* cirParams_;

public:
    explicit CoxIngersollRoss(
        double initialRate = 0.03,
        double alpha = 0.03,
        double beta = 0.5,
        double sigma = 0.05
    ) : OneFactorModel(initialRate) {
        auto params = std::make_unique<MeanReversionParameters>(alpha, beta, sigma);
        params->validate();
        cirParams_ = params.get();
        params_ = std::move(params);
    }

    double step(double prior, double dt, double z, size_t stepIndex) const override {
        if (prior < 0.0) {
            return 0.0;
        }
        return OneFactorModel::step(prior, dt, z, stepIndex);
    }

    double drift(double r, size_t stepIndex) const override {
        (void)stepIndex;
        return cirParams_->getBeta() * (cirParams_->getAlpha() - r);
    }

    double diffusion(double r, size_t stepIndex) const override {
        (void)stepIndex;
        return cirParams_->getSigma() * std::sqrt(std::max(r, 0.0));
    }

    std::string getName() const override {
        return "Cox-Ingersoll-Ross (CIR)";
    }

    void validateParameters() const override {
        cirParams_->validate();
    }

    bool canBeNegative() const override {
        return false;
    }

    // Condition de Feller : 2*β*α >= σ² (informative, non imposée)
    bool satisfiesFellerCondition() const {
        double sigma = cirParams_->getSigma();
        return 2.0 * cirParams_->getBeta() * cirParams_->getAlpha() >= sigma * sigma;
    }

    std::vector<std::string> getParameterNames() const override {
        return {"alpha", "beta", "sigma"};
    }

    std::vector<double> getParametersVector() const override {
        return {cirParams_->getAlpha(), cirParams_->getBeta(), cirParams_->getSigma()};
    }

    void setParametersVector(const std::vector<double>& params) override {
        if (params.size() != 3) {
            throw ConfigurationError("CIR requires 3 parameters: alpha, beta, sigma");
        }
        auto newParams = std::make_unique<MeanReversionParameters>(params[0], params[1], params[2]);
        newParams->validate();
        cirParams_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<CoxIngersollRoss>(
            initialRate_, cirParams_->getAlpha(), cirParams_->getBeta(), cirParams_->getSigma()
        );
    }

    double getAlpha() const { return cirParams_->getAlpha(); }
    double getBeta() const { return cirParams_->getBeta(); }
    double getSigma() const { return cirParams_->getSigma(); }
};

}
