#pragma once

#include "core/ShortRateModel.hpp"
#include "core/ModelParameters.hpp"
#include <cmath>

namespace shortrate {

/**
 * @brief Vasicek étendu de Hull-White : dr_t = β(α(t) - r_t)*dt + σ*dW_t
 *
 * Le niveau moyen est un vecteur α[0..N-1] aligné sur la grille : le pas k
 * (de t_k à t_{k+1}) utilise α[k]. Le vecteur de paramètres calibré est
 * (β, σ, α[0], ..., α[N-1]), de dimension N + 2.
 *
 * L'ensemble simulé s'arrête à t_{N-1} : le dernier niveau α[N-1] n'agit sur
 * aucune ligne ni sur la courbe spot. La fonction objectif est plate dans
 * cette direction et la valeur calibrée de α[N-1] n'est pas identifiée.
 */
class HullWhite : public OneFactorModel {
private:
    HullWhiteParameters* hwParams_;

public:
    HullWhite(
        double initialRate,
        std::vector<double> alpha,
        double beta = 0.5,
        double sigma = 0.01
    ) : OneFactorModel(initialRate) {
        auto params = std::make_unique<HullWhiteParameters>(std::move(alpha), beta, sigma);
        params->validate();
        hwParams_ = params.get();
        params_ = std::move(params);
    }

    /**
     * @brief Niveau moyen constant α répété sur nSteps pas
     */
    static std::shared_ptr<HullWhite> withFlatMean(double initialRate, size_t nSteps,
                                                   double alpha, double beta, double sigma) {
        return std::make_shared<HullWhite>(
            initialRate, std::vector<double>(nSteps, alpha), beta, sigma);
    }

    double drift(double r, size_t stepIndex) const override {
        return hwParams_->getBeta() * (hwParams_->getAlpha(stepIndex) - r);
    }

    double diffusion(double r, size_t stepIndex) const override {
        (void)r; (void)stepIndex;
        return hwParams_->getSigma();
    }

    std::string getName() const override {
        return "Hull-White (extended Vasicek)";
    }

    void validateParameters() const override {
        hwParams_->validate();
    }

    bool hasTimeDependentParameters() const override { return true; }

    void validateForGrid(const TimeGrid& grid) const override {
        if (hwParams_->getNumSteps() != grid.getNumSteps()) {
            throw ConfigurationError(
                "Hull-White alpha vector has " + std::to_string(hwParams_->getNumSteps())
                + " values but the time grid has " + std::to_string(grid.getNumSteps()) + " steps");
        }
    }

    std::vector<std::string> getParameterNames() const override {
        std::vector<std::string> names = {"beta", "sigma"};
        names.reserve(2 + hwParams_->getNumSteps());
        for (size_t k = 0; k < hwParams_->getNumSteps(); ++k) {
            names.push_back("alpha[" + std::to_string(k) + "]");
        }
        return names;
    }

    std::vector<double> getParametersVector() const override {
        std::vector<double> v;
        v.reserve(2 + hwParams_->getNumSteps());
        v.push_back(hwParams_->getBeta());
        v.push_back(hwParams_->getSigma());
        v.insert(v.end(), hwParams_->getAlpha().begin(), hwParams_->getAlpha().end());
        return v;
    }

    void setParametersVector(const std::vector<double>& params) override {
        size_t expected = 2 + hwParams_->getNumSteps();
        if (params.size() != expected) {
            throw ConfigurationError(
                "Hull-White requires " + std::to_string(expected)
                + " parameters (beta, sigma, one alpha per step), got " + std::to_string(params.size()));
        }
        auto newParams = std::make_unique<HullWhiteParameters>(
            std::vector<double>(params.begin() + 2, params.end()), params[0], params[1]);
        newParams->validate();
        hwParams_ = newParams.get();
        params_ = std::move(newParams);
    }

    std::shared_ptr<ShortRateModel> clone() const override {
        return std::make_shared<HullWhite>(
            initialRate_, hwParams_->getAlpha(), hwParams_->getBeta(), hwParams_->getSigma());
    }

    const std::vector<double>& getAlpha() const { return hwParams_->getAlpha(); }
    double getAlpha(size_t k) const { return hwParams_->getAlpha(k); }
    size_t getNumSteps() const { return hwParams_->getNumSteps(); }
    double getBeta() const { return hwParams_->getBeta(); }
    double getSigma() const { return hwParams_->getSigma(); }
};

}
