#pragma once

#include "core/Errors.hpp"
#include <string>
#include <map>
#include <vector>
#include <cmath>
#include <utility>
#include <algorithm>

namespace shortrate {

/**
 * @brief Classe de base pour les paramètres des modèles de taux court
 *
 * Les scalaires sont stockés dans un map<string, double> ; chaque famille de
 * modèles fournit sa sous-classe (variante taguée) avec sa propre validation.
 */
class ModelParameters {
protected:
    std::map<std::string, double> params_;  // Stockage clé-valeur des paramètres

    void requireFinite(const std::string& name) const {
        if (!std::isfinite(params_.at(name))) {
            throw ConfigurationError("Parameter '" + name + "' must be finite");
        }
    }

    void requireNonNegative(const std::string& name) const {
        requireFinite(name);
        if (params_.at(name) < 0.0) {
            throw ConfigurationError("Parameter '" + name + "' must be >= 0, got "
                                     + std::to_string(params_.at(name)));
        }
    }

public:
    ModelParameters() = default;
    virtual ~ModelParameters() = default;

    virtual void validate() const = 0;

    /**
     * @brief Une ligne "nom = valeur" par paramètre scalaire
     */
    virtual std::string toString() const {
        std::string result;
        for (const auto& [key, value] : params_) {
            result += "  " + key + " = " + std::to_string(value) + "\n";
        }
        return result;
    }
};

/**
 * @brief Paramètres du modèle de Merton
 * SDE: dr_t = α*dt + σ*dW_t
 */
class MertonParameters : public ModelParameters {
public:
    MertonParameters(double alpha = 0.0, double sigma = 0.01) {
        params_["alpha"] = alpha;  // Drift constant
        params_["sigma"] = sigma;  // Volatilité
    }

    void validate() const override {
        requireFinite("alpha");
        requireNonNegative("sigma");
    }

    double getAlpha() const { return params_.at("alpha"); }
    double getSigma() const { return params_.at("sigma"); }
};

/**
 * @brief Paramètres des modèles à retour à la moyenne (Vasicek, Brennan-Schwartz, CIR)
 * SDE générique: dr_t = β(α - r_t)*dt + σ*f(r_t)*dW_t
 */
class MeanReversionParameters : public ModelParameters {
public:
    MeanReversionParameters(double alpha = 0.03, double beta = 0.5, double sigma = 0.01) {
        params_["alpha"] = alpha;  // Niveau de long terme
        params_["beta"] = beta;    // Vitesse de retour à la moyenne
        params_["sigma"] = sigma;  // Volatilité
    }

    void validate() const override {
        requireFinite("alpha");
        requireNonNegative("beta");
        requireNonNegative("sigma");
    }

    double getAlpha() const { return params_.at("alpha"); }
    double getBeta() const { return params_.at("beta"); }
    double getSigma() const { return params_.at("sigma"); }
};

/**
 * @brief Paramètres du modèle de Dothan
 * SDE: dr_t = σ*r_t*dW_t
 */
class DothanParameters : public ModelParameters {
public:
    explicit DothanParameters(double sigma = 0.1) {
        params_["sigma"] = sigma;
    }

    void validate() const override {
        requireNonNegative("sigma");
    }

    double getSigma() const { return params_.at("sigma"); }
};

/**
 * @brief Paramètres du modèle gaussien à deux facteurs
 *   dx_t = βx(αx - x_t)*dt + σx*dW^x_t
 *   dy_t = βy(αy - y_t)*dt + σy*dW^y_t
 *   d<W^x, W^y>_t = ρ*dt,  r_t = x_t + y_t
 */
class TwoFactorParameters : public ModelParameters {
public:
    TwoFactorParameters(double alphaX = 0.02, double betaX = 0.5, double sigmaX = 0.01,
                        double alphaY = 0.01, double betaY = 0.1, double sigmaY = 0.005,
                        double rho = -0.1) {
        params_["alphaX"] = alphaX;
        params_["betaX"] = betaX;
        params_["sigmaX"] = sigmaX;
        params_["alphaY"] = alphaY;
        params_["betaY"] = betaY;
        params_["sigmaY"] = sigmaY;
        params_["rho"] = rho;      // Corrélation des chocs
    }

    void validate() const override {
        requireFinite("alphaX");
        requireFinite("alphaY");
        requireNonNegative("betaX");
        requireNonNegative("betaY");
        requireNonNegative("sigmaX");
        requireNonNegative("sigmaY");
        requireFinite("rho");
        if (std::abs(params_.at("rho")) > 1.0) {
            throw ConfigurationError("Rho (correlation) must be in [-1, 1]");
        }
    }

    double getAlphaX() const { return params_.at("alphaX"); }
    double getBetaX() const { return params_.at("betaX"); }
    double getSigmaX() const { return params_.at("sigmaX"); }
    double getAlphaY() const { return params_.at("alphaY"); }
    double getBetaY() const { return params_.at("betaY"); }
    double getSigmaY() const { return params_.at("sigmaY"); }
    double getRho() const { return params_.at("rho"); }
};

/**
 * @brief Paramètres du modèle de Hull-White (Vasicek étendu)
 * SDE: dr_t = β(α(t) - r_t)*dt + σ*dW_t
 *
 * α est un vecteur avec une valeur par pas de la grille : alpha[k] est le
 * niveau moyen en vigueur sur l'intervalle [t_k, t_{k+1}].
 */
class HullWhiteParameters : public ModelParameters {
private:
    std::vector<double> alpha_;

public:
    HullWhiteParameters(std::vector<double> alpha, double beta = 0.5, double sigma = 0.01)
        : alpha_(std::move(alpha)) {
        params_["beta"] = beta;
        params_["sigma"] = sigma;
    }

    void validate() const override {
        if (alpha_.empty()) {
            throw ConfigurationError("Hull-White requires a non-empty per-step alpha vector");
        }
        for (size_t k = 0; k < alpha_.size(); ++k) {
            if (!std::isfinite(alpha_[k])) {
                throw ConfigurationError("Hull-White alpha[" + std::to_string(k) + "] must be finite");
            }
        }
        requireNonNegative("beta");
        requireNonNegative("sigma");
    }

    std::string toString() const override {
        double lo = *std::min_element(alpha_.begin(), alpha_.end());
        double hi = *std::max_element(alpha_.begin(), alpha_.end());
        return ModelParameters::toString()
             + "  alpha = " + std::to_string(alpha_.size()) + " valeurs dans ["
             + std::to_string(lo) + ", " + std::to_string(hi) + "]\n";
    }

    const std::vector<double>& getAlpha() const { return alpha_; }
    double getAlpha(size_t k) const { return alpha_[k]; }
    double getBeta() const { return params_.at("beta"); }
    double getSigma() const { return params_.at("sigma"); }
    size_t getNumSteps() const { return alpha_.size(); }
};

}
