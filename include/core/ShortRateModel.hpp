// include/core/ShortRateModel.hpp
#ifndef SHORT_RATE_MODEL_HPP
#define SHORT_RATE_MODEL_HPP

#include "ModelParameters.hpp"
#include "TimeGrid.hpp"
#include <vector>
#include <memory>
#include <string>
#include <cmath>

namespace shortrate {

/**
 * @brief Spécification d'un modèle de taux court (dérive, diffusion, pas d'Euler)
 *
 * Le modèle ne contient aucune logique de simulation : il décrit comment faire
 * avancer l'état d'un pas. Toutes les méthodes d'évaluation sont const, un même
 * modèle peut donc être lu par plusieurs threads du simulateur.
 *
 * Les modèles à plusieurs facteurs exposent leur état latent via
 * initialFactors()/advanceFactors()/shortRate().
 */
class ShortRateModel {
protected:
    double initialRate_;
    std::unique_ptr<ModelParameters> params_;

public:
    explicit ShortRateModel(double initialRate = 0.0)
        : initialRate_(initialRate) {}

    virtual ~ShortRateModel() = default;

    // No copy, only move (copies passent par clone())
    ShortRateModel(const ShortRateModel&) = delete;
    ShortRateModel& operator=(const ShortRateModel&) = delete;
    ShortRateModel(ShortRateModel&&) = default;
    ShortRateModel& operator=(ShortRateModel&&) = default;

    // ====================================================================
    // Pure virtual methods
    // ====================================================================
    virtual std::string getName() const = 0;
    virtual void validateParameters() const = 0;

    virtual std::vector<std::string> getParameterNames() const = 0;
    virtual std::vector<double> getParametersVector() const = 0;
    virtual void setParametersVector(const std::vector<double>& params) = 0;

    virtual std::shared_ptr<ShortRateModel> clone() const = 0;

    virtual std::vector<double> initialFactors() const = 0;

    /**
     * @brief Avance l'état latent d'un pas
     * @param factors État à t_k, remplacé par l'état à t_{k+1}
     * @param dt Pas de temps
     * @param z1 Premier tirage gaussien
     * @param z2 Second tirage (corrélé à z1), ignoré par les modèles à un facteur
     * @param stepIndex Index k de l'intervalle [t_k, t_{k+1}]
     */
    virtual void advanceFactors(std::vector<double>& factors, double dt,
                                double z1, double z2, size_t stepIndex) const = 0;

    virtual double shortRate(const std::vector<double>& factors) const = 0;

    // ====================================================================
    // Default virtual methods
    // ====================================================================
    virtual size_t factorCount() const { return 1; }
    virtual double shockCorrelation() const { return 0.0; }
    virtual bool canBeNegative() const { return true; }
    virtual bool hasTimeDependentParameters() const { return false; }

    /**
     * @brief Vérifie la cohérence du modèle avec la grille de simulation
     * @throws ConfigurationError en cas d'incompatibilité
     */
    virtual void validateForGrid(const TimeGrid& grid) const { (void)grid; }

    // ====================================================================
    // Utilitaires
    // ====================================================================
    double getInitialRate() const { return initialRate_; }

    /**
     * @brief Description lisible : nom, taux initial puis paramètres
     */
    virtual std::string toString() const {
        return getName() + "\n  r0 = " + std::to_string(initialRate_)
               + "\n" + params_->toString();
    }
};

/**
 * @brief Modèle à un facteur : r_{k+1} = r_k + μ(r_k, k)*dt + σ(r_k, k)*z*√dt
 */
class OneFactorModel : public ShortRateModel {
public:
    using ShortRateModel::ShortRateModel;

    virtual double drift(double r, size_t stepIndex) const = 0;
    virtual double diffusion(double r, size_t stepIndex) const = 0;

    /**
     * @brief Pas d'Euler-Maruyama, pur et total pour dt > 0
     */
    virtual double step(double prior, double dt, double z, size_t stepIndex) const {
        return prior + drift(prior, stepIndex) * dt
                     + diffusion(prior, stepIndex) * z * std::sqrt(dt);
    }

    std::vector<double> initialFactors() const override {
        return {initialRate_};
    }

    void advanceFactors(std::vector<double>& factors, double dt,
                        double z1, double z2, size_t stepIndex) const override {
        (void)z2;
        factors[0] = step(factors[0], dt, z1, stepIndex);
    }

    double shortRate(const std::vector<double>& factors) const override {
        return factors[0];
    }
};

} // namespace shortrate

#endif // SHORT_RATE_MODEL_HPP
