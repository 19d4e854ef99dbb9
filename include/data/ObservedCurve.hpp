#pragma once
#include "core/Errors.hpp"
#include <map>
#include <vector>
#include <utility>
#include <string>
#include <cmath>

namespace shortrate {

/**
 * @brief Courbe de taux observée : maturité (en pas de grille) -> rendement décimal.
 *
 * Creuse par rapport à la grille (seulement les ténors cotés). Lecture seule
 * une fois chargée.
 */
class ObservedCurve {
private:
    std::map<size_t, double> points_;

public:
    ObservedCurve() = default;

    explicit ObservedCurve(const std::vector<std::pair<size_t, double>>& points) {
        for (const auto& [m, y] : points) {
            push_back(m, y);
        }
    }

    /**
     * @throws ConfigurationError si m == 0, si le rendement n'est pas fini ou
     *         si la maturité est déjà présente
     */
    void push_back(size_t maturityStep, double yield) {
        if (maturityStep == 0) {
            throw ConfigurationError("Observed maturity must be at least one grid step");
        }
        if (!std::isfinite(yield)) {
            throw ConfigurationError("Observed yield at step " + std::to_string(maturityStep)
                                     + " must be finite");
        }
        if (!points_.emplace(maturityStep, yield).second) {
            throw ConfigurationError("Duplicate observed maturity step " + std::to_string(maturityStep));
        }
    }

    [[nodiscard]] size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] bool empty() const noexcept { return points_.empty(); }

    size_t maxMaturity() const noexcept {
        return points_.empty() ? 0 : points_.rbegin()->first;
    }

    bool contains(size_t maturityStep) const { return points_.count(maturityStep) > 0; }

    double at(size_t maturityStep) const { return points_.at(maturityStep); }

    std::map<size_t, double>::const_iterator begin() const { return points_.begin(); }
    std::map<size_t, double>::const_iterator end() const { return points_.end(); }
};

}
