#pragma once
#include <stdexcept>
#include <string>

namespace shortrate {

/**
 * @brief Erreur de configuration (horizon, grille, taille d'ensemble, paramètres).
 *
 * Levée avant toute simulation ; le message indique la contrainte violée.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace shortrate
