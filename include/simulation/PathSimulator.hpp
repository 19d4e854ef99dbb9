/**
 * @file PathSimulator.hpp
 * @brief Simulation d'ensembles de trajectoires de taux court (Euler-Maruyama).
 * @version 1.0
 */

#pragma once
#include "../core/ShortRateModel.hpp"
#include "../core/TimeGrid.hpp"
#include <eigen3/Eigen/Dense>
#include <vector>
#include <memory>
#include <thread>
#include <string>
#include <cstdint>

namespace shortrate {

/**
 * @brief Ensemble de trajectoires N x M : ligne = pas de temps t_0..t_{N-1},
 *        colonne = trajectoire indépendante.
 */
using PathEnsemble = Eigen::MatrixXd;

/**
 * @class PathSimulator
 * @brief Produit un PathEnsemble pour un modèle et une grille donnés.
 *
 * Chaque colonne tire ses chocs dans son propre flux RandomSource dérivé de
 * (seed, colonne) : le résultat est identique bit à bit quel que soit le
 * nombre de threads.
 */
class PathSimulator {
public:

    /**
     * @struct SimulationConfig
     * @brief Paramètres de configuration de la simulation.
     */
    struct SimulationConfig {
        size_t nPaths = 1000;             /**< Taille de l'ensemble M */
        size_t nSteps = 60;               /**< Nombre de pas N */
        double horizon = 5.0;             /**< Horizon en années */
        std::uint64_t seed = 42;          /**< Graine aléatoire */
        size_t nThreads = 1;              /**< Threads utilisés (0 = tous les coeurs) */
    };

    /**
     * @struct SimulationStatistics
     * @brief Statistiques des trajectoires simulées.
     */
    struct SimulationStatistics {
        std::vector<double> meanPath;     /**< Moyenne par pas de temps */
        std::vector<double> stdPath;      /**< Écart-type par pas de temps */

        std::vector<double> quant05;      /**< Quantile 5% */
        std::vector<double> quant50;      /**< Médiane */
        std::vector<double> quant95;      /**< Quantile 95% */

        double terminalMean{};            /**< Moyenne terminale */
        double terminalStd{};             /**< Écart-type terminal */
        double terminalMin{};             /**< Minimum terminal */
        double terminalMax{};             /**< Maximum terminal */
        double standardError{};           /**< Erreur standard de la moyenne terminale */

        size_t negativeCount{};           /**< Nombre d'états strictement négatifs */
        size_t nPaths{};                  /**< Nombre total de trajectoires */
    };

private:
    std::shared_ptr<const ShortRateModel> model_;  /**< Modèle simulé (lecture seule) */
    SimulationConfig config_;                      /**< Configuration */
    TimeGrid grid_;                                /**< Grille temporelle */

public:

    /**
     * @brief Constructeur du simulateur.
     * @param model Modèle de taux court.
     * @param cfg Configuration de simulation.
     * @throws ConfigurationError si nPaths, nSteps ou horizon ne sont pas
     *         strictement positifs, ou si le modèle est incompatible avec la grille.
     */
    PathSimulator(std::shared_ptr<const ShortRateModel> model,
                  const SimulationConfig& cfg);

    /**
     * @brief Lance la simulation (séquentielle ou parallèle).
     * @return Matrice N x M des taux simulés.
     */
    PathEnsemble simulate() const;

    const TimeGrid& getTimeGrid() const { return grid_; }
    const SimulationConfig& getConfig() const { return config_; }
    const ShortRateModel& getModel() const { return *model_; }

    /**
     * @brief Calcule les statistiques d'un ensemble.
     * @throws std::invalid_argument si l'ensemble est vide.
     */
    static SimulationStatistics computeStatistics(const PathEnsemble& paths);

    /**
     * @brief Exporte les trajectoires dans un fichier CSV (une ligne par pas : t, r_1..r_M).
     * @throws std::runtime_error si le fichier ne peut pas être ouvert.
     */
    static void exportToCSV(const PathEnsemble& paths, const TimeGrid& grid,
                            const std::string& filename);

private:

    /**
     * @brief Simule les colonnes [firstColumn, firstColumn + nColumns).
     */
    void simulateBlock(PathEnsemble& paths, size_t firstColumn, size_t nColumns) const;

    size_t effectiveThreads() const;
};

} // namespace shortrate
