#pragma once

#include "core/ShortRateModel.hpp"
#include "data/ObservedCurve.hpp"
#include "simulation/PathSimulator.hpp"
#include "calibration/CurveCalibrator.hpp"
#include <memory>
#include <string>

/**
 * @brief Configuration complète d'un run (simulation et/ou calibration).
 */
struct RunConfig {
    shortrate::PathSimulator::SimulationConfig simulation;
    shortrate::CurveCalibrator::CalibrationConfig calibration;
    std::string modelName;
    std::shared_ptr<shortrate::ShortRateModel> model;
    shortrate::ObservedCurve observed;
    std::string pathsOutput;   // vide = pas d'export
    std::string curveOutput;   // vide = pas d'export
};

class ConfigLoader {
public:
    /**
     * @brief Charge un fichier de configuration JSON.
     * @throws std::runtime_error si le fichier est illisible ou n'est pas du JSON valide
     * @throws shortrate::ConfigurationError si une clé est absente ou invalide
     */
    static RunConfig loadFromFile(const std::string& filename);

    static RunConfig loadFromString(const std::string& text);
};
