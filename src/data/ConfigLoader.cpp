/**
 * @file ConfigLoader.cpp
 * @brief Lecture de la configuration JSON d'un run.
 *
 * Le fichier décrit la grille, l'ensemble Monte Carlo, le modèle et ses
 * paramètres, la courbe observée et les options de calibration. Toute clé
 * absente ou mal typée est signalée par une ConfigurationError qui nomme la clé.
 */

#include "data/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "models/Merton.hpp"
#include "models/Vasicek.hpp"
#include "models/Dothan.hpp"
#include "models/BrennanSchwartz.hpp"
#include "models/CoxIngersollRoss.hpp"
#include "models/TwoFactorGaussian.hpp"
#include "models/HullWhite.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using shortrate::ConfigurationError;

// ============================================================================
// FONCTIONS INTERNES
// ============================================================================

namespace {

double requireNumber(const json& j, const std::string& key, const std::string& context) {
    if (!j.contains(key)) {
        throw ConfigurationError("Missing key '" + key + "' in " + context);
    }
    if (!j[key].is_number()) {
        throw ConfigurationError("Key '" + key + "' in " + context + " must be a number");
    }
    return j[key].get<double>();
}

double optionalNumber(const json& j, const std::string& key, double fallback, const std::string& context) {
    return j.contains(key) ? requireNumber(j, key, context) : fallback;
}

size_t requireCount(const json& j, const std::string& key, const std::string& context) {
    if (!j.contains(key)) {
        throw ConfigurationError("Missing key '" + key + "' in " + context);
    }
    if (!j[key].is_number_integer()) {
        throw ConfigurationError("Key '" + key + "' in " + context + " must be an integer");
    }
    long long value = j[key].get<long long>();
    if (value <= 0) {
        throw ConfigurationError("Key '" + key + "' in " + context + " must be positive, got "
                                 + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

size_t optionalCount(const json& j, const std::string& key, size_t fallback, const std::string& context) {
    return j.contains(key) ? requireCount(j, key, context) : fallback;
}

std::string optionalString(const json& j, const std::string& key, const std::string& context) {
    if (!j.contains(key)) return "";
    if (!j[key].is_string()) {
        throw ConfigurationError("Key '" + key + "' in " + context + " must be a string");
    }
    return j[key].get<std::string>();
}

/**
 * @brief α de Hull-White : scalaire répété ou tableau de exactement nSteps valeurs.
 */
std::vector<double> readAlphaVector(const json& params, size_t nSteps) {
    if (!params.contains("alpha")) {
        throw ConfigurationError("Missing key 'alpha' in parameters");
    }
    const json& alpha = params["alpha"];
    if (alpha.is_number()) {
        return std::vector<double>(nSteps, alpha.get<double>());
    }
    if (!alpha.is_array()) {
        throw ConfigurationError("Hull-White 'alpha' must be a number or an array of per-step values");
    }
    if (alpha.size() != nSteps) {
        throw ConfigurationError("Hull-White 'alpha' has " + std::to_string(alpha.size())
                                 + " values, expected one per grid step (" + std::to_string(nSteps) + ")");
    }
    std::vector<double> values;
    values.reserve(nSteps);
    for (const auto& v : alpha) {
        if (!v.is_number()) {
            throw ConfigurationError("Hull-White 'alpha' entries must be numbers");
        }
        values.push_back(v.get<double>());
    }
    return values;
}

std::shared_ptr<shortrate::ShortRateModel> makeModel(const std::string& name, const json& root,
                                                     size_t nSteps) {
    using namespace shortrate;

    if (!root.contains("parameters") || !root["parameters"].is_object()) {
        throw ConfigurationError("Missing object 'parameters'");
    }
    const json& p = root["parameters"];
    const std::string ctx = "parameters";

    if (name == "two-factor") {
        return std::make_shared<TwoFactorGaussian>(
            requireNumber(p, "x0", ctx), requireNumber(p, "y0", ctx),
            requireNumber(p, "alphaX", ctx), requireNumber(p, "betaX", ctx), requireNumber(p, "sigmaX", ctx),
            requireNumber(p, "alphaY", ctx), requireNumber(p, "betaY", ctx), requireNumber(p, "sigmaY", ctx),
            optionalNumber(p, "rho", TwoFactorGaussian::kDefaultRho, ctx));
    }

    double r0 = requireNumber(root, "initialRate", "configuration");

    if (name == "merton") {
        return std::make_shared<Merton>(r0, requireNumber(p, "alpha", ctx), requireNumber(p, "sigma", ctx));
    }
    if (name == "vasicek") {
        return std::make_shared<Vasicek>(r0, requireNumber(p, "alpha", ctx),
                                         requireNumber(p, "beta", ctx), requireNumber(p, "sigma", ctx));
    }
    if (name == "dothan") {
        return std::make_shared<Dothan>(r0, requireNumber(p, "sigma", ctx));
    }
    if (name == "brennan-schwartz") {
        return std::make_shared<BrennanSchwartz>(r0, requireNumber(p, "alpha", ctx),
                                                 requireNumber(p, "beta", ctx), requireNumber(p, "sigma", ctx));
    }
    if (name == "cir") {
        return std::make_shared<CoxIngersollRoss>(r0, requireNumber(p, "alpha", ctx),
                                                  requireNumber(p, "beta", ctx), requireNumber(p, "sigma", ctx));
    }
    if (name == "hull-white") {
        return std::make_shared<HullWhite>(r0, readAlphaVector(p, nSteps),
                                           requireNumber(p, "beta", ctx), requireNumber(p, "sigma", ctx));
    }
    throw ConfigurationError("Unknown model '" + name + "' (expected merton, vasicek, dothan, "
                             "brennan-schwartz, cir, two-factor or hull-white)");
}

shortrate::ObservedCurve readObservedCurve(const json& root) {
    shortrate::ObservedCurve curve;
    if (!root.contains("observed")) return curve;

    const json& obs = root["observed"];
    if (!obs.is_array()) {
        throw ConfigurationError("'observed' must be an array of [maturity_step, yield] pairs");
    }
    for (const auto& point : obs) {
        if (!point.is_array() || point.size() != 2
            || !point[0].is_number_integer() || !point[1].is_number()) {
            throw ConfigurationError("Each 'observed' entry must be [maturity_step, yield]");
        }
        long long m = point[0].get<long long>();
        if (m <= 0) {
            throw ConfigurationError("Observed maturity step must be positive, got " + std::to_string(m));
        }
        curve.push_back(static_cast<size_t>(m), point[1].get<double>());
    }
    return curve;
}

} // namespace

// ============================================================================
// API PRINCIPALE
// ============================================================================

RunConfig ConfigLoader::loadFromString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid JSON configuration: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigurationError("Configuration root must be a JSON object");
    }

    RunConfig cfg;
    const std::string ctx = "configuration";

    cfg.simulation.horizon = requireNumber(root, "horizon", ctx);
    if (!(cfg.simulation.horizon > 0.0)) {
        throw ConfigurationError("Key 'horizon' must be positive");
    }
    cfg.simulation.nSteps = requireCount(root, "steps", ctx);
    cfg.simulation.nPaths = requireCount(root, "paths", ctx);
    if (root.contains("seed")) {
        if (!root["seed"].is_number_unsigned()) {
            throw ConfigurationError("Key 'seed' must be a non-negative integer");
        }
        cfg.simulation.seed = root["seed"].get<std::uint64_t>();
    }
    if (root.contains("threads")) {
        if (!root["threads"].is_number_unsigned()) {
            throw ConfigurationError("Key 'threads' must be a non-negative integer");
        }
        cfg.simulation.nThreads = root["threads"].get<size_t>();
    }

    if (!root.contains("model") || !root["model"].is_string()) {
        throw ConfigurationError("Missing string key 'model'");
    }
    cfg.modelName = root["model"].get<std::string>();
    cfg.model = makeModel(cfg.modelName, root, cfg.simulation.nSteps);

    cfg.observed = readObservedCurve(root);

    if (root.contains("calibration")) {
        const json& c = root["calibration"];
        const std::string cctx = "calibration";
        if (!c.is_object()) {
            throw ConfigurationError("'calibration' must be an object");
        }
        auto& cal = cfg.calibration;
        cal.maxIterations = optionalCount(c, "maxIterations", cal.maxIterations, cctx);
        cal.maxEvaluations = optionalCount(c, "maxEvaluations", cal.maxEvaluations, cctx);
        cal.tolerance = optionalNumber(c, "tolerance", cal.tolerance, cctx);
        cal.pointTolerance = optionalNumber(c, "pointTolerance", cal.pointTolerance, cctx);
        cal.initialStep = optionalNumber(c, "initialStep", cal.initialStep, cctx);
        cal.penalty = optionalNumber(c, "penalty", cal.penalty, cctx);
        if (c.contains("restarts")) {
            if (!c["restarts"].is_number_unsigned()) {
                throw ConfigurationError("Key 'restarts' in calibration must be a non-negative integer");
            }
            cal.restarts = c["restarts"].get<size_t>();
        }
        if (c.contains("verbose")) {
            if (!c["verbose"].is_boolean()) {
                throw ConfigurationError("Key 'verbose' in calibration must be a boolean");
            }
            cal.verbose = c["verbose"].get<bool>();
        }
    }

    if (root.contains("output")) {
        const json& o = root["output"];
        if (!o.is_object()) {
            throw ConfigurationError("'output' must be an object");
        }
        cfg.pathsOutput = optionalString(o, "paths", "output");
        cfg.curveOutput = optionalString(o, "curve", "output");
    }

    return cfg;
}

RunConfig ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Cannot open configuration file: " + filename);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}
