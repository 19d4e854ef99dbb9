#pragma once
#include <random>
#include <cmath>
#include <cstdint>
#include <utility>
#include <algorithm>

namespace shortrate {

/**
 * @brief Générateur gaussien déterministe et ré-initialisable
 *
 * Une même graine reproduit exactement la même suite de tirages. Le simulateur
 * utilise un flux par trajectoire (forStream) afin que le résultat ne dépende
 * pas de l'ordre d'exécution des colonnes.
 */
class RandomSource {
private:
    std::mt19937_64 generator_;
    std::normal_distribution<double> stdNormal_;
    std::uint64_t seed_;

public:
    explicit RandomSource(std::uint64_t seed = 42)
        : generator_(seed), stdNormal_(0.0, 1.0), seed_(seed) {}

    /**
     * @brief Flux indépendant numéro `stream` dérivé de la graine de run
     */
    static RandomSource forStream(std::uint64_t seed, std::uint64_t stream) {
        return RandomSource(mixSeed(seed, stream));
    }

    // SplitMix64
    static std::uint64_t mixSeed(std::uint64_t seed, std::uint64_t stream) {
        std::uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (stream + 1);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    void reseed(std::uint64_t seed) {
        seed_ = seed;
        generator_.seed(seed);
        stdNormal_.reset();
    }

    std::uint64_t getSeed() const { return seed_; }

    double nextNormal() { return stdNormal_(generator_); }

    /**
     * @brief Paire gaussienne de corrélation rho (Z2 = rho*Z1 + sqrt(1-rho²)*Z')
     */
    std::pair<double, double> nextCorrelatedPair(double rho) {
        double z1 = nextNormal();
        double z2 = rho * z1 + std::sqrt(std::max(0.0, 1.0 - rho * rho)) * nextNormal();
        return {z1, z2};
    }
};

} // namespace shortrate
