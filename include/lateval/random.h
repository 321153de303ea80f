#pragma once

#include <cstdint>
#include <random>

namespace lateval {

// ============================================================================
// Random Sources
// ============================================================================

/**
 * @brief Source of Gaussian deviates for IID substitution and sampling.
 *
 * Injected through the evaluation options so that tests can interpose
 * on the draws.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double normal(double mean, double sd) = 0;
};

/**
 * @brief RandomSource backed by std::mt19937_64.
 */
class EngineRandomSource : public RandomSource {
public:
    // Seeded from std::random_device
    EngineRandomSource();
    explicit EngineRandomSource(uint64_t seed);

    double normal(double mean, double sd) override;

    std::mt19937_64& engine() { return engine_; }

private:
    std::mt19937_64 engine_;
};

// Process-wide generator used when no seed and no source are supplied
RandomSource& processRandomSource();

}  // namespace lateval
