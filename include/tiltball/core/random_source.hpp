/**
 * @file random_source.hpp
 * @brief Injectable source of uniform random numbers
 *
 * Hole timings, saucer kicks and hole cycling all draw from an IRandomSource
 * so tests can pin the sequence.
 */

#pragma once

#include <cstdint>
#include <random>

/**
 * @class IRandomSource
 * @brief Produces uniform doubles in [0,1).
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Next uniform value in [0,1)
     */
    virtual double uniform() = 0;

    /**
     * @brief Next uniform value in [lo, hi)
     */
    double uniform(double lo, double hi) {
        return lo + uniform() * (hi - lo);
    }
};

/**
 * @class MersenneRandomSource
 * @brief std::mt19937 backed source, seeded explicitly or from std::random_device
 */
class MersenneRandomSource : public IRandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(uint32_t seed);
    ~MersenneRandomSource() override = default;

    double uniform() override;

private:
    std::mt19937 engine;
    std::uniform_real_distribution<double> distribution{0.0, 1.0};
};
