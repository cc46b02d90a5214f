#pragma once

#include <random>

/**
 * @class Random
 * @brief Seeded uniform random source shared by the systems of one Game.
 */
class Random {
public:
    /**
     * @param seed Engine seed; 0 seeds from the wall clock
     */
    explicit Random(unsigned int seed = 0);

    /** @brief Uniform value in [lo, hi]; returns lo when the range is empty. */
    float uniform(float lo, float hi);
    double uniform(double lo, double hi);

    /** @brief Symmetric jitter in [-amount, amount]. */
    float jitter(float amount);
    double jitter(double amount);

    /** @brief Non-zero seed for a dependent Random. */
    unsigned int nextSeed();

private:
    std::mt19937 re;
};
