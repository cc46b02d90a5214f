#include "gunpong/core/random.hpp"

#include <cmath>
#include <ctime>
#include <limits>

Random::Random(unsigned int seed)
    : re(seed != 0 ? seed : static_cast<unsigned int>(std::time(nullptr)))
{}

float Random::uniform(float lo, float hi) {
    if (!(hi > lo)) {
        return lo;
    }
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(re);
}

double Random::uniform(double lo, double hi) {
    if (!(hi > lo)) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(re);
}

float Random::jitter(float amount) {
    float const a = std::fabs(amount);
    return uniform(-a, a);
}

double Random::jitter(double amount) {
    double const a = std::fabs(amount);
    return uniform(-a, a);
}

unsigned int Random::nextSeed() {
    std::uniform_int_distribution<unsigned int> dist(1, std::numeric_limits<unsigned int>::max());
    return dist(re);
}
