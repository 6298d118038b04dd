#pragma once

#include <cstdint>
#include <random>

#include "droid_types.h"

/*
 * Random stream handed to every synthesis call. Used to resolve the
 * Random effect and for the Scream noise component. Not thread-safe:
 * each thread (or messenger) owns its own instance.
 */
class RandomSource {
public:
    RandomSource();                         // seeded from std::random_device
    explicit RandomSource(uint32_t seed);

    void reseed(uint32_t seed);

    EffectKind uniform_effect();            // one of the 8 concrete effects
    double     gaussian();                  // N(0, 1)

private:
    std::mt19937                     gen_;
    std::normal_distribution<double> normal_{0.0, 1.0};
};
