#include "random_source.h"

RandomSource::RandomSource() : gen_(std::random_device{}()) {}

RandomSource::RandomSource(uint32_t seed) : gen_(seed) {}

void RandomSource::reseed(uint32_t seed)
{
    gen_.seed(seed);
    normal_.reset();
}

EffectKind RandomSource::uniform_effect()
{
    std::uniform_int_distribution<int> pick(0, CONCRETE_EFFECT_COUNT - 1);
    return static_cast<EffectKind>(pick(gen_));
}

double RandomSource::gaussian()
{
    return normal_(gen_);
}
