#include "tiltball/core/random_source.hpp"

MersenneRandomSource::MersenneRandomSource()
    : engine(std::random_device{}())
{
}

MersenneRandomSource::MersenneRandomSource(uint32_t seed)
    : engine(seed)
{
}

double MersenneRandomSource::uniform() {
    return distribution(engine);
}
