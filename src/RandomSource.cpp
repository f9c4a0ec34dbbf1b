#include "RandomSource.h"

#include <cmath>

MersenneRandomSource::MersenneRandomSource()
    : m_Rng(std::random_device{}())  // Seeded Mersenne Twister RNG
    , m_Dist01(0.0f, 1.0f)           // Uniform distribution for random values
{
}

MersenneRandomSource::MersenneRandomSource(unsigned int seed)
    : m_Rng(seed)
    , m_Dist01(0.0f, 1.0f)
{
}

float MersenneRandomSource::NextFloat()
{
    float value = m_Dist01(m_Rng);

    // generate_canonical<float> may round up to exactly 1.0
    if (value >= 1.0f)
    {
        value = std::nextafter(1.0f, 0.0f);
    }
    return value;
}
