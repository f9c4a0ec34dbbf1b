#pragma once

#include <random>

/**
 * @class IRandomSource
 * @brief Source of uniform random numbers for flake spawning and landing.
 * @ingroup Simulation
 *
 * Every random decision the simulation makes (depth, spawn position,
 * velocity jitter, stack offset, stickiness roll) is drawn from an
 * IRandomSource passed in by the owner. Production code uses
 * MersenneRandomSource; tests substitute a scripted sequence so the
 * exact state transitions can be checked.
 *
 * @par Contract
 * NextFloat() returns values in @f$ [0, 1) @f$. Implementations must never
 * return 1.0, since spawn math relies on the open upper bound to keep
 * depth strictly below 1.
 */
class IRandomSource
{
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Draw the next uniform value.
     * @return A value in [0, 1).
     */
    virtual float NextFloat() = 0;

    /**
     * @brief Draw a uniform value in [minValue, maxValue).
     */
    float Uniform(float minValue, float maxValue)
    {
        return minValue + NextFloat() * (maxValue - minValue);
    }
};

/**
 * @class MersenneRandomSource
 * @brief IRandomSource backed by a std::mt19937 engine.
 * @ingroup Simulation
 */
class MersenneRandomSource : public IRandomSource
{
public:
    /// @brief Seed from std::random_device.
    MersenneRandomSource();

    /// @brief Seed with a fixed value for reproducible runs.
    explicit MersenneRandomSource(unsigned int seed);

    float NextFloat() override;

private:
    std::mt19937 m_Rng;                             ///< Mersenne Twister RNG.
    std::uniform_real_distribution<float> m_Dist01; ///< Uniform [0, 1) distribution.
};
