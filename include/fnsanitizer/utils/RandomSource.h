#ifndef FNSANITIZER_RANDOM_SOURCE_H
#define FNSANITIZER_RANDOM_SOURCE_H

#include <random>

namespace fns {

/**
 * Source of random numbers for placeholder names
 *
 * Injected wherever randomness is needed so that tests can supply
 * a deterministic generator.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * Draw an integer from the closed range [lo, hi]
     */
    virtual int nextInRange(int lo, int hi) = 0;
};

/**
 * Mersenne twister seeded from std::random_device
 */
class DefaultRandomSource : public RandomSource {
public:
    DefaultRandomSource();
    explicit DefaultRandomSource(unsigned int seed);

    int nextInRange(int lo, int hi) override;

private:
    std::mt19937 m_engine;
};

} // namespace fns

#endif // FNSANITIZER_RANDOM_SOURCE_H
