#include "fnsanitizer/utils/RandomSource.h"

namespace fns {

DefaultRandomSource::DefaultRandomSource()
    : m_engine(std::random_device{}()) {}

DefaultRandomSource::DefaultRandomSource(unsigned int seed)
    : m_engine(seed) {}

int DefaultRandomSource::nextInRange(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(m_engine);
}

} // namespace fns
