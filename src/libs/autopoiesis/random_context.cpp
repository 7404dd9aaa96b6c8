#include "random_context.h"

namespace autopoiesis {

RandomContext::RandomContext(uint32_t seed)
    : seed_(seed), rng_(seed), unit_dist_(0.0f, 1.0f) {}

float RandomContext::uniform(float low, float high) {
    return low + unit_dist_(rng_) * (high - low);
}

int RandomContext::uniform_int(int n) {
    if (n <= 1) return 0;
    std::uniform_int_distribution<int> dist(0, n - 1);
    return dist(rng_);
}

bool RandomContext::chance(float probability) {
    return unit_dist_(rng_) < probability;
}

} // namespace autopoiesis
