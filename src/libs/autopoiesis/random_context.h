#ifndef AUTOPOIESIS_RANDOM_CONTEXT_H
#define AUTOPOIESIS_RANDOM_CONTEXT_H

#include <cstdint>
#include <random>

namespace autopoiesis {

// Per-episode random source. Two contexts built from the same seed produce
// the same draw sequence.
class RandomContext {
public:
    explicit RandomContext(uint32_t seed);

    float uniform(float low, float high);
    // Uniform integer in [0, n).
    int uniform_int(int n);
    // True with the given probability.
    bool chance(float probability);

    uint32_t get_seed() const { return seed_; }

private:
    uint32_t seed_;
    std::mt19937 rng_;
    std::uniform_real_distribution<float> unit_dist_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_RANDOM_CONTEXT_H
