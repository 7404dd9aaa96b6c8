#ifndef AUTOPOIESIS_REWARD_SHAPER_H
#define AUTOPOIESIS_REWARD_SHAPER_H

#include "agent_types.h"
#include "simulation_config.h"

namespace autopoiesis {

class RewardShaper {
public:
    explicit RewardShaper(const RewardConfig& config) : config_(config) {}

    // food_reward on consumption, otherwise a proximity term in
    // (-inf, shaping_scale] minus the existence penalty. Distances beyond
    // max_distance are not clamped.
    float reward(const Observation& observation, bool food_consumed) const;

    const RewardConfig& get_config() const { return config_; }

private:
    RewardConfig config_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_REWARD_SHAPER_H
