#include "reward_shaper.h"

namespace autopoiesis {

float RewardShaper::reward(const Observation& observation, bool food_consumed) const {
    if (food_consumed) {
        return config_.food_reward;
    }

    float d = observation.food_distance();
    float proximity = (config_.max_distance - d) / config_.max_distance * config_.shaping_scale;
    return proximity - config_.existence_penalty;
}

} // namespace autopoiesis
