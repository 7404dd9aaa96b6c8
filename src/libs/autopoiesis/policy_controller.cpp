#include "policy_controller.h"
#include "energy_ledger.h"
#include "random_context.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace autopoiesis {

int heuristic_action(const Vec2& food_offset) {
    if (std::abs(food_offset.x) > std::abs(food_offset.y)) {
        return food_offset.x > 0.0f ? ACTION_POSITIVE_X : ACTION_NEGATIVE_X;
    }
    return food_offset.y > 0.0f ? ACTION_POSITIVE_Y : ACTION_NEGATIVE_Y;
}

ActionDecision select_action(const Observation& observation, const Eigen::VectorXf& probabilities,
                             float epsilon, const PolicyConfig& config, RandomContext& rng) {
    if (observation.food_distance() < config.heuristic_radius &&
        rng.chance(config.heuristic_probability)) {
        return ActionDecision(SelectionTier::HEURISTIC, heuristic_action(observation.food_offset()));
    }

    if (rng.chance(epsilon)) {
        return ActionDecision(SelectionTier::EXPLORATION, rng.uniform_int(NUM_ACTIONS));
    }

    // maxCoeff reports the first maximum on ties
    Eigen::Index best = 0;
    probabilities.maxCoeff(&best);
    return ActionDecision(SelectionTier::EXPLOITATION, static_cast<int>(best));
}

PolicyController::PolicyController(const PolicyConfig& config, std::unique_ptr<FunctionApproximator> approximator)
    : config_(config), approximator_(std::move(approximator)), epsilon_(config.epsilon_initial) {
    if (!approximator_) {
        throw std::invalid_argument("PolicyController requires a function approximator");
    }
}

ActResult PolicyController::act(const Observation& observation, physicslib::PhysicsWorld& world,
                                physicslib::BodyId agent_body, EnergyLedger& ledger, RandomContext& rng) {
    ActResult result;
    result.raw_scores = approximator_->forward(observation);
    Eigen::VectorXf probabilities = softmax(result.raw_scores);

    result.decision = select_action(observation, probabilities, epsilon_, config_, rng);

    decay_epsilon();

    ledger.deduct(ledger.get_config().acting_cost);

    Vec2 force = action_force(result.decision.action_index, config_.force_magnitude);
    if (!world.apply_external_force(agent_body, force)) {
        spdlog::warn("Force for action {} could not be applied to agent body {}",
                     result.decision.action_index, agent_body);
    }
    world.step_simulation();

    SPDLOG_DEBUG("Action {} via {} tier, epsilon now {:.4f}",
                 result.decision.action_index, to_string(result.decision.tier), epsilon_);

    return result;
}

void PolicyController::decay_epsilon() {
    epsilon_ = std::max(epsilon_ * config_.epsilon_decay, config_.epsilon_min);
}

} // namespace autopoiesis
