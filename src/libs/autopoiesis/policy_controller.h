#ifndef AUTOPOIESIS_POLICY_CONTROLLER_H
#define AUTOPOIESIS_POLICY_CONTROLLER_H

#include "agent_types.h"
#include "action_space.h"
#include "function_approximator.h"
#include "simulation_config.h"
#include "physics_world.h"
#include <memory>

namespace autopoiesis {

class EnergyLedger;
class RandomContext;

struct ActionDecision {
    SelectionTier tier;
    int action_index;

    ActionDecision() : tier(SelectionTier::EXPLOITATION), action_index(0) {}
    ActionDecision(SelectionTier t, int action) : tier(t), action_index(action) {}
};

struct ActResult {
    ActionScores raw_scores;
    ActionDecision decision;
};

// Push along the axis with the larger offset toward the food. Ties go to y.
int heuristic_action(const Vec2& food_offset);

// Evaluates heuristic, exploration and exploitation in that order and returns
// the first tier that fires. Randomness is drawn only for tiers that are
// reached: the heuristic coin only when the food is in range, the
// exploration draw only when the heuristic did not fire.
ActionDecision select_action(const Observation& observation, const Eigen::VectorXf& probabilities,
                             float epsilon, const PolicyConfig& config, RandomContext& rng);

class PolicyController {
public:
    PolicyController(const PolicyConfig& config, std::unique_ptr<FunctionApproximator> approximator);

    // Scores the observation, picks an action, decays epsilon, charges the
    // acting cost, pushes the agent body and advances physics by one tick.
    ActResult act(const Observation& observation, physicslib::PhysicsWorld& world,
                  physicslib::BodyId agent_body, EnergyLedger& ledger, RandomContext& rng);

    float get_epsilon() const { return epsilon_; }
    const PolicyConfig& get_config() const { return config_; }

    FunctionApproximator& approximator() { return *approximator_; }
    const FunctionApproximator& approximator() const { return *approximator_; }

private:
    void decay_epsilon();

    PolicyConfig config_;
    std::unique_ptr<FunctionApproximator> approximator_;
    float epsilon_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_POLICY_CONTROLLER_H
