#ifndef AUTOPOIESIS_SIMULATION_LOOP_H
#define AUTOPOIESIS_SIMULATION_LOOP_H

#include "agent_types.h"
#include "simulation_config.h"
#include "random_context.h"
#include "energy_ledger.h"
#include "food_field.h"
#include "perception.h"
#include "policy_controller.h"
#include "reward_shaper.h"
#include "learning_gate.h"
#include "physics_world.h"
#include <memory>
#include <vector>

namespace autopoiesis {

// One episode of the agent's life. Owns the physics world, the energy ledger,
// the food field and the policy. Ticks advance until the energy is depleted
// (DEAD) or max_steps ticks have run (COMPLETED). A finished loop cannot be
// restarted; build a new instance for another episode.
class SimulationLoop {
public:
    // Throws std::invalid_argument for an invalid config and
    // std::runtime_error if the physics world is missing or not connected or
    // the agent body cannot be created. A null approximator selects the
    // default policy network sized from config.policy.
    SimulationLoop(const SimulationConfig& config, std::unique_ptr<physicslib::PhysicsWorld> world,
                   std::unique_ptr<FunctionApproximator> approximator = nullptr);

    // Runs one tick. Throws std::logic_error once the episode has ended.
    EpisodeState step();
    // Ticks until the episode ends.
    EpisodeOutcome run();

    bool is_terminal() const { return state_ != EpisodeState::ALIVE; }
    EpisodeState get_state() const { return state_; }
    EpisodeOutcome get_outcome() const;
    SurvivalStats get_stats() const { return compute_survival_stats(history_); }

    const std::vector<HistoryRecord>& get_history() const { return history_; }
    const AgentState& get_agent_state() const { return agent_state_; }
    const EnergyLedger& get_ledger() const { return ledger_; }
    const FoodField& get_food_field() const { return food_field_; }
    const PolicyController& get_controller() const { return controller_; }
    const SimulationConfig& get_config() const { return config_; }
    LearnOutcome get_last_learn_outcome() const { return last_learn_outcome_; }

    physicslib::PhysicsWorld& world() { return *world_; }
    physicslib::BodyId get_agent_body() const { return agent_body_; }

private:
    void sync_agent_state();
    void log_progress() const;

    SimulationConfig config_;
    std::unique_ptr<physicslib::PhysicsWorld> world_;
    RandomContext rng_;
    EnergyLedger ledger_;
    physicslib::BodyId agent_body_;
    FoodField food_field_;
    Perception perception_;
    PolicyController controller_;
    RewardShaper reward_shaper_;
    LearningGate learning_gate_;

    EpisodeState state_;
    AgentState agent_state_;
    std::vector<HistoryRecord> history_;
    LearnOutcome last_learn_outcome_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_SIMULATION_LOOP_H
