#ifndef AUTOPOIESIS_LEARNING_GATE_H
#define AUTOPOIESIS_LEARNING_GATE_H

#include "agent_types.h"
#include "action_space.h"
#include "function_approximator.h"
#include "simulation_config.h"

namespace autopoiesis {

class EnergyLedger;

enum class LearnOutcome {
    SKIPPED,
    UPDATED
};

// Gradient of L = -log(p_a + 1e-8) * reward with respect to the raw scores,
// p = softmax(raw_scores).
ActionScores policy_gradient(const ActionScores& raw_scores, int action_index, float reward);

class LearningGate {
public:
    explicit LearningGate(const EnergyConfig& config) : config_(config) {}

    bool can_learn(const EnergyLedger& ledger) const;

    // Below the threshold nothing happens: no charge, no parameter change.
    // Otherwise the learning cost is charged and one gradient step is taken.
    LearnOutcome maybe_update(const Observation& observation, const ActionScores& raw_scores,
                              int action_index, float reward,
                              EnergyLedger& ledger, FunctionApproximator& approximator) const;

private:
    EnergyConfig config_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_LEARNING_GATE_H
