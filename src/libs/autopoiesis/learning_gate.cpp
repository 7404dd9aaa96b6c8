#include "learning_gate.h"
#include "energy_ledger.h"
#include <spdlog/spdlog.h>

namespace autopoiesis {

namespace {
constexpr float LOG_EPSILON = 1e-8f;
}

ActionScores policy_gradient(const ActionScores& raw_scores, int action_index, float reward) {
    Eigen::VectorXf p = softmax(raw_scores);
    float p_a = p(action_index);

    // dL/ds_j = -reward / (p_a + eps) * p_a * (delta_aj - p_j)
    Eigen::VectorXf one_hot = Eigen::VectorXf::Zero(raw_scores.size());
    one_hot(action_index) = 1.0f;
    float scale = -reward * p_a / (p_a + LOG_EPSILON);
    return scale * (one_hot - p);
}

bool LearningGate::can_learn(const EnergyLedger& ledger) const {
    return ledger.get_energy() > config_.learning_threshold;
}

LearnOutcome LearningGate::maybe_update(const Observation& observation, const ActionScores& raw_scores,
                                        int action_index, float reward,
                                        EnergyLedger& ledger, FunctionApproximator& approximator) const {
    if (!can_learn(ledger)) {
        return LearnOutcome::SKIPPED;
    }

    ledger.deduct(config_.learning_cost);
    approximator.gradient_step(observation, policy_gradient(raw_scores, action_index, reward));

    SPDLOG_DEBUG("Policy update: action {}, reward {:.3f}, energy {:.2f}",
                 action_index, reward, ledger.get_energy());

    return LearnOutcome::UPDATED;
}

} // namespace autopoiesis
