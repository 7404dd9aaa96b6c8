#ifndef AUTOPOIESIS_FUNCTION_APPROXIMATOR_H
#define AUTOPOIESIS_FUNCTION_APPROXIMATOR_H

#include "action_space.h"
#include "agent_types.h"
#include <Eigen/Dense>

namespace autopoiesis {

// Trainable mapping from an observation to one raw score per action.
class FunctionApproximator {
public:
    virtual ~FunctionApproximator() = default;

    virtual ActionScores forward(const Observation& observation) const = 0;

    // One optimizer step for a loss whose gradient with respect to
    // forward(observation) is score_gradient.
    virtual void gradient_step(const Observation& observation, const ActionScores& score_gradient) = 0;

    // Flattened copy of all trainable parameters.
    virtual Eigen::VectorXf get_parameters() const = 0;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_FUNCTION_APPROXIMATOR_H
