#ifndef AUTOPOIESIS_POLICY_NETWORK_H
#define AUTOPOIESIS_POLICY_NETWORK_H

#include "function_approximator.h"
#include "adam_optimizer.h"
#include <Eigen/Dense>

namespace autopoiesis {

class RandomContext;

// Two hidden ReLU layers with a linear output layer, trained with Adam.
class PolicyNetwork : public FunctionApproximator {
public:
    PolicyNetwork(int input_dim, int hidden1, int hidden2, int output_dim,
                  float learning_rate, float output_bias, RandomContext& rng);

    ActionScores forward(const Observation& observation) const override;
    void gradient_step(const Observation& observation, const ActionScores& score_gradient) override;

    Eigen::VectorXf get_parameters() const override;
    void set_parameters(const Eigen::VectorXf& params);
    Eigen::Index parameter_count() const;

    uint32_t get_update_count() const { return optimizer_.get_step_count(); }

private:
    struct ForwardPass {
        Eigen::VectorXf input;
        Eigen::VectorXf z1, a1;
        Eigen::VectorXf z2, a2;
        Eigen::VectorXf scores;
    };

    ForwardPass run_forward(const Observation& observation) const;
    Eigen::VectorXf flatten_blocks(const Eigen::MatrixXf& w1, const Eigen::VectorXf& b1,
                                   const Eigen::MatrixXf& w2, const Eigen::VectorXf& b2,
                                   const Eigen::MatrixXf& w3, const Eigen::VectorXf& b3) const;

    Eigen::MatrixXf W1_;
    Eigen::VectorXf b1_;
    Eigen::MatrixXf W2_;
    Eigen::VectorXf b2_;
    Eigen::MatrixXf W3_;
    Eigen::VectorXf b3_;

    AdamOptimizer optimizer_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_POLICY_NETWORK_H
