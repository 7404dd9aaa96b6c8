#include "adam_optimizer.h"
#include <cmath>

namespace autopoiesis {

AdamOptimizer::AdamOptimizer(Eigen::Index parameter_count, float learning_rate,
                             float beta1, float beta2, float epsilon)
    : learning_rate_(learning_rate), beta1_(beta1), beta2_(beta2), epsilon_(epsilon),
      first_moment_(Eigen::VectorXf::Zero(parameter_count)),
      second_moment_(Eigen::VectorXf::Zero(parameter_count)),
      step_count_(0) {}

void AdamOptimizer::step(Eigen::VectorXf& parameters, const Eigen::VectorXf& gradients) {
    step_count_++;

    first_moment_ = beta1_ * first_moment_ + (1.0f - beta1_) * gradients;
    second_moment_ = beta2_ * second_moment_ + (1.0f - beta2_) * gradients.cwiseProduct(gradients);

    float bias_correction1 = 1.0f - std::pow(beta1_, static_cast<float>(step_count_));
    float bias_correction2 = 1.0f - std::pow(beta2_, static_cast<float>(step_count_));

    Eigen::ArrayXf m_hat = first_moment_.array() / bias_correction1;
    Eigen::ArrayXf v_hat = second_moment_.array() / bias_correction2;

    parameters.array() -= learning_rate_ * m_hat / (v_hat.sqrt() + epsilon_);
}

} // namespace autopoiesis
