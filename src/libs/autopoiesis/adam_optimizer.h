#ifndef AUTOPOIESIS_ADAM_OPTIMIZER_H
#define AUTOPOIESIS_ADAM_OPTIMIZER_H

#include <Eigen/Dense>
#include <cstdint>

namespace autopoiesis {

// Adam over a flat parameter vector with bias-corrected moment estimates.
class AdamOptimizer {
public:
    AdamOptimizer(Eigen::Index parameter_count, float learning_rate,
                  float beta1 = 0.9f, float beta2 = 0.999f, float epsilon = 1e-8f);

    void step(Eigen::VectorXf& parameters, const Eigen::VectorXf& gradients);

    uint32_t get_step_count() const { return step_count_; }
    float get_learning_rate() const { return learning_rate_; }

private:
    float learning_rate_;
    float beta1_;
    float beta2_;
    float epsilon_;
    Eigen::VectorXf first_moment_;
    Eigen::VectorXf second_moment_;
    uint32_t step_count_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_ADAM_OPTIMIZER_H
