#include "policy_network.h"
#include "random_context.h"
#include <cmath>
#include <spdlog/spdlog.h>

namespace autopoiesis {

namespace {

Eigen::Index total_parameters(int input_dim, int hidden1, int hidden2, int output_dim) {
    return static_cast<Eigen::Index>(hidden1) * input_dim + hidden1 +
           static_cast<Eigen::Index>(hidden2) * hidden1 + hidden2 +
           static_cast<Eigen::Index>(output_dim) * hidden2 + output_dim;
}

// Uniform in [-1/sqrt(fan_in), 1/sqrt(fan_in)] for both weights and biases.
void init_layer(Eigen::MatrixXf& weights, Eigen::VectorXf& bias, RandomContext& rng) {
    float bound = 1.0f / std::sqrt(static_cast<float>(weights.cols()));
    for (Eigen::Index i = 0; i < weights.rows(); ++i)
        for (Eigen::Index j = 0; j < weights.cols(); ++j)
            weights(i, j) = rng.uniform(-bound, bound);
    for (Eigen::Index i = 0; i < bias.size(); ++i)
        bias(i) = rng.uniform(-bound, bound);
}

Eigen::VectorXf relu(const Eigen::VectorXf& x) {
    return x.cwiseMax(0.0f);
}

Eigen::VectorXf relu_mask(const Eigen::VectorXf& z) {
    return (z.array() > 0.0f).cast<float>().matrix();
}

} // namespace

PolicyNetwork::PolicyNetwork(int input_dim, int hidden1, int hidden2, int output_dim,
                             float learning_rate, float output_bias, RandomContext& rng)
    : W1_(hidden1, input_dim), b1_(hidden1),
      W2_(hidden2, hidden1), b2_(hidden2),
      W3_(output_dim, hidden2), b3_(output_dim),
      optimizer_(total_parameters(input_dim, hidden1, hidden2, output_dim), learning_rate) {
    init_layer(W1_, b1_, rng);
    init_layer(W2_, b2_, rng);
    init_layer(W3_, b3_, rng);

    // Small positive push on every action so early scores favor moving at all
    b3_.array() += output_bias;

    spdlog::info("Policy network {}-{}-{}-{} created ({} parameters, lr={})",
                 input_dim, hidden1, hidden2, output_dim, parameter_count(), optimizer_.get_learning_rate());
}

PolicyNetwork::ForwardPass PolicyNetwork::run_forward(const Observation& observation) const {
    ForwardPass pass;
    pass.input = Eigen::Map<const Eigen::VectorXf>(observation.values.data(),
                                                   static_cast<Eigen::Index>(observation.values.size()));
    pass.z1 = W1_ * pass.input + b1_;
    pass.a1 = relu(pass.z1);
    pass.z2 = W2_ * pass.a1 + b2_;
    pass.a2 = relu(pass.z2);
    pass.scores = W3_ * pass.a2 + b3_;
    return pass;
}

ActionScores PolicyNetwork::forward(const Observation& observation) const {
    return run_forward(observation).scores;
}

void PolicyNetwork::gradient_step(const Observation& observation, const ActionScores& score_gradient) {
    ForwardPass pass = run_forward(observation);

    Eigen::VectorXf g3 = score_gradient;
    Eigen::MatrixXf dW3 = g3 * pass.a2.transpose();

    Eigen::VectorXf g2 = (W3_.transpose() * g3).cwiseProduct(relu_mask(pass.z2));
    Eigen::MatrixXf dW2 = g2 * pass.a1.transpose();

    Eigen::VectorXf g1 = (W2_.transpose() * g2).cwiseProduct(relu_mask(pass.z1));
    Eigen::MatrixXf dW1 = g1 * pass.input.transpose();

    Eigen::VectorXf params = get_parameters();
    Eigen::VectorXf grads = flatten_blocks(dW1, g1, dW2, g2, dW3, g3);
    optimizer_.step(params, grads);
    set_parameters(params);
}

Eigen::Index PolicyNetwork::parameter_count() const {
    return W1_.size() + b1_.size() + W2_.size() + b2_.size() + W3_.size() + b3_.size();
}

Eigen::VectorXf PolicyNetwork::get_parameters() const {
    return flatten_blocks(W1_, b1_, W2_, b2_, W3_, b3_);
}

void PolicyNetwork::set_parameters(const Eigen::VectorXf& params) {
    Eigen::Index idx = 0;
    auto read_block = [&](float* data, Eigen::Index size) {
        Eigen::Map<Eigen::VectorXf>(data, size) = params.segment(idx, size);
        idx += size;
    };

    read_block(W1_.data(), W1_.size());
    read_block(b1_.data(), b1_.size());
    read_block(W2_.data(), W2_.size());
    read_block(b2_.data(), b2_.size());
    read_block(W3_.data(), W3_.size());
    read_block(b3_.data(), b3_.size());
}

// Block order: W1, b1, W2, b2, W3, b3 (matrices column-major).
Eigen::VectorXf PolicyNetwork::flatten_blocks(const Eigen::MatrixXf& w1, const Eigen::VectorXf& b1,
                                              const Eigen::MatrixXf& w2, const Eigen::VectorXf& b2,
                                              const Eigen::MatrixXf& w3, const Eigen::VectorXf& b3) const {
    Eigen::VectorXf flat(parameter_count());
    Eigen::Index idx = 0;
    auto write_block = [&](const float* data, Eigen::Index size) {
        flat.segment(idx, size) = Eigen::Map<const Eigen::VectorXf>(data, size);
        idx += size;
    };

    write_block(w1.data(), w1.size());
    write_block(b1.data(), b1.size());
    write_block(w2.data(), w2.size());
    write_block(b2.data(), b2.size());
    write_block(w3.data(), w3.size());
    write_block(b3.data(), b3.size());
    return flat;
}

} // namespace autopoiesis
