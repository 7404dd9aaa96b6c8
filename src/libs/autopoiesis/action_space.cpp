#include "action_space.h"

namespace autopoiesis {

Vec2 action_force(int action_index, float magnitude) {
    switch (action_index) {
        case ACTION_POSITIVE_X: return Vec2(magnitude, 0.0f);
        case ACTION_NEGATIVE_X: return Vec2(-magnitude, 0.0f);
        case ACTION_POSITIVE_Y: return Vec2(0.0f, magnitude);
        case ACTION_NEGATIVE_Y: return Vec2(0.0f, -magnitude);
    }
    return Vec2(0.0f, 0.0f);
}

Eigen::VectorXf softmax(const ActionScores& scores) {
    Eigen::VectorXf exps = (scores.array() - scores.maxCoeff()).exp().matrix();
    return exps / exps.sum();
}

} // namespace autopoiesis
