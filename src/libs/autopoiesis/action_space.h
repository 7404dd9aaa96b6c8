#ifndef AUTOPOIESIS_ACTION_SPACE_H
#define AUTOPOIESIS_ACTION_SPACE_H

#include "agent_types.h"
#include <Eigen/Dense>

namespace autopoiesis {

constexpr int NUM_ACTIONS = 4;

// Action indices: one fixed-magnitude push per axis direction
constexpr int ACTION_POSITIVE_X = 0;
constexpr int ACTION_NEGATIVE_X = 1;
constexpr int ACTION_POSITIVE_Y = 2;
constexpr int ACTION_NEGATIVE_Y = 3;

using ActionScores = Eigen::VectorXf;

Vec2 action_force(int action_index, float magnitude);

// Numerically stable softmax over raw action scores.
Eigen::VectorXf softmax(const ActionScores& scores);

} // namespace autopoiesis

#endif // AUTOPOIESIS_ACTION_SPACE_H
