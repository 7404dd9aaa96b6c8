#include <gtest/gtest.h>
#include "policy_controller.h"
#include "energy_ledger.h"
#include "random_context.h"
#include "point_mass_world.h"
#include <memory>
#include <stdexcept>

using namespace autopoiesis;

namespace {

// Returns the same scores for every observation and counts updates.
class FixedScores : public FunctionApproximator {
public:
    explicit FixedScores(const ActionScores& scores) : scores_(scores), updates_(0) {}

    ActionScores forward(const Observation&) const override { return scores_; }
    void gradient_step(const Observation&, const ActionScores&) override { updates_++; }
    Eigen::VectorXf get_parameters() const override { return scores_; }

    int get_updates() const { return updates_; }

private:
    ActionScores scores_;
    int updates_;
};

ActionScores scores(float a, float b, float c, float d) {
    ActionScores s(NUM_ACTIONS);
    s << a, b, c, d;
    return s;
}

Observation observation_at(const Vec2& food_offset, float distance) {
    return Observation(Vec2(0.0f, 0.0f), Vec2(0.0f, 0.0f), food_offset, distance, 0.5f);
}

} // namespace

class PolicyControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_config_.epsilon_initial = 0.5f;
        policy_config_.epsilon_decay = 0.998f;
        policy_config_.epsilon_min = 0.1f;
        policy_config_.heuristic_radius = 4.0f;
        policy_config_.heuristic_probability = 0.5f;
        policy_config_.force_magnitude = 40.0f;

        energy_config_.initial_energy = 100.0f;
        energy_config_.acting_cost = 0.03f;

        world_ = std::make_unique<physicslib::PointMassWorld>(physicslib::PhysicsConfig());
        agent_ = world_->create_body(physicslib::BodyDef(0.3f, 1.0f, Vec2()));
        rng_ = std::make_unique<RandomContext>(1234);
    }

    PolicyConfig policy_config_;
    EnergyConfig energy_config_;
    std::unique_ptr<physicslib::PointMassWorld> world_;
    physicslib::BodyId agent_;
    std::unique_ptr<RandomContext> rng_;
};

TEST_F(PolicyControllerTest, HeuristicFollowsLargerOffset) {
    EXPECT_EQ(heuristic_action(Vec2(3.0f, 1.0f)), ACTION_POSITIVE_X);
    EXPECT_EQ(heuristic_action(Vec2(-3.0f, 1.0f)), ACTION_NEGATIVE_X);
    EXPECT_EQ(heuristic_action(Vec2(1.0f, 3.0f)), ACTION_POSITIVE_Y);
    EXPECT_EQ(heuristic_action(Vec2(1.0f, -3.0f)), ACTION_NEGATIVE_Y);
    EXPECT_EQ(heuristic_action(Vec2(2.0f, -2.0f)), ACTION_NEGATIVE_Y);
}

TEST_F(PolicyControllerTest, FarFoodWithoutExplorationAlwaysExploits) {
    Eigen::VectorXf probabilities = softmax(scores(0.1f, 0.2f, 0.9f, 0.3f));
    Observation obs = observation_at(Vec2(5.0f, 0.0f), 5.0f);

    for (int i = 0; i < 200; ++i) {
        ActionDecision decision = select_action(obs, probabilities, 0.0f, policy_config_, *rng_);
        EXPECT_EQ(decision.tier, SelectionTier::EXPLOITATION);
        EXPECT_EQ(decision.action_index, 2);
    }
}

TEST_F(PolicyControllerTest, HeuristicFiresInsideRadius) {
    policy_config_.heuristic_probability = 1.0f;
    Eigen::VectorXf probabilities = softmax(scores(1.0f, 0.0f, 0.0f, 0.0f));
    Observation obs = observation_at(Vec2(0.5f, -2.0f), 2.06f);

    ActionDecision decision = select_action(obs, probabilities, 1.0f, policy_config_, *rng_);

    EXPECT_EQ(decision.tier, SelectionTier::HEURISTIC);
    EXPECT_EQ(decision.action_index, ACTION_NEGATIVE_Y);
}

TEST_F(PolicyControllerTest, HeuristicRadiusIsExclusive) {
    policy_config_.heuristic_probability = 1.0f;
    Eigen::VectorXf probabilities = softmax(scores(1.0f, 0.0f, 0.0f, 0.0f));
    Observation obs = observation_at(Vec2(4.0f, 0.0f), 4.0f);

    ActionDecision decision = select_action(obs, probabilities, 0.0f, policy_config_, *rng_);

    EXPECT_EQ(decision.tier, SelectionTier::EXPLOITATION);
    EXPECT_EQ(decision.action_index, 0);
}

TEST_F(PolicyControllerTest, ExplorationWhenHeuristicDoesNotFire) {
    policy_config_.heuristic_probability = 0.0f;
    Eigen::VectorXf probabilities = softmax(scores(1.0f, 0.0f, 0.0f, 0.0f));
    Observation obs = observation_at(Vec2(1.0f, 0.0f), 1.0f);

    for (int i = 0; i < 50; ++i) {
        ActionDecision decision = select_action(obs, probabilities, 1.0f, policy_config_, *rng_);
        EXPECT_EQ(decision.tier, SelectionTier::EXPLORATION);
        EXPECT_GE(decision.action_index, 0);
        EXPECT_LT(decision.action_index, NUM_ACTIONS);
    }
}

TEST_F(PolicyControllerTest, ArgmaxTieGoesToFirstAction) {
    Eigen::VectorXf probabilities = softmax(scores(0.0f, 0.7f, 0.7f, 0.1f));
    Observation obs = observation_at(Vec2(9.0f, 0.0f), 9.0f);

    ActionDecision decision = select_action(obs, probabilities, 0.0f, policy_config_, *rng_);

    EXPECT_EQ(decision.action_index, 1);
}

TEST_F(PolicyControllerTest, RequiresApproximator) {
    EXPECT_THROW(PolicyController(policy_config_, nullptr), std::invalid_argument);
}

TEST_F(PolicyControllerTest, ActChargesCostAndStepsPhysics) {
    policy_config_.epsilon_initial = 0.0f;
    policy_config_.epsilon_min = 0.0f;
    PolicyController controller(policy_config_, std::make_unique<FixedScores>(scores(2.0f, 0.0f, 0.0f, 0.0f)));
    EnergyLedger ledger(energy_config_);

    ActResult result = controller.act(observation_at(Vec2(10.0f, 0.0f), 10.0f), *world_, agent_, ledger, *rng_);

    EXPECT_EQ(result.decision.tier, SelectionTier::EXPLOITATION);
    EXPECT_EQ(result.decision.action_index, ACTION_POSITIVE_X);
    EXPECT_FLOAT_EQ(result.raw_scores(0), 2.0f);
    EXPECT_FLOAT_EQ(ledger.get_energy(), 100.0f - 0.03f);
    EXPECT_EQ(world_->get_current_tick(), 1u);

    auto state = world_->get_body_state(agent_);
    ASSERT_TRUE(state.has_value());
    EXPECT_GT(state->velocity.x, 0.0f);
    EXPECT_FLOAT_EQ(state->velocity.y, 0.0f);
}

TEST_F(PolicyControllerTest, EpsilonDecaysEveryCall) {
    PolicyController controller(policy_config_, std::make_unique<FixedScores>(scores(0.0f, 0.0f, 0.0f, 0.0f)));
    EnergyLedger ledger(energy_config_);

    EXPECT_FLOAT_EQ(controller.get_epsilon(), 0.5f);
    controller.act(observation_at(Vec2(10.0f, 0.0f), 10.0f), *world_, agent_, ledger, *rng_);
    EXPECT_FLOAT_EQ(controller.get_epsilon(), 0.5f * 0.998f);
}

TEST_F(PolicyControllerTest, EpsilonNonIncreasingAndFloored) {
    policy_config_.epsilon_decay = 0.9f;
    PolicyController controller(policy_config_, std::make_unique<FixedScores>(scores(0.0f, 0.0f, 0.0f, 0.0f)));
    EnergyLedger ledger(energy_config_);

    float previous = controller.get_epsilon();
    for (int i = 0; i < 100; ++i) {
        controller.act(observation_at(Vec2(1.0f, 1.0f), 1.5f), *world_, agent_, ledger, *rng_);
        EXPECT_LE(controller.get_epsilon(), previous);
        EXPECT_GE(controller.get_epsilon(), policy_config_.epsilon_min);
        previous = controller.get_epsilon();
    }
    EXPECT_FLOAT_EQ(controller.get_epsilon(), policy_config_.epsilon_min);
}
