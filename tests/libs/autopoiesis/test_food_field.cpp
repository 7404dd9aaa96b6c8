#include <gtest/gtest.h>
#include "food_field.h"
#include "energy_ledger.h"
#include "random_context.h"
#include "point_mass_world.h"
#include <memory>

using namespace autopoiesis;

class FoodFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        food_config_.food_count = 4;
        food_config_.consumption_radius = 0.8f;
        food_config_.energy_gain_min = 15.0f;
        food_config_.energy_gain_max = 25.0f;
        food_config_.spawn_min = -5.0f;
        food_config_.spawn_max = 5.0f;

        energy_config_.initial_energy = 100.0f;
        energy_config_.max_energy = 150.0f;

        world_ = std::make_unique<physicslib::PointMassWorld>(physicslib::PhysicsConfig());
        rng_ = std::make_unique<RandomContext>(42);
    }

    void move_all(FoodField& field, const Vec2& position) {
        for (const auto& item : field.get_items()) {
            world_->reset_body_position(item.body_id, position);
        }
    }

    FoodConfig food_config_;
    EnergyConfig energy_config_;
    std::unique_ptr<physicslib::PointMassWorld> world_;
    std::unique_ptr<RandomContext> rng_;
};

TEST_F(FoodFieldTest, SpawnsAllItemsWithinBounds) {
    FoodField field(food_config_, *world_, *rng_);

    ASSERT_EQ(field.get_items().size(), 4u);
    for (const auto& item : field.get_items()) {
        auto position = field.resolve_position(*world_, item);
        ASSERT_TRUE(position.has_value());
        EXPECT_GE(position->x, -5.0f);
        EXPECT_LE(position->x, 5.0f);
        EXPECT_GE(position->y, -5.0f);
        EXPECT_LE(position->y, 5.0f);
    }
}

TEST_F(FoodFieldTest, ConsumesFoodAtAgentPosition) {
    FoodField field(food_config_, *world_, *rng_);
    EnergyLedger ledger(energy_config_);
    move_all(field, Vec2(100.0f, 100.0f));
    world_->reset_body_position(field.get_items()[0].body_id, Vec2(0.0f, 0.0f));

    ConsumptionResult result = field.check_consumption(*world_, Vec2(0.0f, 0.0f), ledger, *rng_);

    EXPECT_TRUE(result.consumed);
    EXPECT_EQ(result.food_id, 0u);
    EXPECT_GE(result.energy_gain, 15.0f);
    EXPECT_LE(result.energy_gain, 25.0f);
    EXPECT_FLOAT_EQ(ledger.get_energy(), 100.0f + result.energy_gain);

    auto relocated = field.resolve_position(*world_, field.get_items()[0]);
    ASSERT_TRUE(relocated.has_value());
    EXPECT_EQ(relocated->x, result.new_position.x);
    EXPECT_EQ(relocated->y, result.new_position.y);
    EXPECT_GE(relocated->x, -5.0f);
    EXPECT_LE(relocated->x, 5.0f);
    EXPECT_GE(relocated->y, -5.0f);
    EXPECT_LE(relocated->y, 5.0f);
    EXPECT_EQ(field.get_items().size(), 4u);
}

TEST_F(FoodFieldTest, NothingInRange) {
    FoodField field(food_config_, *world_, *rng_);
    EnergyLedger ledger(energy_config_);
    move_all(field, Vec2(100.0f, 100.0f));

    ConsumptionResult result = field.check_consumption(*world_, Vec2(0.0f, 0.0f), ledger, *rng_);

    EXPECT_FALSE(result.consumed);
    EXPECT_FLOAT_EQ(ledger.get_energy(), 100.0f);
}

TEST_F(FoodFieldTest, RadiusIsExclusive) {
    food_config_.consumption_radius = 1.0f;
    FoodField field(food_config_, *world_, *rng_);
    EnergyLedger ledger(energy_config_);
    move_all(field, Vec2(100.0f, 100.0f));
    world_->reset_body_position(field.get_items()[0].body_id, Vec2(1.0f, 0.0f));

    ConsumptionResult result = field.check_consumption(*world_, Vec2(0.0f, 0.0f), ledger, *rng_);

    EXPECT_FALSE(result.consumed);
}

TEST_F(FoodFieldTest, AtMostOneConsumptionPerCall) {
    FoodField field(food_config_, *world_, *rng_);
    EnergyLedger ledger(energy_config_);
    move_all(field, Vec2(0.0f, 0.0f));

    ConsumptionResult result = field.check_consumption(*world_, Vec2(0.0f, 0.0f), ledger, *rng_);

    EXPECT_TRUE(result.consumed);
    EXPECT_EQ(result.food_id, 0u);
    EXPECT_FLOAT_EQ(ledger.get_energy(), 100.0f + result.energy_gain);

    // The rest stay where they were
    for (size_t i = 1; i < field.get_items().size(); ++i) {
        auto position = field.resolve_position(*world_, field.get_items()[i]);
        ASSERT_TRUE(position.has_value());
        EXPECT_EQ(position->x, 0.0f);
        EXPECT_EQ(position->y, 0.0f);
    }
}

TEST_F(FoodFieldTest, EnergyGainClampedToMax) {
    energy_config_.initial_energy = 145.0f;
    FoodField field(food_config_, *world_, *rng_);
    EnergyLedger ledger(energy_config_);
    move_all(field, Vec2(0.0f, 0.0f));

    ConsumptionResult result = field.check_consumption(*world_, Vec2(0.0f, 0.0f), ledger, *rng_);

    EXPECT_TRUE(result.consumed);
    EXPECT_FLOAT_EQ(ledger.get_energy(), 150.0f);
}

TEST_F(FoodFieldTest, UnresolvableItemIsSkipped) {
    FoodField field(food_config_, *world_, *rng_);
    EnergyLedger ledger(energy_config_);
    move_all(field, Vec2(100.0f, 100.0f));
    world_->reset_body_position(field.get_items()[0].body_id, Vec2(0.0f, 0.0f));
    world_->reset_body_position(field.get_items()[1].body_id, Vec2(0.0f, 0.0f));
    world_->remove_body(field.get_items()[0].body_id);

    EXPECT_FALSE(field.resolve_position(*world_, field.get_items()[0]).has_value());

    ConsumptionResult result = field.check_consumption(*world_, Vec2(0.0f, 0.0f), ledger, *rng_);

    EXPECT_TRUE(result.consumed);
    EXPECT_EQ(result.food_id, 1u);
}

TEST_F(FoodFieldTest, LargeFieldKeepsEveryItem) {
    food_config_.food_count = 2000;
    FoodField field(food_config_, *world_, *rng_);

    EXPECT_EQ(field.get_items().size(), 2000u);
    EXPECT_EQ(field.get_items().back().food_id, 1999u);
}
