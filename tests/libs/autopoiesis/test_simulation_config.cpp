#include <gtest/gtest.h>
#include "simulation_config.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace autopoiesis;

class SimulationConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("autopoiesis_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                  ".txt")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write_file(const std::string& contents) {
        std::ofstream file(path_);
        file << contents;
    }

    SimulationConfig config_;
    std::string path_;
};

TEST_F(SimulationConfigTest, DefaultsAreValid) {
    EXPECT_NO_THROW(validate_config(config_));
    EXPECT_FLOAT_EQ(config_.energy.initial_energy, 100.0f);
    EXPECT_FLOAT_EQ(config_.energy.max_energy, 150.0f);
    EXPECT_EQ(config_.food.food_count, 16u);
    EXPECT_FLOAT_EQ(config_.policy.epsilon_decay, 0.998f);
    EXPECT_EQ(config_.max_steps, 2000u);
}

TEST_F(SimulationConfigTest, ApplyValue) {
    apply_config_value(config_, "energy.ambient_decay", "0.05");
    apply_config_value(config_, "food.food_count", "8");
    apply_config_value(config_, "body.start_x", "-1.5");

    EXPECT_FLOAT_EQ(config_.energy.ambient_decay, 0.05f);
    EXPECT_EQ(config_.food.food_count, 8u);
    EXPECT_FLOAT_EQ(config_.body.start_position.x, -1.5f);
}

TEST_F(SimulationConfigTest, UnknownKeyRejected) {
    EXPECT_THROW(apply_config_value(config_, "energy.landauer", "1"), std::invalid_argument);
}

TEST_F(SimulationConfigTest, BadValuesRejected) {
    EXPECT_THROW(apply_config_value(config_, "energy.ambient_decay", "fast"), std::invalid_argument);
    EXPECT_THROW(apply_config_value(config_, "energy.ambient_decay", "0.1x"), std::invalid_argument);
    EXPECT_THROW(apply_config_value(config_, "max_steps", "-5"), std::invalid_argument);
    EXPECT_THROW(apply_config_value(config_, "seed", "1.5"), std::invalid_argument);
}

TEST_F(SimulationConfigTest, ValidationNamesParameter) {
    config_.policy.epsilon_min = 0.9f;
    try {
        validate_config(config_);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("policy.epsilon_min"), std::string::npos);
    }
}

TEST_F(SimulationConfigTest, ValidationRejectsBadRanges) {
    SimulationConfig bad = config_;
    bad.energy.initial_energy = 200.0f;
    EXPECT_THROW(validate_config(bad), std::invalid_argument);

    bad = config_;
    bad.food.energy_gain_min = 30.0f;
    EXPECT_THROW(validate_config(bad), std::invalid_argument);

    bad = config_;
    bad.reward.max_distance = 0.0f;
    EXPECT_THROW(validate_config(bad), std::invalid_argument);

    bad = config_;
    bad.physics.linear_damping = 1.0f;
    EXPECT_THROW(validate_config(bad), std::invalid_argument);
}

TEST_F(SimulationConfigTest, NonFiniteRewardTermsRejected) {
    const char* keys[] = {"reward.shaping_scale", "reward.existence_penalty",
                          "reward.food_reward", "policy.output_bias"};
    for (const char* key : keys) {
        SimulationConfig bad = config_;
        apply_config_value(bad, key, "nan");
        EXPECT_THROW(validate_config(bad), std::invalid_argument) << key;

        bad = config_;
        apply_config_value(bad, key, "inf");
        EXPECT_THROW(validate_config(bad), std::invalid_argument) << key;
    }
}

TEST_F(SimulationConfigTest, ScenarioPresets) {
    apply_scenario_preset(config_, "abundant");
    EXPECT_FLOAT_EQ(config_.energy.ambient_decay, 0.05f);
    EXPECT_FLOAT_EQ(config_.energy.learning_threshold, 30.0f);

    apply_scenario_preset(config_, "extreme");
    EXPECT_FLOAT_EQ(config_.energy.ambient_decay, 0.2f);
    EXPECT_FLOAT_EQ(config_.energy.learning_threshold, 80.0f);

    EXPECT_THROW(apply_scenario_preset(config_, "apocalyptic"), std::invalid_argument);
}

TEST_F(SimulationConfigTest, LoadFile) {
    write_file("# scarce run\n"
               "energy.ambient_decay = 0.15\n"
               "\n"
               "energy.learning_threshold=70   # gate\n"
               "max_steps = 500\n");

    ASSERT_TRUE(load_config_file(path_, config_));

    EXPECT_FLOAT_EQ(config_.energy.ambient_decay, 0.15f);
    EXPECT_FLOAT_EQ(config_.energy.learning_threshold, 70.0f);
    EXPECT_EQ(config_.max_steps, 500u);
    EXPECT_FLOAT_EQ(config_.energy.max_energy, 150.0f);
}

TEST_F(SimulationConfigTest, MalformedLineThrows) {
    write_file("energy.ambient_decay 0.15\n");

    EXPECT_THROW(load_config_file(path_, config_), std::invalid_argument);
}

TEST_F(SimulationConfigTest, MissingFileReturnsFalse) {
    EXPECT_FALSE(load_config_file(path_ + ".missing", config_));
}

TEST_F(SimulationConfigTest, SavedConfigLoadsBack) {
    config_.energy.ambient_decay = 0.123f;
    config_.policy.hidden1_size = 24;
    config_.seed = 777;
    ASSERT_TRUE(save_config_file(path_, config_));

    SimulationConfig loaded;
    ASSERT_TRUE(load_config_file(path_, loaded));

    EXPECT_EQ(loaded.energy.ambient_decay, 0.123f);
    EXPECT_EQ(loaded.policy.hidden1_size, 24u);
    EXPECT_EQ(loaded.seed, 777u);
}
