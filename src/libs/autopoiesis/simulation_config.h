#ifndef AUTOPOIESIS_SIMULATION_CONFIG_H
#define AUTOPOIESIS_SIMULATION_CONFIG_H

#include "agent_types.h"
#include "point_mass_world.h"
#include <cstdint>
#include <string>

namespace autopoiesis {

struct EnergyConfig {
    float initial_energy;
    float max_energy;
    float ambient_decay;
    float sensing_cost;
    float acting_cost;
    float learning_cost;
    float learning_threshold;

    EnergyConfig() : initial_energy(100.0f), max_energy(150.0f), ambient_decay(0.1f),
                     sensing_cost(0.02f), acting_cost(0.03f), learning_cost(0.05f),
                     learning_threshold(50.0f) {}
};

struct FoodConfig {
    uint32_t food_count;
    float consumption_radius;
    float energy_gain_min;
    float energy_gain_max;
    float spawn_min;
    float spawn_max;
    float food_radius;
    float food_mass;

    FoodConfig() : food_count(16), consumption_radius(0.8f), energy_gain_min(15.0f),
                   energy_gain_max(25.0f), spawn_min(-5.0f), spawn_max(5.0f),
                   food_radius(0.2f), food_mass(0.1f) {}
};

struct PolicyConfig {
    float epsilon_initial;
    float epsilon_decay;
    float epsilon_min;
    float heuristic_radius;
    float heuristic_probability;
    float force_magnitude;
    uint32_t hidden1_size;
    uint32_t hidden2_size;
    float learning_rate;
    float output_bias;

    PolicyConfig() : epsilon_initial(0.5f), epsilon_decay(0.998f), epsilon_min(0.1f),
                     heuristic_radius(4.0f), heuristic_probability(0.5f),
                     force_magnitude(40.0f), hidden1_size(32), hidden2_size(16),
                     learning_rate(0.001f), output_bias(0.1f) {}
};

struct RewardConfig {
    float food_reward;
    float max_distance;
    float shaping_scale;
    float existence_penalty;

    RewardConfig() : food_reward(50.0f), max_distance(12.0f), shaping_scale(1.0f),
                     existence_penalty(0.005f) {}
};

struct AgentBodyConfig {
    float radius;
    float mass;
    Vec2 start_position;

    AgentBodyConfig() : radius(0.3f), mass(1.0f), start_position(0.0f, 0.0f) {}
};

struct SimulationConfig {
    EnergyConfig energy;
    FoodConfig food;
    PolicyConfig policy;
    RewardConfig reward;
    AgentBodyConfig body;
    physicslib::PhysicsConfig physics;
    uint32_t max_steps;
    uint32_t seed;
    uint32_t progress_interval;

    SimulationConfig() : max_steps(2000), seed(12345), progress_interval(100) {}
};

// Throws std::invalid_argument naming the first offending parameter.
void validate_config(const SimulationConfig& config);

// Sets one parameter from its textual form, e.g. ("energy.ambient_decay", "0.05").
// Throws std::invalid_argument for unknown keys or unparsable values.
void apply_config_value(SimulationConfig& config, const std::string& key, const std::string& value);

// Loads "key = value" lines onto config. '#' starts a comment.
// Returns false if the file cannot be opened; malformed lines throw.
bool load_config_file(const std::string& filename, SimulationConfig& config);
bool save_config_file(const std::string& filename, const SimulationConfig& config);

// Energy-constraint presets: "abundant", "moderate", "scarce", "extreme".
void apply_scenario_preset(SimulationConfig& config, const std::string& scenario);

} // namespace autopoiesis

#endif // AUTOPOIESIS_SIMULATION_CONFIG_H
