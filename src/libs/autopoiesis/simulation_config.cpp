#include "simulation_config.h"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>

namespace autopoiesis {

namespace {

struct ConfigField {
    const char* key;
    std::variant<float*, uint32_t*> target;
};

// Every tunable parameter, in file order.
std::vector<ConfigField> config_fields(SimulationConfig& config) {
    return {
        {"energy.initial_energy", &config.energy.initial_energy},
        {"energy.max_energy", &config.energy.max_energy},
        {"energy.ambient_decay", &config.energy.ambient_decay},
        {"energy.sensing_cost", &config.energy.sensing_cost},
        {"energy.acting_cost", &config.energy.acting_cost},
        {"energy.learning_cost", &config.energy.learning_cost},
        {"energy.learning_threshold", &config.energy.learning_threshold},
        {"food.food_count", &config.food.food_count},
        {"food.consumption_radius", &config.food.consumption_radius},
        {"food.energy_gain_min", &config.food.energy_gain_min},
        {"food.energy_gain_max", &config.food.energy_gain_max},
        {"food.spawn_min", &config.food.spawn_min},
        {"food.spawn_max", &config.food.spawn_max},
        {"food.food_radius", &config.food.food_radius},
        {"food.food_mass", &config.food.food_mass},
        {"policy.epsilon_initial", &config.policy.epsilon_initial},
        {"policy.epsilon_decay", &config.policy.epsilon_decay},
        {"policy.epsilon_min", &config.policy.epsilon_min},
        {"policy.heuristic_radius", &config.policy.heuristic_radius},
        {"policy.heuristic_probability", &config.policy.heuristic_probability},
        {"policy.force_magnitude", &config.policy.force_magnitude},
        {"policy.hidden1_size", &config.policy.hidden1_size},
        {"policy.hidden2_size", &config.policy.hidden2_size},
        {"policy.learning_rate", &config.policy.learning_rate},
        {"policy.output_bias", &config.policy.output_bias},
        {"reward.food_reward", &config.reward.food_reward},
        {"reward.max_distance", &config.reward.max_distance},
        {"reward.shaping_scale", &config.reward.shaping_scale},
        {"reward.existence_penalty", &config.reward.existence_penalty},
        {"body.radius", &config.body.radius},
        {"body.mass", &config.body.mass},
        {"body.start_x", &config.body.start_position.x},
        {"body.start_y", &config.body.start_position.y},
        {"physics.time_step", &config.physics.time_step},
        {"physics.linear_damping", &config.physics.linear_damping},
        {"max_steps", &config.max_steps},
        {"seed", &config.seed},
        {"progress_interval", &config.progress_interval},
    };
}

float parse_float(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    float result = 0.0f;
    try {
        result = std::stof(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    return result;
}

uint32_t parse_unsigned(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    unsigned long result = 0;
    try {
        if (!value.empty() && value[0] == '-') {
            throw std::invalid_argument("negative");
        }
        result = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (consumed != value.size() || result > UINT32_MAX) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    return static_cast<uint32_t>(result);
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // namespace

void validate_config(const SimulationConfig& config) {
    const EnergyConfig& energy = config.energy;
    require(energy.max_energy > 0.0f, "energy.max_energy must be greater than 0");
    require(energy.initial_energy > 0.0f && energy.initial_energy <= energy.max_energy,
            "energy.initial_energy must be in (0, energy.max_energy]");
    require(energy.ambient_decay >= 0.0f, "energy.ambient_decay must not be negative");
    require(energy.sensing_cost >= 0.0f, "energy.sensing_cost must not be negative");
    require(energy.acting_cost >= 0.0f, "energy.acting_cost must not be negative");
    require(energy.learning_cost >= 0.0f, "energy.learning_cost must not be negative");
    require(energy.learning_threshold >= 0.0f, "energy.learning_threshold must not be negative");

    const FoodConfig& food = config.food;
    require(food.food_count > 0, "food.food_count must be greater than 0");
    require(food.consumption_radius > 0.0f, "food.consumption_radius must be greater than 0");
    require(food.energy_gain_min >= 0.0f && food.energy_gain_min <= food.energy_gain_max,
            "food.energy_gain_min must be in [0, food.energy_gain_max]");
    require(food.spawn_min <= food.spawn_max, "food.spawn_min must not exceed food.spawn_max");
    require(food.food_radius > 0.0f, "food.food_radius must be greater than 0");
    require(food.food_mass > 0.0f, "food.food_mass must be greater than 0");

    const PolicyConfig& policy = config.policy;
    require(policy.epsilon_initial >= 0.0f && policy.epsilon_initial <= 1.0f,
            "policy.epsilon_initial must be between 0.0 and 1.0");
    require(policy.epsilon_min >= 0.0f && policy.epsilon_min <= policy.epsilon_initial,
            "policy.epsilon_min must be in [0, policy.epsilon_initial]");
    require(policy.epsilon_decay > 0.0f && policy.epsilon_decay <= 1.0f,
            "policy.epsilon_decay must be in (0, 1]");
    require(policy.heuristic_radius >= 0.0f, "policy.heuristic_radius must not be negative");
    require(policy.heuristic_probability >= 0.0f && policy.heuristic_probability <= 1.0f,
            "policy.heuristic_probability must be between 0.0 and 1.0");
    require(policy.force_magnitude >= 0.0f, "policy.force_magnitude must not be negative");
    require(policy.hidden1_size > 0 && policy.hidden2_size > 0,
            "policy hidden layer sizes must be greater than 0");
    require(policy.learning_rate > 0.0f, "policy.learning_rate must be greater than 0");
    require(std::isfinite(policy.output_bias), "policy.output_bias must be finite");

    const RewardConfig& reward = config.reward;
    require(std::isfinite(reward.food_reward), "reward.food_reward must be finite");
    require(std::isfinite(reward.max_distance) && reward.max_distance > 0.0f,
            "reward.max_distance must be greater than 0");
    require(std::isfinite(reward.shaping_scale), "reward.shaping_scale must be finite");
    require(std::isfinite(reward.existence_penalty), "reward.existence_penalty must be finite");

    require(config.body.radius > 0.0f, "body.radius must be greater than 0");
    require(config.body.mass > 0.0f, "body.mass must be greater than 0");

    require(config.physics.time_step > 0.0f, "physics.time_step must be greater than 0");
    require(config.physics.linear_damping >= 0.0f && config.physics.linear_damping < 1.0f,
            "physics.linear_damping must be in [0, 1)");

    require(config.max_steps > 0, "max_steps must be greater than 0");
}

void apply_config_value(SimulationConfig& config, const std::string& key, const std::string& value) {
    for (auto& field : config_fields(config)) {
        if (key != field.key) continue;

        if (std::holds_alternative<float*>(field.target)) {
            *std::get<float*>(field.target) = parse_float(key, value);
        } else {
            *std::get<uint32_t*>(field.target) = parse_unsigned(key, value);
        }
        return;
    }

    throw std::invalid_argument("Unknown configuration key: " + key);
}

bool load_config_file(const std::string& filename, SimulationConfig& config) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file {}", filename);
        return false;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;

        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = trim(line);
        if (line.empty()) continue;

        size_t separator = line.find('=');
        if (separator == std::string::npos) {
            throw std::invalid_argument(filename + ":" + std::to_string(line_number) +
                                        ": expected 'key = value'");
        }

        apply_config_value(config, trim(line.substr(0, separator)), trim(line.substr(separator + 1)));
    }

    spdlog::info("Loaded configuration from {}", filename);
    return true;
}

bool save_config_file(const std::string& filename, const SimulationConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        spdlog::error("Failed to save configuration to {}", filename);
        return false;
    }

    // config_fields() hands out mutable pointers; this copy keeps the caller's config const.
    SimulationConfig snapshot = config;
    file << std::setprecision(9);
    for (const auto& field : config_fields(snapshot)) {
        file << field.key << " = ";
        if (std::holds_alternative<float*>(field.target)) {
            file << *std::get<float*>(field.target);
        } else {
            file << *std::get<uint32_t*>(field.target);
        }
        file << "\n";
    }

    return file.good();
}

void apply_scenario_preset(SimulationConfig& config, const std::string& scenario) {
    if (scenario == "abundant") {
        config.energy.ambient_decay = 0.05f;
        config.energy.learning_threshold = 30.0f;
    } else if (scenario == "moderate") {
        config.energy.ambient_decay = 0.1f;
        config.energy.learning_threshold = 50.0f;
    } else if (scenario == "scarce") {
        config.energy.ambient_decay = 0.15f;
        config.energy.learning_threshold = 70.0f;
    } else if (scenario == "extreme") {
        config.energy.ambient_decay = 0.2f;
        config.energy.learning_threshold = 80.0f;
    } else {
        throw std::invalid_argument("Unknown scenario: " + scenario);
    }
}

} // namespace autopoiesis
