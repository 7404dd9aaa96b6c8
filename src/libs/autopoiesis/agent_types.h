#ifndef AUTOPOIESIS_AGENT_TYPES_H
#define AUTOPOIESIS_AGENT_TYPES_H

#include "geometry.h"
#include <array>
#include <cstdint>
#include <vector>

namespace autopoiesis {

using physicslib::Vec2;

constexpr size_t OBSERVATION_SIZE = 8;

// Observation layout
constexpr size_t OBS_AGENT_X = 0;
constexpr size_t OBS_AGENT_Y = 1;
constexpr size_t OBS_AGENT_VX = 2;
constexpr size_t OBS_AGENT_VY = 3;
constexpr size_t OBS_FOOD_DX = 4;
constexpr size_t OBS_FOOD_DY = 5;
constexpr size_t OBS_FOOD_DISTANCE = 6;
constexpr size_t OBS_ENERGY = 7;

struct Observation {
    std::array<float, OBSERVATION_SIZE> values;

    Observation() : values{} {}
    Observation(const Vec2& position, const Vec2& velocity, const Vec2& food_offset,
                float food_distance, float normalized_energy)
        : values{position.x, position.y, velocity.x, velocity.y,
                 food_offset.x, food_offset.y, food_distance, normalized_energy} {}

    float operator[](size_t index) const { return values[index]; }

    Vec2 agent_position() const { return Vec2(values[OBS_AGENT_X], values[OBS_AGENT_Y]); }
    Vec2 agent_velocity() const { return Vec2(values[OBS_AGENT_VX], values[OBS_AGENT_VY]); }
    Vec2 food_offset() const { return Vec2(values[OBS_FOOD_DX], values[OBS_FOOD_DY]); }
    float food_distance() const { return values[OBS_FOOD_DISTANCE]; }
    float normalized_energy() const { return values[OBS_ENERGY]; }
};

struct AgentState {
    Vec2 position;
    Vec2 velocity;
    float energy;
    float epsilon;
    uint32_t step_count;

    AgentState() : position(), velocity(), energy(0.0f), epsilon(0.0f), step_count(0) {}
};

enum class EpisodeState {
    ALIVE,
    DEAD,
    COMPLETED
};

const char* to_string(EpisodeState state);

enum class SelectionTier {
    HEURISTIC,
    EXPLORATION,
    EXPLOITATION
};

const char* to_string(SelectionTier tier);

struct HistoryRecord {
    uint32_t step;
    float energy;
    bool ate_food;
    bool can_learn;
    Vec2 position;
    float computation_cost;
    float reward;
    int action_index;
    SelectionTier tier;
    float epsilon;

    HistoryRecord() : step(0), energy(0.0f), ate_food(false), can_learn(false), position(),
                      computation_cost(0.0f), reward(0.0f), action_index(0),
                      tier(SelectionTier::EXPLOITATION), epsilon(0.0f) {}
};

struct SurvivalStats {
    uint32_t survival_time;
    uint32_t total_food_consumed;
    uint32_t learning_episodes;
    float average_energy;
    float learning_ratio;
    float feeding_efficiency;

    SurvivalStats() : survival_time(0), total_food_consumed(0), learning_episodes(0),
                      average_energy(0.0f), learning_ratio(0.0f), feeding_efficiency(0.0f) {}
};

SurvivalStats compute_survival_stats(const std::vector<HistoryRecord>& history);

struct EpisodeOutcome {
    EpisodeState state;
    uint32_t steps;
    SurvivalStats stats;

    EpisodeOutcome() : state(EpisodeState::ALIVE), steps(0), stats() {}
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_AGENT_TYPES_H
