#include "agent_types.h"
#include <algorithm>

namespace autopoiesis {

namespace {

// Keeps ratio metrics finite for an empty history.
constexpr float MIN_DENOMINATOR = 1e-3f;

}

const char* to_string(EpisodeState state) {
    switch (state) {
        case EpisodeState::ALIVE: return "ALIVE";
        case EpisodeState::DEAD: return "DEAD";
        case EpisodeState::COMPLETED: return "COMPLETED";
    }
    return "UNKNOWN";
}

const char* to_string(SelectionTier tier) {
    switch (tier) {
        case SelectionTier::HEURISTIC: return "heuristic";
        case SelectionTier::EXPLORATION: return "exploration";
        case SelectionTier::EXPLOITATION: return "exploitation";
    }
    return "unknown";
}

SurvivalStats compute_survival_stats(const std::vector<HistoryRecord>& history) {
    SurvivalStats stats;
    stats.survival_time = static_cast<uint32_t>(history.size());

    double energy_sum = 0.0;
    for (const auto& record : history) {
        if (record.ate_food) stats.total_food_consumed++;
        if (record.can_learn) stats.learning_episodes++;
        energy_sum += record.energy;
    }

    if (!history.empty()) {
        stats.average_energy = static_cast<float>(energy_sum / history.size());
    }

    float denominator = std::max(static_cast<float>(stats.survival_time), MIN_DENOMINATOR);
    stats.learning_ratio = stats.learning_episodes / denominator;
    stats.feeding_efficiency = stats.total_food_consumed / denominator;

    return stats;
}

} // namespace autopoiesis
