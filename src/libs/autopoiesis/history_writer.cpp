#include "history_writer.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace autopoiesis {

bool write_history_csv(const std::string& filename, const std::vector<HistoryRecord>& history) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        spdlog::error("Failed to save history to {}", filename);
        return false;
    }

    file << "step,energy,ate_food,can_learn,x,y,computation_cost,reward,action,tier,epsilon\n";
    for (const auto& record : history) {
        file << record.step << "," << record.energy << ","
             << (record.ate_food ? 1 : 0) << "," << (record.can_learn ? 1 : 0) << ","
             << record.position.x << "," << record.position.y << ","
             << record.computation_cost << "," << record.reward << ","
             << record.action_index << "," << to_string(record.tier) << ","
             << record.epsilon << "\n";
    }

    file.close();
    spdlog::info("History ({} steps) saved to {}", history.size(), filename);
    return true;
}

bool write_summary(const std::string& filename, const EpisodeOutcome& outcome) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        spdlog::error("Failed to save summary to {}", filename);
        return false;
    }

    const SurvivalStats& stats = outcome.stats;
    file << "Outcome: " << to_string(outcome.state) << "\n";
    file << "Steps: " << outcome.steps << "\n";
    file << "Survival Time: " << stats.survival_time << "\n";
    file << "Total Food Consumed: " << stats.total_food_consumed << "\n";
    file << "Learning Episodes: " << stats.learning_episodes << "\n";
    file << "Average Energy: " << stats.average_energy << "\n";
    file << "Learning Ratio: " << stats.learning_ratio << "\n";
    file << "Feeding Efficiency: " << stats.feeding_efficiency << "\n";

    file.close();
    spdlog::info("Summary saved to {}", filename);
    return true;
}

} // namespace autopoiesis
