#include "simulation_loop.h"
#include "simulation_config.h"
#include "history_writer.h"
#include "logging.h"
#include "point_mass_world.h"
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace autopoiesis;

struct RunOptions {
    std::string config_file;
    std::string scenario;
    std::optional<uint32_t> steps;
    std::optional<uint32_t> seed;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string output_directory;
    LoggingConfig logging;

    RunOptions() : output_directory("autopoiesis_output") {}
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>      Load parameters from a key = value file\n";
    std::cout << "  --scenario <name>    Energy preset: abundant, moderate, scarce, extreme\n";
    std::cout << "  --steps <N>          Maximum episode length (default: 2000)\n";
    std::cout << "  --seed <N>           Random seed (default: 12345)\n";
    std::cout << "  --set <key=value>    Override one parameter (repeatable)\n";
    std::cout << "  --output <dir>       Output directory (default: autopoiesis_output)\n";
    std::cout << "  --log-file <file>    Also write the log to this file\n";
    std::cout << "  --log-level <level>  trace, debug, info, warn, error (default: info)\n";
    std::cout << "  --help               Show this help message\n";
}

RunOptions parse_command_line(int argc, char* argv[]) {
    RunOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            exit(0);
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            options.scenario = argv[++i];
        } else if (arg == "--steps" && i + 1 < argc) {
            options.steps = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--seed" && i + 1 < argc) {
            options.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--set" && i + 1 < argc) {
            std::string assignment = argv[++i];
            size_t separator = assignment.find('=');
            if (separator == std::string::npos) {
                throw std::invalid_argument("--set expects key=value, got '" + assignment + "'");
            }
            options.overrides.emplace_back(assignment.substr(0, separator), assignment.substr(separator + 1));
        } else if (arg == "--output" && i + 1 < argc) {
            options.output_directory = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            options.logging.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.logging.level = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            exit(1);
        }
    }

    return options;
}

// Config file first, then the scenario preset, then explicit options.
SimulationConfig build_config(const RunOptions& options) {
    SimulationConfig config;

    if (!options.config_file.empty() && !load_config_file(options.config_file, config)) {
        throw std::runtime_error("Could not load config file " + options.config_file);
    }
    if (!options.scenario.empty()) {
        apply_scenario_preset(config, options.scenario);
        spdlog::info("Applied scenario preset '{}'", options.scenario);
    }
    if (options.steps) config.max_steps = *options.steps;
    if (options.seed) config.seed = *options.seed;
    for (const auto& [key, value] : options.overrides) {
        apply_config_value(config, key, value);
    }

    validate_config(config);
    return config;
}

int main(int argc, char* argv[]) {
    try {
        RunOptions options = parse_command_line(argc, argv);
        initialize_logging(options.logging);

        SimulationConfig config = build_config(options);

        std::filesystem::create_directories(options.output_directory);
        bool written = save_config_file(options.output_directory + "/config.txt", config);

        std::cout << "Autopoietic Learner - Energy-Constrained Agent" << std::endl;
        std::cout << "==============================================" << std::endl;

        SimulationLoop loop(config, std::make_unique<physicslib::PointMassWorld>(config.physics));
        EpisodeOutcome outcome = loop.run();

        written = write_history_csv(options.output_directory + "/history.csv", loop.get_history()) && written;
        written = write_summary(options.output_directory + "/summary.txt", outcome) && written;

        const SurvivalStats& stats = outcome.stats;
        std::cout << "Outcome: " << to_string(outcome.state) << " after " << outcome.steps << " steps\n";
        std::cout << "Food consumed: " << stats.total_food_consumed
                  << ", learning episodes: " << stats.learning_episodes << "\n";
        std::cout << "Average energy: " << stats.average_energy
                  << ", learning ratio: " << stats.learning_ratio
                  << ", feeding efficiency: " << stats.feeding_efficiency << std::endl;

        return written ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
