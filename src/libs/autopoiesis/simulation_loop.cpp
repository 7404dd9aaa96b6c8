#include "simulation_loop.h"
#include "policy_network.h"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace autopoiesis {

namespace {

// Upper bound on the up-front history allocation; longer episodes grow as they go.
constexpr uint32_t MAX_HISTORY_RESERVE = 4096;

const SimulationConfig& validated(const SimulationConfig& config) {
    validate_config(config);
    return config;
}

std::unique_ptr<physicslib::PhysicsWorld> require_connected(std::unique_ptr<physicslib::PhysicsWorld> world) {
    if (!world || !world->is_connected()) {
        spdlog::error("Physics world is not connected, cannot build agent");
        throw std::runtime_error("Physics world connection failed");
    }
    return world;
}

physicslib::BodyId create_agent_body(physicslib::PhysicsWorld& world, const AgentBodyConfig& body) {
    physicslib::BodyId id = world.create_body(physicslib::BodyDef(body.radius, body.mass, body.start_position));
    if (id == physicslib::INVALID_BODY) {
        spdlog::error("Failed to create agent body at ({:.2f}, {:.2f})",
                      body.start_position.x, body.start_position.y);
        throw std::runtime_error("Agent body creation failed");
    }
    return id;
}

std::unique_ptr<FunctionApproximator> with_default(std::unique_ptr<FunctionApproximator> approximator,
                                                   const PolicyConfig& config, RandomContext& rng) {
    if (approximator) return approximator;

    return std::make_unique<PolicyNetwork>(static_cast<int>(OBSERVATION_SIZE),
                                           static_cast<int>(config.hidden1_size),
                                           static_cast<int>(config.hidden2_size),
                                           NUM_ACTIONS, config.learning_rate, config.output_bias, rng);
}

} // namespace

SimulationLoop::SimulationLoop(const SimulationConfig& config, std::unique_ptr<physicslib::PhysicsWorld> world,
                               std::unique_ptr<FunctionApproximator> approximator)
    : config_(validated(config)),
      world_(require_connected(std::move(world))),
      rng_(config_.seed),
      ledger_(config_.energy),
      agent_body_(create_agent_body(*world_, config_.body)),
      food_field_(config_.food, *world_, rng_),
      perception_(),
      controller_(config_.policy, with_default(std::move(approximator), config_.policy, rng_)),
      reward_shaper_(config_.reward),
      learning_gate_(config_.energy),
      state_(EpisodeState::ALIVE),
      agent_state_(),
      history_(),
      last_learn_outcome_(LearnOutcome::SKIPPED) {
    history_.reserve(std::min(config_.max_steps, MAX_HISTORY_RESERVE));
    sync_agent_state();

    spdlog::info("Episode ready: energy {:.1f}/{:.1f}, decay {:.3f}, max {} steps, seed {}",
                 ledger_.get_energy(), ledger_.get_max_energy(), config_.energy.ambient_decay,
                 config_.max_steps, rng_.get_seed());
}

EpisodeState SimulationLoop::step() {
    if (is_terminal()) {
        throw std::logic_error("Episode already finished");
    }

    ledger_.begin_tick();
    ledger_.ambient_decay();

    if (ledger_.is_depleted()) {
        state_ = EpisodeState::DEAD;
        agent_state_.energy = ledger_.get_energy();
        spdlog::warn("Agent died at step {} due to energy depletion", agent_state_.step_count);
        return state_;
    }

    Observation observation = perception_.sense(*world_, agent_body_, food_field_, ledger_);
    ActResult action = controller_.act(observation, *world_, agent_body_, ledger_, rng_);

    std::optional<physicslib::BodyState> body = world_->get_body_state(agent_body_);
    if (!body) {
        spdlog::error("Agent body {} lost after physics step", agent_body_);
        throw std::runtime_error("Agent body lost");
    }

    ConsumptionResult consumption = food_field_.check_consumption(*world_, body->position, ledger_, rng_);
    float reward = reward_shaper_.reward(observation, consumption.consumed);

    // Decided once, after every other cost of this tick and before the learning cost
    bool can_learn = learning_gate_.can_learn(ledger_);
    last_learn_outcome_ = LearnOutcome::SKIPPED;
    if (can_learn) {
        last_learn_outcome_ = learning_gate_.maybe_update(observation, action.raw_scores,
                                                          action.decision.action_index, reward,
                                                          ledger_, controller_.approximator());
    }

    HistoryRecord record;
    record.step = agent_state_.step_count;
    record.energy = ledger_.get_energy();
    record.ate_food = consumption.consumed;
    record.can_learn = can_learn;
    record.position = body->position;
    record.computation_cost = ledger_.get_charged_this_tick();
    record.reward = reward;
    record.action_index = action.decision.action_index;
    record.tier = action.decision.tier;
    record.epsilon = controller_.get_epsilon();
    history_.push_back(record);

    sync_agent_state();
    agent_state_.step_count++;

    // Step indices 0, interval, 2 * interval, ...
    if (config_.progress_interval > 0 && record.step % config_.progress_interval == 0) {
        log_progress();
    }

    if (agent_state_.step_count >= config_.max_steps) {
        // The last budgeted tick can still spend the agent's final energy
        if (ledger_.is_depleted()) {
            state_ = EpisodeState::DEAD;
            spdlog::warn("Agent died at step {} due to energy depletion", record.step);
        } else {
            state_ = EpisodeState::COMPLETED;
            spdlog::info("Agent survived all {} steps with {:.2f} energy left",
                         config_.max_steps, ledger_.get_energy());
        }
    }

    return state_;
}

EpisodeOutcome SimulationLoop::run() {
    if (is_terminal()) {
        throw std::logic_error("Episode already finished");
    }

    while (!is_terminal()) {
        step();
    }

    EpisodeOutcome outcome = get_outcome();
    spdlog::info("Episode finished: {} after {} steps, {} food, {} learning steps, avg energy {:.2f}",
                 to_string(outcome.state), outcome.steps, outcome.stats.total_food_consumed,
                 outcome.stats.learning_episodes, outcome.stats.average_energy);
    return outcome;
}

EpisodeOutcome SimulationLoop::get_outcome() const {
    EpisodeOutcome outcome;
    outcome.state = state_;
    outcome.steps = static_cast<uint32_t>(history_.size());
    outcome.stats = get_stats();
    return outcome;
}

void SimulationLoop::sync_agent_state() {
    std::optional<physicslib::BodyState> body = world_->get_body_state(agent_body_);
    if (body) {
        agent_state_.position = body->position;
        agent_state_.velocity = body->velocity;
    }
    agent_state_.energy = ledger_.get_energy();
    agent_state_.epsilon = controller_.get_epsilon();
}

void SimulationLoop::log_progress() const {
    size_t window = std::min<size_t>(config_.progress_interval, history_.size());
    double energy_sum = 0.0;
    uint32_t food = 0;
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(window); it != history_.end(); ++it) {
        energy_sum += it->energy;
        if (it->ate_food) food++;
    }

    spdlog::info("Step {}: energy={:.2f}, avg energy={:.2f}, food (last {})={}, epsilon={:.3f}",
                 history_.back().step, agent_state_.energy,
                 window > 0 ? energy_sum / window : 0.0, window, food, agent_state_.epsilon);
}

} // namespace autopoiesis
