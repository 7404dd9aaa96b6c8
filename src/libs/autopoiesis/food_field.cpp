#include "food_field.h"
#include "energy_ledger.h"
#include "random_context.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace autopoiesis {

namespace {
constexpr uint32_t MAX_ITEM_RESERVE = 1024;
}

FoodField::FoodField(const FoodConfig& config, physicslib::PhysicsWorld& world, RandomContext& rng)
    : config_(config) {
    items_.reserve(std::min(config_.food_count, MAX_ITEM_RESERVE));

    for (uint32_t i = 0; i < config_.food_count; ++i) {
        physicslib::BodyDef def(config_.food_radius, config_.food_mass, random_position(rng));
        physicslib::BodyId body = world.create_body(def);
        if (body == physicslib::INVALID_BODY) {
            spdlog::warn("Failed to create body for food item {}", i);
            continue;
        }
        items_.emplace_back(i, body);
    }

    spdlog::info("Food field initialized with {} items in [{:.1f}, {:.1f}]",
                 items_.size(), config_.spawn_min, config_.spawn_max);
}

ConsumptionResult FoodField::check_consumption(physicslib::PhysicsWorld& world, const Vec2& agent_position,
                                               EnergyLedger& ledger, RandomContext& rng) {
    ConsumptionResult result;

    for (const auto& item : items_) {
        std::optional<Vec2> position = resolve_position(world, item);
        if (!position) continue;

        if (physicslib::distance(agent_position, *position) >= config_.consumption_radius) continue;

        Vec2 new_position = random_position(rng);
        if (!world.reset_body_position(item.body_id, new_position)) {
            spdlog::warn("Food item {} could not be relocated, skipping", item.food_id);
            continue;
        }

        float gain = rng.uniform(config_.energy_gain_min, config_.energy_gain_max);
        ledger.add(gain);

        result.consumed = true;
        result.food_id = item.food_id;
        result.energy_gain = gain;
        result.new_position = new_position;

        SPDLOG_INFO("Food {} consumed at ({:.2f}, {:.2f}), gain {:.2f}, respawned at ({:.2f}, {:.2f})",
                    item.food_id, position->x, position->y, gain, new_position.x, new_position.y);
        return result;
    }

    return result;
}

std::optional<Vec2> FoodField::resolve_position(const physicslib::PhysicsWorld& world, const FoodItem& item) const {
    std::optional<physicslib::BodyState> state = world.get_body_state(item.body_id);
    if (!state) return std::nullopt;

    return state->position;
}

Vec2 FoodField::random_position(RandomContext& rng) const {
    float x = rng.uniform(config_.spawn_min, config_.spawn_max);
    float y = rng.uniform(config_.spawn_min, config_.spawn_max);
    return Vec2(x, y);
}

} // namespace autopoiesis
