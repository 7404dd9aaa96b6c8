#include "perception.h"
#include "energy_ledger.h"
#include "food_field.h"
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace autopoiesis {

Observation Perception::sense(const physicslib::PhysicsWorld& world, physicslib::BodyId agent_body,
                              const FoodField& food_field, EnergyLedger& ledger) const {
    ledger.deduct(ledger.get_config().sensing_cost);

    std::optional<physicslib::BodyState> agent = world.get_body_state(agent_body);
    if (!agent) {
        spdlog::error("Agent body {} is not resolvable by the physics world", agent_body);
        throw std::runtime_error("Agent body lost");
    }

    float min_distance = std::numeric_limits<float>::max();
    Vec2 nearest_food;
    bool found = false;

    for (const auto& item : food_field.get_items()) {
        std::optional<Vec2> food_position = food_field.resolve_position(world, item);
        if (!food_position) {
            SPDLOG_DEBUG("Food item {} unresolvable, skipped in scan", item.food_id);
            continue;
        }

        float dist = physicslib::distance(agent->position, *food_position);
        // Strict comparison keeps the first item on ties
        if (dist < min_distance) {
            min_distance = dist;
            nearest_food = *food_position;
            found = true;
        }
    }

    if (!found) {
        spdlog::warn("No food item resolvable, using origin as food target");
        nearest_food = Vec2(0.0f, 0.0f);
        min_distance = physicslib::distance(agent->position, nearest_food);
    }

    return Observation(agent->position, agent->velocity, nearest_food - agent->position,
                       min_distance, ledger.normalized());
}

} // namespace autopoiesis
