#ifndef AUTOPOIESIS_FOOD_FIELD_H
#define AUTOPOIESIS_FOOD_FIELD_H

#include "simulation_config.h"
#include "physics_world.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace autopoiesis {

class EnergyLedger;
class RandomContext;

struct FoodItem {
    uint32_t food_id;
    physicslib::BodyId body_id;

    FoodItem() : food_id(0), body_id(physicslib::INVALID_BODY) {}
    FoodItem(uint32_t id, physicslib::BodyId body) : food_id(id), body_id(body) {}
};

struct ConsumptionResult {
    bool consumed;
    uint32_t food_id;
    float energy_gain;
    Vec2 new_position;

    ConsumptionResult() : consumed(false), food_id(0), energy_gain(0.0f), new_position() {}
};

// Fixed set of food bodies. Eating relocates a body instead of removing it, so
// the number of items never changes after construction.
class FoodField {
public:
    FoodField(const FoodConfig& config, physicslib::PhysicsWorld& world, RandomContext& rng);

    // Grants energy for at most one item within the consumption radius of the
    // agent and moves that item to a fresh random position.
    ConsumptionResult check_consumption(physicslib::PhysicsWorld& world, const Vec2& agent_position,
                                        EnergyLedger& ledger, RandomContext& rng);

    // Current planar position of an item, or nothing if the body cannot be resolved.
    std::optional<Vec2> resolve_position(const physicslib::PhysicsWorld& world, const FoodItem& item) const;

    const std::vector<FoodItem>& get_items() const { return items_; }
    const FoodConfig& get_config() const { return config_; }

private:
    Vec2 random_position(RandomContext& rng) const;

    FoodConfig config_;
    std::vector<FoodItem> items_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_FOOD_FIELD_H
