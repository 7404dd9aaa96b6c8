#ifndef AUTOPOIESIS_PERCEPTION_H
#define AUTOPOIESIS_PERCEPTION_H

#include "agent_types.h"
#include "physics_world.h"

namespace autopoiesis {

class EnergyLedger;
class FoodField;

class Perception {
public:
    Perception() = default;

    // Charges the sensing cost and builds the observation for the agent body.
    // Food items the physics world cannot resolve are left out of the
    // nearest-food scan. If none resolve, the origin stands in for the food.
    // Throws std::runtime_error if the agent body itself cannot be resolved.
    Observation sense(const physicslib::PhysicsWorld& world, physicslib::BodyId agent_body,
                      const FoodField& food_field, EnergyLedger& ledger) const;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_PERCEPTION_H
