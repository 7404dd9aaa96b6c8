#ifndef PHYSICSLIB_PHYSICS_WORLD_H
#define PHYSICSLIB_PHYSICS_WORLD_H

#include "geometry.h"
#include <cstdint>
#include <optional>

namespace physicslib {

using BodyId = int32_t;
constexpr BodyId INVALID_BODY = -1;

enum class ShapeType {
    SPHERE
};

struct BodyDef {
    ShapeType shape;
    float radius;
    float mass;
    Vec2 position;

    BodyDef() : shape(ShapeType::SPHERE), radius(0.5f), mass(1.0f), position() {}
    BodyDef(float body_radius, float body_mass, const Vec2& pos)
        : shape(ShapeType::SPHERE), radius(body_radius), mass(body_mass), position(pos) {}
};

struct BodyState {
    Vec2 position;
    Vec2 velocity;

    BodyState() : position(), velocity() {}
    BodyState(const Vec2& pos, const Vec2& vel) : position(pos), velocity(vel) {}
};

// Rigid-body backend used by the agent. All coordinates are planar and in the
// world frame. Queries against a removed body, an unknown id or a
// disconnected world resolve to nothing instead of failing.
class PhysicsWorld {
public:
    virtual ~PhysicsWorld() = default;

    virtual bool is_connected() const = 0;
    virtual void disconnect() = 0;

    // Returns INVALID_BODY when the body cannot be created.
    virtual BodyId create_body(const BodyDef& def) = 0;
    virtual bool remove_body(BodyId id) = 0;

    virtual std::optional<BodyState> get_body_state(BodyId id) const = 0;

    // Force is held until the next step_simulation() and then cleared.
    virtual bool apply_external_force(BodyId id, const Vec2& force) = 0;
    // Teleports the body. Velocity is left untouched.
    virtual bool reset_body_position(BodyId id, const Vec2& position) = 0;

    virtual void step_simulation() = 0;
    virtual uint32_t get_current_tick() const = 0;
};

} // namespace physicslib

#endif // PHYSICSLIB_PHYSICS_WORLD_H
