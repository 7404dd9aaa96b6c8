#ifndef PHYSICSLIB_POINT_MASS_WORLD_H
#define PHYSICSLIB_POINT_MASS_WORLD_H

#include "physics_world.h"
#include <vector>

namespace physicslib {

struct PhysicsConfig {
    float time_step;
    float linear_damping;

    PhysicsConfig() : time_step(1.0f / 240.0f), linear_damping(0.04f) {}
};

// Planar point-mass integrator. Bodies never collide with each other; the
// only dynamics are external forces and linear damping.
class PointMassWorld : public PhysicsWorld {
public:
    explicit PointMassWorld(const PhysicsConfig& config);
    ~PointMassWorld() override;

    bool is_connected() const override { return connected_; }
    void disconnect() override;

    BodyId create_body(const BodyDef& def) override;
    bool remove_body(BodyId id) override;

    std::optional<BodyState> get_body_state(BodyId id) const override;

    bool apply_external_force(BodyId id, const Vec2& force) override;
    bool reset_body_position(BodyId id, const Vec2& position) override;

    void step_simulation() override;
    uint32_t get_current_tick() const override { return current_tick_; }

    size_t get_body_count() const;
    const PhysicsConfig& get_config() const { return config_; }

private:
    struct Body {
        BodyDef def;
        BodyState state;
        Vec2 pending_force;
        bool active;

        Body() : def(), state(), pending_force(), active(false) {}
    };

    Body* find_body(BodyId id);
    const Body* find_body(BodyId id) const;
    void integrate_body(Body& body);

    PhysicsConfig config_;
    std::vector<Body> bodies_;
    uint32_t current_tick_;
    bool connected_;
};

} // namespace physicslib

#endif // PHYSICSLIB_POINT_MASS_WORLD_H
