#include "point_mass_world.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace physicslib {

PointMassWorld::PointMassWorld(const PhysicsConfig& config)
    : config_(config), current_tick_(0), connected_(false) {
    if (config_.time_step <= 0.0f) {
        spdlog::error("Physics time step must be positive, got {}", config_.time_step);
        return;
    }
    if (config_.linear_damping < 0.0f || config_.linear_damping >= 1.0f) {
        spdlog::error("Linear damping must be in [0, 1), got {}", config_.linear_damping);
        return;
    }

    connected_ = true;
    SPDLOG_DEBUG("Point-mass physics connected (dt={:.5f}, damping={:.3f})",
                 config_.time_step, config_.linear_damping);
}

PointMassWorld::~PointMassWorld() {
    disconnect();
}

void PointMassWorld::disconnect() {
    if (!connected_) return;

    connected_ = false;
    bodies_.clear();
    SPDLOG_DEBUG("Point-mass physics disconnected after {} ticks", current_tick_);
}

BodyId PointMassWorld::create_body(const BodyDef& def) {
    if (!connected_) return INVALID_BODY;
    if (def.mass <= 0.0f || def.radius <= 0.0f) {
        spdlog::warn("Rejecting body with mass {} and radius {}", def.mass, def.radius);
        return INVALID_BODY;
    }

    Body body;
    body.def = def;
    body.state = BodyState(def.position, Vec2());
    body.active = true;
    bodies_.push_back(body);

    return static_cast<BodyId>(bodies_.size() - 1);
}

bool PointMassWorld::remove_body(BodyId id) {
    Body* body = find_body(id);
    if (!body) return false;

    body->active = false;
    return true;
}

std::optional<BodyState> PointMassWorld::get_body_state(BodyId id) const {
    const Body* body = find_body(id);
    if (!body) return std::nullopt;

    return body->state;
}

bool PointMassWorld::apply_external_force(BodyId id, const Vec2& force) {
    Body* body = find_body(id);
    if (!body) return false;

    body->pending_force = body->pending_force + force;
    return true;
}

bool PointMassWorld::reset_body_position(BodyId id, const Vec2& position) {
    Body* body = find_body(id);
    if (!body) return false;

    body->state.position = position;
    return true;
}

void PointMassWorld::step_simulation() {
    if (!connected_) return;

    for (auto& body : bodies_) {
        if (!body.active) continue;
        integrate_body(body);
    }

    current_tick_++;
}

size_t PointMassWorld::get_body_count() const {
    return static_cast<size_t>(std::count_if(bodies_.begin(), bodies_.end(),
        [](const Body& body) { return body.active; }));
}

PointMassWorld::Body* PointMassWorld::find_body(BodyId id) {
    if (!connected_ || id < 0 || static_cast<size_t>(id) >= bodies_.size()) {
        return nullptr;
    }
    Body& body = bodies_[static_cast<size_t>(id)];
    return body.active ? &body : nullptr;
}

const PointMassWorld::Body* PointMassWorld::find_body(BodyId id) const {
    if (!connected_ || id < 0 || static_cast<size_t>(id) >= bodies_.size()) {
        return nullptr;
    }
    const Body& body = bodies_[static_cast<size_t>(id)];
    return body.active ? &body : nullptr;
}

void PointMassWorld::integrate_body(Body& body) {
    float dt = config_.time_step;
    Vec2 acceleration = body.pending_force * (1.0f / body.def.mass);

    body.state.velocity = body.state.velocity + acceleration * dt;
    // Same damping law as Bullet: v *= (1 - damping)^dt
    body.state.velocity = body.state.velocity * std::pow(1.0f - config_.linear_damping, dt);
    body.state.position = body.state.position + body.state.velocity * dt;

    body.pending_force = Vec2();
}

} // namespace physicslib
