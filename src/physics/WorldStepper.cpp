/// @file WorldStepper.cpp
/// @brief Per-tick integration, boundary handling and the pairwise collision pass.

#include "arena/physics/WorldStepper.h"
#include "arena/physics/CollisionDetector.h"
#include <cassert>

namespace arena {

WorldStepper::WorldStepper(StepperConfig cfg, ResolverConfig resolverCfg)
    : config_(cfg), resolver_(resolverCfg) {
    assert(cfg.fixedDt > 0.0f && "fixedDt must be positive");
    assert(cfg.drag >= 0.0f && cfg.drag <= 1.0f && "drag must be in [0, 1]");
    assert(cfg.sweepInterval > 0 && "sweepInterval must be positive");
}

void WorldStepper::setConfig(StepperConfig cfg) {
    assert(cfg.fixedDt > 0.0f);
    assert(cfg.drag >= 0.0f && cfg.drag <= 1.0f);
    assert(cfg.sweepInterval > 0);
    config_ = cfg;
}

// ── Tick pipeline ─────────────────────────────────────────────────────────

void WorldStepper::step(std::vector<RigidBody>& bodies, const WorldBounds& bounds,
                        uint64_t tick, PolygonRegistry& registry) {
    // 1. Integrate movable bodies and keep their polygons attached
    for (auto& body : bodies) {
        if (!body.isMovable()) continue;
        const bool moved = integrate(body, bounds);
        if (moved && body.isPolygon()) registry.resync(body);
    }

    // 2. Periodic sweep of polygons whose bodies have left
    if (tick % config_.sweepInterval == 0) {
        registry.sweep(bodies);
    }

    // 3. Detect and resolve contacts
    collide(bodies, registry);
}

bool WorldStepper::integrate(RigidBody& body, const WorldBounds& bounds) const {
    const Vec2  oldPosition = body.position;
    const float dt          = config_.fixedDt;

    body.velocity += config_.gravity * dt;
    body.position += body.velocity * dt;

    clampAxis(body.position.x, body.velocity.x, body.halfExtentX(), bounds.minX, bounds.maxX);
    clampAxis(body.position.y, body.velocity.y, body.halfExtentY(), bounds.minY, bounds.maxY);

    applyDrag(body);

    return body.position != oldPosition;
}

void WorldStepper::clampAxis(float& pos, float& vel, float half, float lo, float hi) const {
    if (pos - half < lo) {
        pos = lo + half;
        vel = -vel * config_.boundaryBounce;
    }
    if (pos + half > hi) {
        pos = hi - half;
        vel = -vel * config_.boundaryBounce;
    }
}

void WorldStepper::applyDrag(RigidBody& body) const {
    body.velocity *= config_.drag;
    if (body.velocity.length() < config_.stopSpeed) {
        body.velocity = Vec2::zero();
    }
}

// ── Collision pass ────────────────────────────────────────────────────────

void WorldStepper::collide(std::vector<RigidBody>& bodies, PolygonRegistry& registry) {
    lastContacts_.clear();

    const std::size_t n = bodies.size();
    for (std::size_t i = 0; i + 1 < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            RigidBody& a = bodies[i];
            RigidBody& b = bodies[j];

            // Static-static pairs never need a response
            if (!a.isMovable() && !b.isMovable()) continue;
            if (!CollisionDetector::aabbOverlap(a, b)) continue;

            const CollisionInfo info = CollisionDetector::test(a, b, registry);
            if (!info.collided) continue;

            resolver_.resolve(a, b, info);
            lastContacts_.push_back({a.id, b.id, info});

            // Later pairs must see the pushed polygon where it now is
            if (a.isPolygon() && a.isMovable()) registry.resync(a);
            if (b.isPolygon() && b.isMovable()) registry.resync(b);
        }
    }
}

} // namespace arena
