/// @file CollisionResolver.cpp
/// @brief Positional MTV split and impulse-based velocity response.

#include "arena/physics/CollisionResolver.h"
#include <cassert>

namespace arena {

CollisionResolver::CollisionResolver(ResolverConfig cfg) : config_(cfg) {
    assert(cfg.restitution >= 0.0f && cfg.restitution <= 1.0f
           && "restitution must be in [0, 1]");
}

void CollisionResolver::setConfig(ResolverConfig cfg) {
    assert(cfg.restitution >= 0.0f && cfg.restitution <= 1.0f);
    config_ = cfg;
}

// ── Positional correction ─────────────────────────────────────────────────

void CollisionResolver::resolve(RigidBody& a, RigidBody& b, const CollisionInfo& info) const {
    if (!info.collided) return;

    const bool moveA = a.isMovable();
    const bool moveB = b.isMovable();

    if (moveA && moveB) {
        const Vec2 half = info.mtv * 0.5f;
        a.position -= half;
        b.position += half;
        applyImpulse(a, b, info);
    } else if (moveA) {
        a.position -= info.mtv;
        a.velocity  = Vec2::zero();
    } else if (moveB) {
        b.position += info.mtv;
        b.velocity  = Vec2::zero();
    }
}

// ── Velocity resolution ───────────────────────────────────────────────────

void CollisionResolver::applyImpulse(RigidBody& a, RigidBody& b, const CollisionInfo& info) const {
    if (info.mtv.isZero()) return; // touching only; no normal to push along

    const Vec2 normal = info.mtv.normalized();

    // Positive when B moves away from A along the A->B normal
    const float vn = (b.velocity - a.velocity).dot(normal);
    if (vn > 0.0f) return;

    const float invA = a.inverseMass();
    const float invB = b.inverseMass();
    const float invMassSum = invA + invB;
    if (invMassSum < config_.minInverseMassSum) return;

    const float j = -(1.0f + config_.restitution) * vn / invMassSum;
    const Vec2  impulse = normal * j;

    a.applyImpulse(-impulse);
    b.applyImpulse( impulse);
}

} // namespace arena
