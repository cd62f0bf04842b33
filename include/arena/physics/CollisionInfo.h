#pragma once
/// @file CollisionInfo.h
/// @brief Result of one pairwise narrow-phase test.

#include "arena/physics/RigidBody.h"
#include <iostream>

namespace arena {

/// Transient per-pair result. Valid for one tick only.
struct CollisionInfo {
    bool  collided = false;
    Vec2  mtv;                ///< Minimum translation vector, pointing FROM body A TOWARD body B
    float depth    = 0.0f;    ///< Penetration depth (|mtv| for non-degenerate contacts)
    Vec2  contactPoint;       ///< Boundary point on A for circles, centre midpoint for polygons

    friend std::ostream& operator<<(std::ostream& os, const CollisionInfo& c) {
        if (!c.collided) return os << "{no collision}";
        return os << "{mtv " << c.mtv << ", depth " << c.depth
                  << ", contact " << c.contactPoint << "}";
    }
};

/// A resolved pair recorded by the stepper for diagnostics.
struct Contact {
    BodyId        bodyA = kInvalidBodyId;
    BodyId        bodyB = kInvalidBodyId;
    CollisionInfo info;
};

} // namespace arena
