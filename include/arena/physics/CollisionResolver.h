#pragma once
/// @file CollisionResolver.h
/// @brief MTV positional correction followed by restitution impulses.

#include "arena/physics/CollisionInfo.h"

namespace arena {

/// Configuration for the collision resolver.
struct ResolverConfig {
    float restitution        = 0.7f;   ///< Fraction of closing speed returned as bounce [0, 1]
    float minInverseMassSum  = 1e-10f; ///< Below this the pair is treated as immovable
};

/**
 * Resolves one detected pair.
 *
 * Two response families are used on purpose:
 *   - both movable: each body moves half the MTV apart, then an impulse
 *     with restitution is exchanged along the contact normal;
 *   - one movable: the movable body takes the whole MTV and stops dead
 *     (velocity zeroed), an inelastic stop against static scenery.
 * Pairs where neither body is movable are left untouched.
 */
class CollisionResolver {
public:
    explicit CollisionResolver(ResolverConfig cfg = {});

    /// Separate a and b according to info. No-op when !info.collided.
    void resolve(RigidBody& a, RigidBody& b, const CollisionInfo& info) const;

    /// Exchange a restitution impulse along info.mtv. Skips separating pairs,
    /// zero-length MTVs and pairs whose inverse masses sum to ~0.
    void applyImpulse(RigidBody& a, RigidBody& b, const CollisionInfo& info) const;

    const ResolverConfig& config() const { return config_; }
    void setConfig(ResolverConfig cfg);

private:
    ResolverConfig config_;
};

} // namespace arena
