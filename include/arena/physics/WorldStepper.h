#pragma once
/// @file WorldStepper.h
/// @brief Fixed-tick pipeline: integrate, clamp to bounds, drag, resync polygons, collide.

#include "arena/physics/RigidBody.h"
#include "arena/physics/WorldBounds.h"
#include "arena/physics/PolygonRegistry.h"
#include "arena/physics/CollisionResolver.h"
#include "arena/physics/CollisionInfo.h"
#include <cstdint>
#include <vector>

namespace arena {

/// Per-tick integration parameters.
struct StepperConfig {
    float    fixedDt        = 1.0f / 60.0f;  ///< Seconds per tick
    Vec2     gravity        = Vec2::zero();  ///< Acceleration applied to movable bodies
    float    boundaryBounce = 0.7f;          ///< Velocity kept (reflected) on a bounds hit
    float    drag           = 0.95f;         ///< Velocity multiplier applied every tick
    float    stopSpeed      = 0.5f;          ///< Speeds below this snap to zero
    uint64_t sweepInterval  = 100;           ///< Ticks between polygon registry sweeps
};

/**
 * Advances a body list by one tick. Holds no bodies itself; the caller
 * passes the canonical list, the bounds and the polygon registry in.
 *
 * Not thread-safe: the caller must keep step() from overlapping any
 * mutation of the same body list or registry.
 */
class WorldStepper {
public:
    explicit WorldStepper(StepperConfig cfg = {}, ResolverConfig resolverCfg = {});

    // ── Main interface ────────────────────────────────────────────────────

    /// Integrate every movable body, sweep the registry when tick is a
    /// multiple of sweepInterval, then run the collision pass.
    void step(std::vector<RigidBody>& bodies, const WorldBounds& bounds,
              uint64_t tick, PolygonRegistry& registry);

    /// Pairwise collision pass on its own: static-static pairs skipped,
    /// broad phase before narrow phase, every hit resolved in list order.
    /// Polygon bodies pushed by resolution are resynced immediately.
    void collide(std::vector<RigidBody>& bodies, PolygonRegistry& registry);

    /// Integrate one body: gravity, x += v*dt, bounds clamp/bounce, drag.
    /// Returns true if the position changed.
    bool integrate(RigidBody& body, const WorldBounds& bounds) const;

    // ── Accessors ─────────────────────────────────────────────────────────

    /// Pairs resolved by the most recent collision pass.
    const std::vector<Contact>& lastContacts() const { return lastContacts_; }

    const StepperConfig& config() const { return config_; }
    void setConfig(StepperConfig cfg);

    CollisionResolver&       resolver()       { return resolver_; }
    const CollisionResolver& resolver() const { return resolver_; }

private:
    StepperConfig        config_;
    CollisionResolver    resolver_;
    std::vector<Contact> lastContacts_;

    /// Clamp one axis into [lo + half, hi - half], reflecting velocity on a hit.
    void clampAxis(float& pos, float& vel, float half, float lo, float hi) const;

    /// Scale velocity by drag and zero it below stopSpeed.
    void applyDrag(RigidBody& body) const;
};

} // namespace arena
