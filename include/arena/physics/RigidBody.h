#pragma once
/// @file RigidBody.h
/// @brief Non-rotating 2D rigid body: shape, kinematic state and mass.

#include "arena/math/Vec2.h"
#include "arena/physics/AABB.h"
#include <cstdint>
#include <iostream>

namespace arena {

/// Stable body identity assigned by World. Never reused within a world.
using BodyId = std::uint64_t;

/// Reserved id for bodies that have not been added to a world yet.
constexpr BodyId kInvalidBodyId = 0;

/// Collision shape category.
enum class ShapeType {
    Rectangle, ///< Axis-aligned box of width x height
    Circle,    ///< Circle of radius
    Polygon    ///< Convex polygon; vertices live in the PolygonRegistry
};

std::ostream& operator<<(std::ostream& os, ShapeType type);

/// Shape parameters. Polygons also carry their bounding width/height.
struct Shape {
    ShapeType type   = ShapeType::Rectangle;
    float     width  = 0.0f;
    float     height = 0.0f;
    float     radius = 0.0f;
};

/// A rigid body: the unit of simulation.
struct RigidBody {
    // ── Identity ──────────────────────────────────────────────────────────

    BodyId id = kInvalidBodyId; ///< Assigned by World on insertion

    // ── Shape ─────────────────────────────────────────────────────────────

    Shape shape;

    // ── State ─────────────────────────────────────────────────────────────

    Vec2 position = Vec2::zero(); ///< World-space centre
    Vec2 velocity = Vec2::zero(); ///< Units per second

    // ── Mass properties ───────────────────────────────────────────────────

    float mass    = 0.0f;  ///< 0 is the immovable sentinel; never divide by it
    bool  movable = false; ///< Integrated and pushed by collisions when true

    // ── Queries ───────────────────────────────────────────────────────────

    bool isMovable()  const { return movable; }
    bool isCircle()   const { return shape.type == ShapeType::Circle; }
    bool isPolygon()  const { return shape.type == ShapeType::Polygon; }

    /// 1/mass, or 0 for the immovable sentinel (infinite mass).
    float inverseMass() const { return mass > 0.0f ? 1.0f / mass : 0.0f; }

    /// Half of the body's horizontal extent (radius for circles).
    float halfExtentX() const {
        return isCircle() ? shape.radius : shape.width * 0.5f;
    }

    /// Half of the body's vertical extent (radius for circles).
    float halfExtentY() const {
        return isCircle() ? shape.radius : shape.height * 0.5f;
    }

    /// World-space bounding box from the shape parameters.
    AABB bounds() const {
        if (isCircle()) return AABB::fromCircle(position, shape.radius);
        return AABB::fromCenter(position, shape.width, shape.height);
    }

    /// Apply a linear impulse. Immovable and zero-mass bodies are unaffected.
    void applyImpulse(const Vec2& impulse) {
        if (!movable) return;
        velocity += impulse * inverseMass();
    }

    // ── Static factories (implemented in RigidBody.cpp) ───────────────────

    /// Rectangle centred on position. mass == 0 makes it immovable.
    static RigidBody makeRectangle(float width, float height, float mass, const Vec2& position);

    /// Circle centred on position. mass == 0 makes it immovable.
    static RigidBody makeCircle(float radius, float mass, const Vec2& position);

    /// The 40x40, mass 10 movable box used for a connected participant.
    static RigidBody makeParticipant(const Vec2& position);
};

} // namespace arena
