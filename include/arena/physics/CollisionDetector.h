#pragma once
/// @file CollisionDetector.h
/// @brief Stateless broad-phase and narrow-phase collision detection.

#include "arena/physics/RigidBody.h"
#include "arena/physics/CollisionInfo.h"
#include "arena/physics/PolygonRegistry.h"
#include <vector>

namespace arena {

/// Pure-static collision detection utility: no state, no instances needed.
class CollisionDetector {
public:
    CollisionDetector() = delete;

    /// Sides used when a circle takes the polygon (SAT) path.
    static constexpr int kCircleSegments = 16;

    // ── Broad phase ───────────────────────────────────────────────────────

    /// Cheap overlap test using the best shape pairing:
    /// circle-circle distance, circle-box clamped point, box-box half extents.
    /// Polygons use their bounding box. Touching counts as overlap.
    static bool aabbOverlap(const RigidBody& a, const RigidBody& b);

    // ── Narrow phase dispatcher ───────────────────────────────────────────

    /// Exact test. Circle pairs use the closed form, everything else SAT.
    /// The returned MTV points from a toward b.
    static CollisionInfo test(const RigidBody& a, const RigidBody& b,
                              const PolygonRegistry& registry);

    // ── Shape-pair tests ──────────────────────────────────────────────────

    /// Circle vs circle using squared distances on the rejection path.
    static CollisionInfo circleCircle(const RigidBody& a, const RigidBody& b);

    /// Separating-axis test over two convex vertex lists.
    /// centerA/centerB orient the MTV; the contact point is their midpoint.
    static CollisionInfo polygonPolygon(const std::vector<Vec2>& vertsA, const Vec2& centerA,
                                        const std::vector<Vec2>& vertsB, const Vec2& centerB);

    // ── Polygon representations ───────────────────────────────────────────

    /// Vertices used for the SAT path: rectangle corners, a regular
    /// kCircleSegments-gon for circles, registered vertices for polygons
    /// (bounding rectangle when none are registered).
    static std::vector<Vec2> polygonFor(const RigidBody& body, const PolygonRegistry& registry);

    /// Corners of an axis-aligned rectangle, counter-clockwise from bottom-left.
    static std::vector<Vec2> rectangleVertices(const Vec2& center, float width, float height);

    /// Regular polygon inscribed in the circle. Fewer than 3 segments falls back to 8.
    static std::vector<Vec2> circleVertices(const Vec2& center, float radius,
                                            int segments = kCircleSegments);
};

} // namespace arena
