/// @file CollisionDetector.cpp
/// @brief Broad-phase culling, closed-form circle test and separating-axis polygon test.

#include "arena/physics/CollisionDetector.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace arena {

// ── Helpers ───────────────────────────────────────────────────────────────

namespace {

constexpr float kPi            = 3.14159265358979323846f;
constexpr float kCoincidentEps = 1e-4f; ///< Centre distance treated as "same point"
constexpr float kEdgeEps       = 1e-6f; ///< Shorter edges contribute no axis

struct Interval {
    float min;
    float max;
};

/// Project every vertex onto axis and return the covered interval.
Interval project(const std::vector<Vec2>& verts, const Vec2& axis) {
    Interval iv{axis.dot(verts[0]), axis.dot(verts[0])};
    for (std::size_t i = 1; i < verts.size(); ++i) {
        const float p = axis.dot(verts[i]);
        iv.min = std::min(iv.min, p);
        iv.max = std::max(iv.max, p);
    }
    return iv;
}

/// Append the unit edge normals of a closed polygon. Zero-length edges are skipped.
void appendAxes(const std::vector<Vec2>& verts, std::vector<Vec2>& axes) {
    const std::size_t n = verts.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Vec2 edge = verts[(i + 1) % n] - verts[i];
        const float len = edge.length();
        if (len < kEdgeEps) continue;
        axes.push_back(edge.perpendicular() / len);
    }
}

} // namespace

// ── Broad phase ───────────────────────────────────────────────────────────

bool CollisionDetector::aabbOverlap(const RigidBody& a, const RigidBody& b) {
    if (a.isCircle() && b.isCircle()) {
        const Vec2  d    = b.position - a.position;
        const float rSum = a.shape.radius + b.shape.radius;
        return d.lengthSq() <= rSum * rSum;
    }

    if (a.isCircle() || b.isCircle()) {
        const RigidBody& circle = a.isCircle() ? a : b;
        const RigidBody& box    = a.isCircle() ? b : a;

        const Vec2 closest = box.bounds().clamp(circle.position);
        const float r      = circle.shape.radius;
        return (closest - circle.position).lengthSq() <= r * r;
    }

    const float overlapX = (a.halfExtentX() + b.halfExtentX())
                         - std::fabs(a.position.x - b.position.x);
    const float overlapY = (a.halfExtentY() + b.halfExtentY())
                         - std::fabs(a.position.y - b.position.y);
    return overlapX >= 0.0f && overlapY >= 0.0f;
}

// ── Narrow-phase dispatcher ───────────────────────────────────────────────

CollisionInfo CollisionDetector::test(const RigidBody& a, const RigidBody& b,
                                      const PolygonRegistry& registry) {
    if (a.isCircle() && b.isCircle())
        return circleCircle(a, b);

    return polygonPolygon(polygonFor(a, registry), a.position,
                          polygonFor(b, registry), b.position);
}

// ── circleCircle ──────────────────────────────────────────────────────────

CollisionInfo CollisionDetector::circleCircle(const RigidBody& a, const RigidBody& b) {
    const Vec2  delta  = b.position - a.position;
    const float distSq = delta.lengthSq();
    const float rSum   = a.shape.radius + b.shape.radius;

    CollisionInfo info;
    if (distSq > rSum * rSum) return info;

    info.collided = true;
    const float dist = std::sqrt(distSq);

    if (dist < kCoincidentEps) {
        // Same centre: push along X, signed by id order so swapping the
        // pair reverses the MTV
        const float sign  = (a.id <= b.id) ? 1.0f : -1.0f;
        info.mtv          = Vec2(sign * a.shape.radius, 0.0f);
        info.depth        = rSum;
        info.contactPoint = a.position;
        return info;
    }

    const Vec2 dir    = delta / dist;
    info.depth        = rSum - dist;
    info.mtv          = dir * info.depth;
    info.contactPoint = a.position + dir * a.shape.radius;
    return info;
}

// ── polygonPolygon (SAT) ──────────────────────────────────────────────────

CollisionInfo CollisionDetector::polygonPolygon(const std::vector<Vec2>& vertsA, const Vec2& centerA,
                                                const std::vector<Vec2>& vertsB, const Vec2& centerB) {
    CollisionInfo info;
    if (vertsA.empty() || vertsB.empty()) return info;

    std::vector<Vec2> axes;
    axes.reserve(vertsA.size() + vertsB.size());
    appendAxes(vertsA, axes);
    appendAxes(vertsB, axes);
    if (axes.empty()) return info; // both shapes collapsed to a point

    float minOverlap = std::numeric_limits<float>::max();
    Vec2  minAxis;

    for (const Vec2& axis : axes) {
        const Interval pa = project(vertsA, axis);
        const Interval pb = project(vertsB, axis);

        if (pa.min > pb.max || pb.min > pa.max) return info; // separating axis

        const float overlap = std::min(pb.max - pa.min, pa.max - pb.min);
        if (overlap < minOverlap) {
            minOverlap = overlap;
            minAxis    = axis;
        }
    }

    // Orient the axis from A toward B
    if ((centerB - centerA).dot(minAxis) < 0.0f) minAxis = -minAxis;

    info.collided     = true;
    info.depth        = minOverlap;
    info.mtv          = minAxis * minOverlap;
    info.contactPoint = (centerA + centerB) * 0.5f;
    return info;
}

// ── Polygon representations ───────────────────────────────────────────────

std::vector<Vec2> CollisionDetector::polygonFor(const RigidBody& body,
                                                const PolygonRegistry& registry) {
    switch (body.shape.type) {
        case ShapeType::Circle:
            return circleVertices(body.position, body.shape.radius);
        case ShapeType::Polygon:
            if (const auto* verts = registry.find(body.id)) return *verts;
            return rectangleVertices(body.position, body.shape.width, body.shape.height);
        case ShapeType::Rectangle:
            break;
    }
    return rectangleVertices(body.position, body.shape.width, body.shape.height);
}

std::vector<Vec2> CollisionDetector::rectangleVertices(const Vec2& c, float width, float height) {
    const float hw = width * 0.5f;
    const float hh = height * 0.5f;
    return {
        {c.x - hw, c.y - hh},
        {c.x + hw, c.y - hh},
        {c.x + hw, c.y + hh},
        {c.x - hw, c.y + hh},
    };
}

std::vector<Vec2> CollisionDetector::circleVertices(const Vec2& center, float radius, int segments) {
    if (segments < 3) segments = 8;

    std::vector<Vec2> verts;
    verts.reserve(static_cast<std::size_t>(segments));
    const float step = 2.0f * kPi / static_cast<float>(segments);
    for (int i = 0; i < segments; ++i) {
        const float angle = static_cast<float>(i) * step;
        verts.emplace_back(center.x + radius * std::cos(angle),
                           center.y + radius * std::sin(angle));
    }
    return verts;
}

} // namespace arena
