/// @file Collider.cpp
/// @brief Polygon and tile-template collider builders.

#include "arena/physics/Collider.h"
#include "arena/physics/PolygonRegistry.h"
#include <algorithm>
#include <cmath>

namespace arena {

std::optional<Collider> makePolygonCollider(const std::vector<Vec2>& points) {
    if (points.empty()) return std::nullopt;

    // Resync keeps the vertex centroid on body.position, so the body must
    // start there and its box must enclose every vertex around it.
    const Vec2 center = PolygonRegistry::centroid(points);
    float reachX = 0.0f;
    float reachY = 0.0f;
    for (const Vec2& p : points) {
        reachX = std::max(reachX, std::abs(p.x - center.x));
        reachY = std::max(reachY, std::abs(p.y - center.y));
    }

    Collider c;
    c.body.shape.type   = ShapeType::Polygon;
    c.body.shape.width  = 2.0f * reachX;
    c.body.shape.height = 2.0f * reachY;
    c.body.position     = center;
    c.body.mass         = 0.0f;
    c.body.movable      = false;
    c.vertices          = points;
    return c;
}

std::optional<Collider> makeColliderFromTemplate(float tileX, float tileY,
                                                 const ColliderTemplate& tmpl) {
    const Vec2 origin(tileX + tmpl.offsetX, tileY + tmpl.offsetY);

    switch (tmpl.type) {
        case ShapeType::Rectangle: {
            if (tmpl.width <= 0.0f || tmpl.height <= 0.0f) return std::nullopt;
            const Vec2 center = origin + Vec2(tmpl.width * 0.5f, tmpl.height * 0.5f);
            return Collider{RigidBody::makeRectangle(tmpl.width, tmpl.height, 0.0f, center), {}};
        }
        case ShapeType::Circle: {
            if (tmpl.radius <= 0.0f) return std::nullopt;
            // Ellipse objects are anchored at their bounding box's top-left corner
            const Vec2 center = origin + Vec2(tmpl.radius, tmpl.radius);
            return Collider{RigidBody::makeCircle(tmpl.radius, 0.0f, center), {}};
        }
        case ShapeType::Polygon: {
            std::vector<Vec2> world;
            world.reserve(tmpl.points.size());
            for (const Vec2& p : tmpl.points) world.push_back(origin + p);
            return makePolygonCollider(world);
        }
    }
    return std::nullopt;
}

} // namespace arena
