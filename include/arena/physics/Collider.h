#pragma once
/// @file Collider.h
/// @brief Builders that turn map-loader and script data into bodies plus polygon vertices.

#include "arena/physics/RigidBody.h"
#include <optional>
#include <vector>

namespace arena {

/// A body ready for insertion, with the world-space vertices to register
/// for it (empty for rectangles and circles).
struct Collider {
    RigidBody         body;
    std::vector<Vec2> vertices;
};

/// Collision template attached to a tile, in tile-local coordinates
/// (origin at the tile's top-left corner).
struct ColliderTemplate {
    ShapeType         type    = ShapeType::Rectangle;
    float             offsetX = 0.0f;
    float             offsetY = 0.0f;
    float             width   = 0.0f;  ///< Rectangle only
    float             height  = 0.0f;  ///< Rectangle only
    float             radius  = 0.0f;  ///< Circle only
    std::vector<Vec2> points;          ///< Polygon only, relative to the offset
};

/// Immovable polygon collider from absolute world-space points.
/// The body sits on the vertex centroid, with a centred box wide enough
/// to enclose every point.
/// Returns nullopt for an empty point list.
std::optional<Collider> makePolygonCollider(const std::vector<Vec2>& points);

/// Immovable collider for a tile whose top-left corner is at (tileX, tileY).
/// Returns nullopt when the template cannot produce a shape.
std::optional<Collider> makeColliderFromTemplate(float tileX, float tileY,
                                                 const ColliderTemplate& tmpl);

} // namespace arena
