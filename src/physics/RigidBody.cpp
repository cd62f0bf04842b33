/// @file RigidBody.cpp
/// @brief Factory methods for RigidBody.

#include "arena/physics/RigidBody.h"
#include <cassert>

namespace arena {

std::ostream& operator<<(std::ostream& os, ShapeType type) {
    switch (type) {
        case ShapeType::Rectangle: return os << "rectangle";
        case ShapeType::Circle:    return os << "circle";
        case ShapeType::Polygon:   return os << "polygon";
    }
    return os << "unknown";
}

RigidBody RigidBody::makeRectangle(float width, float height, float massVal, const Vec2& pos) {
    assert(width >= 0.0f && height >= 0.0f && "Rectangle size must be non-negative");
    assert(massVal >= 0.0f && "Mass must be non-negative");

    RigidBody body;
    body.shape.type   = ShapeType::Rectangle;
    body.shape.width  = width;
    body.shape.height = height;
    body.position     = pos;
    body.mass         = massVal;
    body.movable      = massVal > 0.0f;
    return body;
}

RigidBody RigidBody::makeCircle(float radius, float massVal, const Vec2& pos) {
    assert(radius >= 0.0f && "Circle radius must be non-negative");
    assert(massVal >= 0.0f && "Mass must be non-negative");

    RigidBody body;
    body.shape.type   = ShapeType::Circle;
    body.shape.radius = radius;
    // Keep the bounding size meaningful for code that only reads width/height
    body.shape.width  = 2.0f * radius;
    body.shape.height = 2.0f * radius;
    body.position     = pos;
    body.mass         = massVal;
    body.movable      = massVal > 0.0f;
    return body;
}

RigidBody RigidBody::makeParticipant(const Vec2& pos) {
    return makeRectangle(40.0f, 40.0f, 10.0f, pos);
}

} // namespace arena
