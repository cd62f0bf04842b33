#pragma once
/// @file AABB.h
/// @brief 2D axis-aligned bounding box used for bounds and broad-phase culling.

#include "arena/math/Vec2.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace arena {

/// Axis-Aligned Bounding Box defined by min and max corners.
struct AABB {
    Vec2 min; ///< Minimum corner (smallest x, y)
    Vec2 max; ///< Maximum corner (largest x, y)

    AABB() = default;
    AABB(const Vec2& min, const Vec2& max) : min(min), max(max) {}

    // ── Queries ───────────────────────────────────────────────────────────

    /// True if this AABB overlaps another on both axes. Touching edges count as overlap.
    bool overlaps(const AABB& other) const {
        return (min.x <= other.max.x && max.x >= other.min.x) &&
               (min.y <= other.max.y && max.y >= other.min.y);
    }

    Vec2 center()  const { return (min + max) * 0.5f; }
    Vec2 extents() const { return (max - min) * 0.5f; }

    float width()  const { return max.x - min.x; }
    float height() const { return max.y - min.y; }

    /// Closest point inside (or on) the box to p.
    Vec2 clamp(const Vec2& p) const {
        return {std::max(min.x, std::min(p.x, max.x)),
                std::max(min.y, std::min(p.y, max.y))};
    }

    // ── Static factories ──────────────────────────────────────────────────

    /// Box of the given full size centred on center.
    static AABB fromCenter(const Vec2& center, float width, float height) {
        const Vec2 h(width * 0.5f, height * 0.5f);
        return {center - h, center + h};
    }

    static AABB fromCircle(const Vec2& center, float radius) {
        const Vec2 r(radius, radius);
        return {center - r, center + r};
    }

    /// Tight box around a point set. Returns a degenerate box at origin for an empty set.
    static AABB fromPoints(const std::vector<Vec2>& points) {
        if (points.empty()) return {};
        AABB box(points.front(), points.front());
        for (const Vec2& p : points) {
            box.min.x = std::fmin(box.min.x, p.x);
            box.min.y = std::fmin(box.min.y, p.y);
            box.max.x = std::fmax(box.max.x, p.x);
            box.max.y = std::fmax(box.max.y, p.y);
        }
        return box;
    }
};

} // namespace arena
