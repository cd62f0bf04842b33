#pragma once
/// @file PolygonRegistry.h
/// @brief World-space vertex storage for custom polygon colliders, keyed by BodyId.

#include "arena/physics/RigidBody.h"
#include <cstddef>
#include <iosfwd>
#include <unordered_map>
#include <vector>

namespace arena {

/**
 * Custom polygon vertices for bodies whose shape is not a plain rectangle or
 * circle. Vertices are stored in world space and translated rigidly whenever
 * the owning body moves (see resync()).
 *
 * Entries are keyed by BodyId, never by address, so a body that is moved
 * inside the canonical vector keeps its polygon.
 */
class PolygonRegistry {
public:
    PolygonRegistry() = default;

    // ── Mutation ──────────────────────────────────────────────────────────

    /// Store world-space vertices for a body, replacing any existing entry.
    /// Returns false (and stores nothing) for an empty vertex list.
    /// Fewer than 3 vertices are accepted but give degenerate collisions.
    bool registerPolygon(BodyId id, std::vector<Vec2> vertices);

    /// Store vertices given as offsets from origin (usually the body position).
    bool registerRelative(BodyId id, const Vec2& origin, const std::vector<Vec2>& offsets);

    /// Translate the body's vertices so their centroid lands on body.position.
    /// No-op if the body has no entry.
    void resync(const RigidBody& body);

    /// Remove one entry. Returns true if one existed.
    bool erase(BodyId id);

    /// Delete every entry whose body is not in the live list.
    /// Returns the number of entries removed.
    std::size_t sweep(const std::vector<RigidBody>& liveBodies);

    void clear() { polygons_.clear(); }

    // ── Queries ───────────────────────────────────────────────────────────

    /// Vertices for a body, or nullptr if none are registered.
    const std::vector<Vec2>* find(BodyId id) const;

    bool contains(BodyId id) const { return polygons_.count(id) != 0; }

    /// Number of stored vertices for a body; 0 if unregistered.
    std::size_t vertexCount(BodyId id) const;

    std::size_t size() const { return polygons_.size(); }
    bool        empty() const { return polygons_.empty(); }

    /// Write one line per entry: id, vertex count and centroid.
    void dump(std::ostream& os) const;

    /// Arithmetic mean of a vertex list; zero for an empty list.
    static Vec2 centroid(const std::vector<Vec2>& vertices);

private:
    std::unordered_map<BodyId, std::vector<Vec2>> polygons_;
};

} // namespace arena
