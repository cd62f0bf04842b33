/// @file PolygonRegistry.cpp
/// @brief Registration, rigid resync and liveness sweep of custom polygons.

#include "arena/physics/PolygonRegistry.h"
#include <ostream>
#include <unordered_set>

namespace arena {

bool PolygonRegistry::registerPolygon(BodyId id, std::vector<Vec2> vertices) {
    if (vertices.empty()) return false;
    polygons_[id] = std::move(vertices);
    return true;
}

bool PolygonRegistry::registerRelative(BodyId id, const Vec2& origin,
                                       const std::vector<Vec2>& offsets) {
    std::vector<Vec2> world;
    world.reserve(offsets.size());
    for (const Vec2& o : offsets) world.push_back(origin + o);
    return registerPolygon(id, std::move(world));
}

Vec2 PolygonRegistry::centroid(const std::vector<Vec2>& vertices) {
    if (vertices.empty()) return Vec2::zero();
    Vec2 sum;
    for (const Vec2& v : vertices) sum += v;
    return sum / static_cast<float>(vertices.size());
}

void PolygonRegistry::resync(const RigidBody& body) {
    const auto it = polygons_.find(body.id);
    if (it == polygons_.end()) return;

    std::vector<Vec2>& verts = it->second;
    const Vec2 displacement = body.position - centroid(verts);
    for (Vec2& v : verts) v += displacement;
}

bool PolygonRegistry::erase(BodyId id) {
    return polygons_.erase(id) != 0;
}

std::size_t PolygonRegistry::sweep(const std::vector<RigidBody>& liveBodies) {
    if (polygons_.empty()) return 0;

    std::unordered_set<BodyId> live;
    live.reserve(liveBodies.size());
    for (const RigidBody& b : liveBodies) live.insert(b.id);

    std::size_t removed = 0;
    for (auto it = polygons_.begin(); it != polygons_.end();) {
        if (live.count(it->first) == 0) {
            it = polygons_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

const std::vector<Vec2>* PolygonRegistry::find(BodyId id) const {
    const auto it = polygons_.find(id);
    return it != polygons_.end() ? &it->second : nullptr;
}

std::size_t PolygonRegistry::vertexCount(BodyId id) const {
    const auto* verts = find(id);
    return verts ? verts->size() : 0;
}

void PolygonRegistry::dump(std::ostream& os) const {
    if (polygons_.empty()) {
        os << "Polygon registry is empty\n";
        return;
    }
    os << "Polygon registry contents: " << polygons_.size() << " entries\n";
    for (const auto& [id, verts] : polygons_) {
        os << "  [" << id << "] " << verts.size() << " vertices, centroid "
           << centroid(verts) << '\n';
    }
}

} // namespace arena
