/// @file World.cpp
/// @brief Locked mutation entry points, tick driver and diagnostics for World.

#include "arena/world/World.h"
#include "arena/physics/CollisionDetector.h"
#include <cassert>
#include <ostream>

namespace arena {

World::World(WorldConfig cfg)
    : config_(cfg), stepper_(cfg.stepper, cfg.resolver) {
    assert(cfg.maxSubSteps >= 1 && "maxSubSteps must be >= 1");
    assert(cfg.maxParticipantSpeed >= 0.0f && "maxParticipantSpeed must be non-negative");
}

// ── Internal helpers ──────────────────────────────────────────────────────

BodyId World::insertLocked(RigidBody body, std::vector<Vec2> vertices) {
    body.id = nextId_++;
    const BodyId id = body.id;

    slots_[id] = bodies_.size();
    bodies_.push_back(std::move(body));

    if (!vertices.empty()) {
        registry_.registerPolygon(id, std::move(vertices));
    }
    return id;
}

bool World::eraseLocked(BodyId id) {
    const auto it = slots_.find(id);
    if (it == slots_.end()) return false;

    // Swap-and-pop; the body that moves into the hole keeps its id
    const std::size_t slot = it->second;
    const std::size_t last = bodies_.size() - 1;
    if (slot != last) {
        bodies_[slot] = std::move(bodies_[last]);
        slots_[bodies_[slot].id] = slot;
    }
    bodies_.pop_back();
    slots_.erase(id);

    registry_.erase(id);
    return true;
}

RigidBody* World::findLocked(BodyId id) {
    const auto it = slots_.find(id);
    return it != slots_.end() ? &bodies_[it->second] : nullptr;
}

const RigidBody* World::findLocked(BodyId id) const {
    const auto it = slots_.find(id);
    return it != slots_.end() ? &bodies_[it->second] : nullptr;
}

// ── Collider mutation ─────────────────────────────────────────────────────

BodyId World::addOwned(OwnerId owner, RigidBody body, std::vector<Vec2> vertices) {
    std::lock_guard<std::mutex> lock(mutex_);
    const BodyId id = insertLocked(std::move(body), std::move(vertices));
    ownership_.add(owner, id);
    return id;
}

std::size_t World::removeOwned(OwnerId owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (const BodyId id : ownership_.removeOwner(owner)) {
        if (eraseLocked(id)) ++removed;
    }
    return removed;
}

BodyId World::addStatic(RigidBody body, std::vector<Vec2> vertices) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertLocked(std::move(body), std::move(vertices));
}

BodyId World::addStatic(Collider collider) {
    return addStatic(std::move(collider.body), std::move(collider.vertices));
}

// ── Participants ──────────────────────────────────────────────────────────

BodyId World::addParticipantBody(const ParticipantId& participant, RigidBody body) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = participants_.find(participant);
    if (it != participants_.end()) {
        ownership_.removeBody(it->second);
        eraseLocked(it->second);
    }

    const BodyId id = insertLocked(std::move(body), {});
    participants_[participant] = id;
    return id;
}

bool World::removeParticipantBody(const ParticipantId& participant) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = participants_.find(participant);
    if (it == participants_.end()) return false;

    const BodyId id = it->second;
    participants_.erase(it);
    ownership_.removeBody(id);
    return eraseLocked(id);
}

bool World::setParticipantVelocity(const ParticipantId& participant, const Vec2& velocity) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = participants_.find(participant);
    if (it == participants_.end()) return false;
    RigidBody* body = findLocked(it->second);
    if (!body) return false;

    Vec2 v = velocity;
    const float speed = v.length();
    if (speed > config_.maxParticipantSpeed && speed > 0.0f) {
        v *= config_.maxParticipantSpeed / speed;
    }
    body->velocity = v;
    return true;
}

bool World::teleportParticipant(const ParticipantId& participant, const Vec2& position) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = participants_.find(participant);
    if (it == participants_.end()) return false;
    RigidBody* body = findLocked(it->second);
    if (!body) return false;

    body->position = position;
    body->velocity = Vec2::zero();
    if (body->isPolygon()) registry_.resync(*body);
    return true;
}

std::optional<BodyId> World::participantBody(const ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = participants_.find(participant);
    if (it == participants_.end()) return std::nullopt;
    return it->second;
}

std::size_t World::participantCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participants_.size();
}

// ── World settings ────────────────────────────────────────────────────────

WorldBounds World::bounds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.bounds;
}

void World::setBounds(const WorldBounds& bounds) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.bounds = bounds;
}

void World::setGravity(const Vec2& gravity) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.stepper.gravity = gravity;
    stepper_.setConfig(config_.stepper);
}

void World::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    bodies_.clear();
    slots_.clear();
    registry_.clear();
    ownership_.clear();
    participants_.clear();
    tick_        = 0;
    accumulator_ = 0.0f;
}

// ── Simulation ────────────────────────────────────────────────────────────

void World::step() {
    ++tick_;
    stepper_.step(bodies_, config_.bounds, tick_, registry_);
}

void World::stepSynchronized() {
    std::lock_guard<std::mutex> lock(mutex_);
    step();
}

int World::update(float elapsed) {
    accumulator_ += elapsed;

    const float dt = config_.stepper.fixedDt;
    int steps = 0;
    while (accumulator_ >= dt) {
        if (steps == config_.maxSubSteps) {
            // Too far behind: drop the backlog instead of spiralling
            accumulator_ = 0.0f;
            break;
        }
        stepSynchronized();
        accumulator_ -= dt;
        ++steps;
    }
    return steps;
}

// ── Queries ───────────────────────────────────────────────────────────────

RigidBody* World::getBody(BodyId id) {
    return findLocked(id);
}

const RigidBody* World::getBody(BodyId id) const {
    return findLocked(id);
}

std::size_t World::bodyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bodies_.size();
}

std::optional<OwnerId> World::ownerOf(BodyId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ownership_.ownerOf(id);
}

std::vector<BodyId> World::ownedBy(OwnerId owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* list = ownership_.owned(owner);
    return list ? *list : std::vector<BodyId>{};
}

std::size_t World::polygonVertexCount(BodyId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const RigidBody* body = findLocked(id);
    if (!body || !body->isPolygon()) return 0;
    if (const std::size_t n = registry_.vertexCount(id)) return n;
    return 4; // bounding-rectangle fallback
}

std::vector<Vec2> World::polygonVertices(BodyId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const RigidBody* body = findLocked(id);
    if (!body || !body->isPolygon()) return {};
    return CollisionDetector::polygonFor(*body, registry_);
}

std::size_t World::registryEntryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.size();
}

void World::dumpPolygonRegistry(std::ostream& os) const {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.dump(os);
}

void World::logPolygonInfo(std::ostream& os, BodyId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const RigidBody* body = findLocked(id);
    if (!body) {
        os << "Body " << id << " not found\n";
        return;
    }
    if (!body->isPolygon()) {
        os << "Body " << id << " is not a polygon: " << body->shape.type << '\n';
        return;
    }

    const std::vector<Vec2> verts = CollisionDetector::polygonFor(*body, registry_);
    os << "Polygon " << id << " at " << body->position << ", size "
       << body->shape.width << "x" << body->shape.height
       << ", " << verts.size() << " vertices"
       << (registry_.contains(id) ? "" : " (bounding box)") << '\n';
    for (std::size_t i = 0; i < verts.size(); ++i) {
        os << "  vertex " << i << ": " << verts[i] << '\n';
    }
}

std::vector<BodySnapshot> World::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::unordered_map<BodyId, const ParticipantId*> participantOf;
    participantOf.reserve(participants_.size());
    for (const auto& [pid, bid] : participants_) participantOf[bid] = &pid;

    std::vector<BodySnapshot> out;
    out.reserve(bodies_.size());
    for (const RigidBody& b : bodies_) {
        BodySnapshot s;
        s.id       = b.id;
        s.owner    = ownership_.ownerOf(b.id);
        s.shape    = b.shape.type;
        s.position = b.position;
        s.velocity = b.velocity;
        s.width    = b.shape.width;
        s.height   = b.shape.height;
        s.radius   = b.shape.radius;
        s.mass     = b.mass;
        s.movable  = b.movable;

        const auto p = participantOf.find(b.id);
        if (p != participantOf.end()) s.participant = *p->second;

        out.push_back(std::move(s));
    }
    return out;
}

} // namespace arena
