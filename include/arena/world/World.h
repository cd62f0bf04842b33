#pragma once
/// @file World.h
/// @brief The simulated world: canonical body list, polygon registry,
///        ownership index and participant bodies behind one lock.

#include "arena/physics/RigidBody.h"
#include "arena/physics/Collider.h"
#include "arena/physics/PolygonRegistry.h"
#include "arena/physics/WorldBounds.h"
#include "arena/physics/WorldStepper.h"
#include "arena/world/OwnershipIndex.h"
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena {

/// Identifier of a connected participant (session user id).
using ParticipantId = std::string;

/// Global configuration for a world.
struct WorldConfig {
    WorldBounds    bounds;                       ///< Initial playable area
    StepperConfig  stepper;                      ///< Integration parameters
    ResolverConfig resolver;                     ///< Collision response parameters
    float          maxParticipantSpeed = 300.0f; ///< Cap for participant velocity commands
    int            maxSubSteps         = 5;      ///< Fixed steps per update() before dropping time
};

/// Plain copy of one body for a storage or broadcast layer.
struct BodySnapshot {
    BodyId                 id = kInvalidBodyId;
    std::optional<OwnerId> owner;       ///< Set for script-owned colliders
    ParticipantId          participant; ///< Non-empty for participant bodies
    ShapeType              shape = ShapeType::Rectangle;
    Vec2                   position;
    Vec2                   velocity;
    float                  width   = 0.0f;
    float                  height  = 0.0f;
    float                  radius  = 0.0f;
    float                  mass    = 0.0f;
    bool                   movable = false;
};

/**
 * Owns everything the simulation mutates.
 *
 * Locking discipline:
 *   - Every add/remove entry point takes the world mutex for its whole
 *     critical section, so the body list, the polygon registry and the
 *     ownership maps are never observed out of step with each other.
 *     Each one costs O(colliders touched), not O(world size).
 *   - step() takes no lock. Call it from the same thread that performs the
 *     mutations, or use stepSynchronized()/update(), which hold the lock
 *     for the whole tick.
 *   - Ids that are unknown (already removed, never added) are no-ops.
 */
class World {
public:
    explicit World(WorldConfig cfg = {});

    World(const World&)            = delete;
    World& operator=(const World&) = delete;

    // ── Collider mutation (locked) ────────────────────────────────────────

    /// Add a collider created by an interactive object. Vertices, if any,
    /// are registered as the body's polygon. Returns the assigned id.
    BodyId addOwned(OwnerId owner, RigidBody body, std::vector<Vec2> vertices = {});

    /// Remove every collider of owner from the body list, the registry and
    /// both ownership maps. Returns the number of bodies removed.
    std::size_t removeOwned(OwnerId owner);

    /// Add a permanent map collider with no owner.
    BodyId addStatic(RigidBody body, std::vector<Vec2> vertices = {});
    BodyId addStatic(Collider collider);

    // ── Participants (locked) ─────────────────────────────────────────────

    /// Add the body for a participant. An existing body for the same
    /// participant is removed first.
    BodyId addParticipantBody(const ParticipantId& participant, RigidBody body);

    /// Remove the participant's body and any registry/ownership traces.
    bool removeParticipantBody(const ParticipantId& participant);

    /// Set the participant's velocity, clamped to maxParticipantSpeed.
    bool setParticipantVelocity(const ParticipantId& participant, const Vec2& velocity);

    /// Place the participant's body at position and stop it.
    bool teleportParticipant(const ParticipantId& participant, const Vec2& position);

    std::optional<BodyId> participantBody(const ParticipantId& participant) const;
    std::size_t           participantCount() const;

    // ── World settings (locked) ───────────────────────────────────────────

    WorldBounds bounds() const;
    void        setBounds(const WorldBounds& bounds);
    void        setGravity(const Vec2& gravity);

    /// Remove all bodies and reset tick counter and accumulator.
    void reset();

    // ── Simulation ────────────────────────────────────────────────────────

    /// Advance exactly one tick. Takes no lock (see class comment).
    void step();

    /// step() while holding the world mutex.
    void stepSynchronized();

    /// Accumulate wall time and run whole fixed ticks through
    /// stepSynchronized(). Returns the number of ticks run.
    int update(float elapsed);

    // ── Queries ───────────────────────────────────────────────────────────

    /// Canonical body list. Unsynchronised; read it from the tick thread.
    const std::vector<RigidBody>& bodies() const { return bodies_; }

    /// Body by id, or nullptr. Unsynchronised like bodies().
    RigidBody*       getBody(BodyId id);
    const RigidBody* getBody(BodyId id) const;

    std::size_t            bodyCount() const;
    std::optional<OwnerId> ownerOf(BodyId id) const;
    std::vector<BodyId>    ownedBy(OwnerId owner) const;

    /// Vertex count of a polygon body's collision outline; 0 for other shapes.
    std::size_t       polygonVertexCount(BodyId id) const;
    /// Collision outline of a polygon body; empty for other shapes.
    std::vector<Vec2> polygonVertices(BodyId id) const;
    std::size_t       registryEntryCount() const;

    void dumpPolygonRegistry(std::ostream& os) const;
    void logPolygonInfo(std::ostream& os, BodyId id) const;

    /// Copy of every body for persistence or broadcast.
    std::vector<BodySnapshot> snapshot() const;

    /// Contacts resolved during the latest tick.
    const std::vector<Contact>& lastContacts() const { return stepper_.lastContacts(); }

    uint64_t           tickCount() const { return tick_; }
    const WorldConfig& config()    const { return config_; }

    /// Read-only access to the registry for renderers on the tick thread.
    const PolygonRegistry& polygons() const { return registry_; }

private:
    mutable std::mutex mutex_;

    WorldConfig             config_;
    WorldStepper            stepper_;
    std::vector<RigidBody>  bodies_;
    std::unordered_map<BodyId, std::size_t> slots_;   ///< id -> index in bodies_
    PolygonRegistry         registry_;
    OwnershipIndex          ownership_;
    std::unordered_map<ParticipantId, BodyId> participants_;

    BodyId   nextId_      = 1;
    uint64_t tick_        = 0;
    float    accumulator_ = 0.0f;

    // ── Helpers (caller holds mutex_) ─────────────────────────────────────

    BodyId     insertLocked(RigidBody body, std::vector<Vec2> vertices);
    bool       eraseLocked(BodyId id);
    RigidBody* findLocked(BodyId id);
    const RigidBody* findLocked(BodyId id) const;
};

} // namespace arena
