#pragma once
/// @file OwnershipIndex.h
/// @brief Bidirectional owner <-> collider map for script-created colliders.

#include "arena/physics/RigidBody.h"
#include <optional>
#include <unordered_map>
#include <vector>

namespace arena {

/// Identifier of an interactive map object that can own colliders.
using OwnerId = int;

/**
 * Owner -> colliders and collider -> owner, kept in step with each other.
 * Carries no lock of its own; World serialises access to it.
 */
class OwnershipIndex {
public:
    OwnershipIndex() = default;

    /// Record body under owner. A body already owned by someone else is moved.
    void add(OwnerId owner, BodyId body);

    /// Forget every collider of owner and return them (empty if unknown).
    std::vector<BodyId> removeOwner(OwnerId owner);

    /// Forget a single collider. Returns true if it was owned.
    bool removeBody(BodyId body);

    // ── Queries ───────────────────────────────────────────────────────────

    std::optional<OwnerId> ownerOf(BodyId body) const;

    /// Colliders of owner, or nullptr if the owner has none.
    const std::vector<BodyId>* owned(OwnerId owner) const;

    std::size_t ownerCount() const { return byOwner_.size(); }
    std::size_t bodyCount()  const { return ownerOf_.size(); }

    void clear();

private:
    std::unordered_map<OwnerId, std::vector<BodyId>> byOwner_;
    std::unordered_map<BodyId, OwnerId>              ownerOf_;
};

} // namespace arena
