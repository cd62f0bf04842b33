/// @file OwnershipIndex.cpp

#include "arena/world/OwnershipIndex.h"
#include <algorithm>

namespace arena {

void OwnershipIndex::add(OwnerId owner, BodyId body) {
    removeBody(body);
    byOwner_[owner].push_back(body);
    ownerOf_[body] = owner;
}

std::vector<BodyId> OwnershipIndex::removeOwner(OwnerId owner) {
    const auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) return {};

    std::vector<BodyId> bodies = std::move(it->second);
    byOwner_.erase(it);
    for (const BodyId b : bodies) ownerOf_.erase(b);
    return bodies;
}

bool OwnershipIndex::removeBody(BodyId body) {
    const auto rev = ownerOf_.find(body);
    if (rev == ownerOf_.end()) return false;

    const auto fwd = byOwner_.find(rev->second);
    if (fwd != byOwner_.end()) {
        auto& list = fwd->second;
        list.erase(std::remove(list.begin(), list.end(), body), list.end());
        if (list.empty()) byOwner_.erase(fwd);
    }
    ownerOf_.erase(rev);
    return true;
}

std::optional<OwnerId> OwnershipIndex::ownerOf(BodyId body) const {
    const auto it = ownerOf_.find(body);
    if (it == ownerOf_.end()) return std::nullopt;
    return it->second;
}

const std::vector<BodyId>* OwnershipIndex::owned(OwnerId owner) const {
    const auto it = byOwner_.find(owner);
    return it != byOwner_.end() ? &it->second : nullptr;
}

void OwnershipIndex::clear() {
    byOwner_.clear();
    ownerOf_.clear();
}

} // namespace arena
