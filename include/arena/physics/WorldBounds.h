#pragma once
/// @file WorldBounds.h
/// @brief Axis-aligned rectangle that movable bodies are clamped into.

#include <iostream>

namespace arena {

/// Playable area. Set when a map loads; read-only while ticking.
struct WorldBounds {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = 1600.0f;
    float maxY = 1200.0f;

    float width()  const { return maxX - minX; }
    float height() const { return maxY - minY; }

    friend std::ostream& operator<<(std::ostream& os, const WorldBounds& b) {
        return os << "[" << b.minX << ", " << b.minY << "] - ["
                  << b.maxX << ", " << b.maxY << "]";
    }
};

} // namespace arena
