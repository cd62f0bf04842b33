#pragma once
/// @file DebugRenderer.h
/// @brief Immediate-mode 2D wireframe renderer for a World.

#include "arena/math/Vec2.h"
#include "arena/world/World.h"

namespace arena::viewer {

/**
 * Draws a World with fixed-function OpenGL.
 *
 * World space is y-down (tile-map convention): the view maps
 * center +/- (viewport / 2 / zoom) onto the framebuffer.
 *
 * Colours:
 *   - bounds: grey frame
 *   - static bodies: warm red, movable bodies: per-id hue
 *   - velocity vectors: green, contacts: yellow cross + MTV line
 *
 * Call only from the thread that ticks the world.
 */
class DebugRenderer {
public:
    DebugRenderer() = default;

    // ── View control ──────────────────────────────────────────────────────

    /// Centre the view on the bounds and pick a zoom that fits them.
    void fit(const WorldBounds& bounds, int viewportW, int viewportH);

    void pan(float dxPixels, float dyPixels);
    void zoomBy(float scrollSteps);

    /// Convert framebuffer pixels to world coordinates.
    Vec2 screenToWorld(float px, float py, int viewportW, int viewportH) const;

    // ── Drawing ───────────────────────────────────────────────────────────

    void beginFrame(int viewportW, int viewportH) const;
    void drawWorld(const World& world, bool showVelocities, bool showContacts) const;

private:
    Vec2  center_ = Vec2(800.f, 600.f);
    float zoom_   = 0.5f; ///< Pixels per world unit

    void drawBody(const World& world, const RigidBody& body) const;
};

} // namespace arena::viewer
