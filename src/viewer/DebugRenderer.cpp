/// @file DebugRenderer.cpp
/// @brief Fixed-function GL drawing of bounds, bodies, velocities and contacts.

#include "arena/viewer/DebugRenderer.h"
#include "arena/physics/CollisionDetector.h"

#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>

namespace arena::viewer {

// ── Helpers ───────────────────────────────────────────────────────────────

namespace {

/// Golden-ratio hue stepping so neighbouring ids get distinct colours.
void setHueColor(BodyId id) {
    const float h = std::fmod(static_cast<float>(id) * 0.618034f, 1.0f) * 6.0f;
    const float f = h - std::floor(h);
    float r = 0.f, g = 0.f, b = 0.f;
    switch (static_cast<int>(h) % 6) {
        case 0: r = 1.f;     g = f;       b = 0.f;     break;
        case 1: r = 1.f - f; g = 1.f;     b = 0.f;     break;
        case 2: r = 0.f;     g = 1.f;     b = f;       break;
        case 3: r = 0.f;     g = 1.f - f; b = 1.f;     break;
        case 4: r = f;       g = 0.f;     b = 1.f;     break;
        default: r = 1.f;    g = 0.f;     b = 1.f - f; break;
    }
    glColor3f(0.35f + 0.65f * r, 0.35f + 0.65f * g, 0.35f + 0.65f * b);
}

void lineLoop(const std::vector<Vec2>& verts) {
    glBegin(GL_LINE_LOOP);
    for (const Vec2& v : verts) glVertex2f(v.x, v.y);
    glEnd();
}

void line(const Vec2& a, const Vec2& b) {
    glBegin(GL_LINES);
    glVertex2f(a.x, a.y);
    glVertex2f(b.x, b.y);
    glEnd();
}

} // namespace

// ── View control ──────────────────────────────────────────────────────────

void DebugRenderer::fit(const WorldBounds& bounds, int viewportW, int viewportH) {
    center_ = Vec2((bounds.minX + bounds.maxX) * 0.5f, (bounds.minY + bounds.maxY) * 0.5f);
    const float zx = static_cast<float>(viewportW) / std::max(bounds.width(), 1.f);
    const float zy = static_cast<float>(viewportH) / std::max(bounds.height(), 1.f);
    zoom_ = 0.95f * std::min(zx, zy);
}

void DebugRenderer::pan(float dxPixels, float dyPixels) {
    center_ -= Vec2(dxPixels, dyPixels) / zoom_;
}

void DebugRenderer::zoomBy(float scrollSteps) {
    zoom_ = std::clamp(zoom_ * std::pow(1.1f, scrollSteps), 0.05f, 20.f);
}

Vec2 DebugRenderer::screenToWorld(float px, float py, int viewportW, int viewportH) const {
    return center_ + Vec2(px - 0.5f * static_cast<float>(viewportW),
                          py - 0.5f * static_cast<float>(viewportH)) / zoom_;
}

// ── Drawing ───────────────────────────────────────────────────────────────

void DebugRenderer::beginFrame(int viewportW, int viewportH) const {
    glClearColor(0.06f, 0.07f, 0.10f, 1.f);
    glClear(GL_COLOR_BUFFER_BIT);

    const float hw = 0.5f * static_cast<float>(viewportW) / zoom_;
    const float hh = 0.5f * static_cast<float>(viewportH) / zoom_;

    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    // top < bottom flips y so world y grows downward
    glOrtho(center_.x - hw, center_.x + hw, center_.y + hh, center_.y - hh, -1.0, 1.0);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();
}

void DebugRenderer::drawWorld(const World& world, bool showVelocities, bool showContacts) const {
    const WorldBounds b = world.config().bounds;

    glLineWidth(2.f);
    glColor3f(0.5f, 0.5f, 0.55f);
    lineLoop({{b.minX, b.minY}, {b.maxX, b.minY}, {b.maxX, b.maxY}, {b.minX, b.maxY}});

    glLineWidth(1.5f);
    for (const RigidBody& body : world.bodies()) {
        drawBody(world, body);
    }

    if (showVelocities) {
        glColor3f(0.3f, 1.f, 0.4f);
        for (const RigidBody& body : world.bodies()) {
            if (!body.isMovable() || body.velocity.isZero()) continue;
            line(body.position, body.position + body.velocity * 0.25f);
        }
    }

    if (showContacts) {
        glColor3f(1.f, 0.9f, 0.2f);
        for (const Contact& c : world.lastContacts()) {
            const Vec2& p = c.info.contactPoint;
            const float s = 4.f / zoom_;
            line(p - Vec2(s, s), p + Vec2(s, s));
            line(p - Vec2(s, -s), p + Vec2(s, -s));
            line(p, p + c.info.mtv * 4.f);
        }
    }
}

void DebugRenderer::drawBody(const World& world, const RigidBody& body) const {
    if (!body.isMovable()) {
        glColor3f(0.85f, 0.35f, 0.3f);
    } else {
        setHueColor(body.id);
    }
    lineLoop(CollisionDetector::polygonFor(body, world.polygons()));
}

} // namespace arena::viewer
