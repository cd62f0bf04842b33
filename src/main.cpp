/// @file main.cpp
/// @brief 2D debug viewer: a sample arena driven by World::update().
///
/// Controls
/// ────────
///   SPACE        pause / resume
///   R            reset scene
///   V            toggle velocity vectors
///   C            toggle contact visualisation
///   D            dump the polygon registry to stdout
///   O            remove every collider of the scripted object
///   ESC          quit
///   Left drag    pan
///   Scroll       zoom in / out
///   Right click  spawn a circle owned by the scripted object

#include "arena/viewer/Window.h"
#include "arena/viewer/FrameClock.h"
#include "arena/viewer/DebugRenderer.h"

#include "arena/physics/Collider.h"
#include "arena/world/World.h"

#include <GLFW/glfw3.h>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

using namespace arena;
using namespace arena::viewer;

namespace {

constexpr OwnerId kScriptedObject = 1;
constexpr OwnerId kDebrisSpawner  = 2;
const ParticipantId kLocalParticipant = "local";

/* ── Scene setup ─────────────────────────────────────────────────────── */

void setupScene(World& world)
{
    const WorldBounds b = world.bounds();

    // Interior walls built from tile templates on a 32-unit grid
    ColliderTemplate wallTile;
    wallTile.width  = 32.f;
    wallTile.height = 32.f;
    for (int i = 0; i < 12; ++i) {
        const float x = 400.f + 32.f * static_cast<float>(i);
        if (auto c = makeColliderFromTemplate(x, 300.f, wallTile)) world.addStatic(std::move(*c));
        if (auto c = makeColliderFromTemplate(x, 860.f, wallTile)) world.addStatic(std::move(*c));
    }

    // Round pillars (circle templates, radius 20, inset by 4)
    ColliderTemplate pillarTile;
    pillarTile.type    = ShapeType::Circle;
    pillarTile.offsetX = 4.f;
    pillarTile.offsetY = 4.f;
    pillarTile.radius  = 20.f;
    for (int i = 0; i < 4; ++i) {
        const float x = 300.f + 300.f * static_cast<float>(i);
        if (auto c = makeColliderFromTemplate(x, 580.f, pillarTile)) world.addStatic(std::move(*c));
    }

    // A ramp-shaped polygon from map data
    if (auto ramp = makePolygonCollider({{1200.f, 200.f}, {1400.f, 200.f}, {1400.f, 320.f}})) {
        world.addStatic(std::move(*ramp));
    }

    // Scripted object: a hexagon and two crates
    std::vector<Vec2> hex;
    for (int i = 0; i < 6; ++i) {
        const float a = static_cast<float>(i) * 3.14159265f / 3.f;
        hex.emplace_back(200.f + 40.f * std::cos(a), 1000.f + 40.f * std::sin(a));
    }
    if (auto c = makePolygonCollider(hex)) {
        world.addOwned(kScriptedObject, std::move(c->body), std::move(c->vertices));
    }
    world.addOwned(kScriptedObject, RigidBody::makeRectangle(48.f, 48.f, 0.f, {320.f, 1000.f}));
    world.addOwned(kScriptedObject, RigidBody::makeRectangle(48.f, 48.f, 0.f, {380.f, 1000.f}));

    // Loose movable bodies from a spawner object
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> posX(b.minX + 50.f, b.maxX - 50.f);
    std::uniform_real_distribution<float> posY(b.minY + 50.f, b.maxY - 50.f);
    std::uniform_real_distribution<float> vel(-250.f, 250.f);
    for (int i = 0; i < 24; ++i) {
        RigidBody body = (i % 2 == 0)
            ? RigidBody::makeCircle(12.f, 2.f, {posX(rng), posY(rng)})
            : RigidBody::makeRectangle(24.f, 24.f, 2.f, {posX(rng), posY(rng)});
        body.velocity = {vel(rng), vel(rng)};
        world.addOwned(kDebrisSpawner, body);
    }

    // The local participant
    world.addParticipantBody(kLocalParticipant, RigidBody::makeParticipant({b.width() * 0.5f, 100.f}));
    world.setParticipantVelocity(kLocalParticipant, {0.f, 400.f});
}

void resetScene(World& world) {
    world.reset();
    setupScene(world);
}

} // namespace

/* ── Entry point ─────────────────────────────────────────────────────── */

int main()
{
    std::cout <<
        "Arena Physics: Debug Viewer\n"
        "Controls:\n"
        "  SPACE        pause/resume\n"
        "  R            reset scene\n"
        "  V            toggle velocity vectors\n"
        "  C            toggle contact visualisation\n"
        "  D            dump polygon registry\n"
        "  O            remove scripted object colliders\n"
        "  ESC          quit\n"
        "  Left drag    pan\n"
        "  Scroll       zoom in/out\n"
        "  Right click  spawn circle\n"
        "\n";

    try {
        // ── Create window + GL context ────────────────────────────────────
        Window window(1280, 960, "Arena Physics");

        // ── Build the world ───────────────────────────────────────────────
        World world;
        setupScene(world);
        std::cout << "[viewer] scene ready: " << world.bodyCount() << " bodies, "
                  << world.registryEntryCount() << " polygons, bounds "
                  << world.bounds() << '\n';

        DebugRenderer renderer;
        renderer.fit(world.bounds(), window.width(), window.height());
        FrameClock clock;

        // ── Application state ─────────────────────────────────────────────
        bool paused         = false;
        bool showVelocities = true;
        bool showContacts   = true;

        // ── Render loop ───────────────────────────────────────────────────
        while (!window.shouldClose())
        {
            const float dt = clock.tick();

            const FrameInput input = window.takeInput();

            if (input.pressed(GLFW_KEY_ESCAPE)) { break; }
            if (input.pressed(GLFW_KEY_SPACE))  { paused = !paused; }
            if (input.pressed(GLFW_KEY_V))      { showVelocities = !showVelocities; }
            if (input.pressed(GLFW_KEY_C))      { showContacts   = !showContacts;   }
            if (input.pressed(GLFW_KEY_R)) {
                resetScene(world);
                std::cout << "[viewer] scene reset\n";
            }
            if (input.pressed(GLFW_KEY_D)) {
                world.dumpPolygonRegistry(std::cout);
            }
            if (input.pressed(GLFW_KEY_O)) {
                const std::size_t n = world.removeOwned(kScriptedObject);
                std::cout << "[viewer] removed " << n << " colliders of object "
                          << kScriptedObject << '\n';
            }

            if (input.rightClick) {
                const Vec2 p = renderer.screenToWorld(input.rightClick->x, input.rightClick->y,
                                                      window.width(), window.height());
                const BodyId id = world.addOwned(kScriptedObject, RigidBody::makeCircle(16.f, 0.f, p));
                std::cout << "[viewer] spawned body " << id << " at " << p << '\n';
            }

            renderer.pan(input.drag.x, input.drag.y);
            renderer.zoomBy(input.scrollSteps);

            if (!paused) {
                world.update(dt);
            }

            renderer.beginFrame(window.width(), window.height());
            renderer.drawWorld(world, showVelocities, showContacts);
            window.swapBuffers();

            const std::string title =
                "Arena Physics  |  FPS: " + std::to_string(static_cast<int>(clock.fps()))
                + "  |  Bodies: "   + std::to_string(world.bodies().size())
                + "  |  Contacts: " + std::to_string(world.lastContacts().size())
                + "  |  Tick: "     + std::to_string(world.tickCount())
                + (paused ? "  |  PAUSED" : "");
            window.setTitle(title);
        }
    } catch (const std::exception& e) {
        std::cerr << "[viewer] " << e.what() << '\n';
        return 1;
    }
    return 0;
}
