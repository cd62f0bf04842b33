/// @file benchmark.cpp
/// @brief Tick-cost benchmark: ms per fixed tick against the 1/60 s budget.

#include "arena/world/World.h"
#include "arena/physics/Collider.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace arena;
using Clock = std::chrono::high_resolution_clock;

// ── Helpers ───────────────────────────────────────────────────────────────

/// N movable bodies (circles, boxes, triangles) among a grid of static pillars.
static void populateWorld(World& world, int N) {
    const WorldBounds b = world.bounds();

    // Static scenery: a sparse grid of pillars
    for (float x = b.minX + 100.0f; x < b.maxX; x += 200.0f) {
        for (float y = b.minY + 100.0f; y < b.maxY; y += 200.0f) {
            world.addStatic(RigidBody::makeRectangle(32.0f, 32.0f, 0.0f, Vec2(x, y)));
        }
    }

    std::mt19937 rng(7);
    std::uniform_real_distribution<float> posX(b.minX + 20.0f, b.maxX - 20.0f);
    std::uniform_real_distribution<float> posY(b.minY + 20.0f, b.maxY - 20.0f);
    std::uniform_real_distribution<float> vel(-250.0f, 250.0f);

    for (int i = 0; i < N; ++i) {
        const Vec2 pos(posX(rng), posY(rng));
        RigidBody body;
        std::vector<Vec2> verts;
        switch (i % 3) {
            case 0: body = RigidBody::makeCircle(8.0f, 1.0f, pos); break;
            case 1: body = RigidBody::makeRectangle(16.0f, 16.0f, 2.0f, pos); break;
            default: {
                auto tri = makePolygonCollider({pos + Vec2(-8, -8), pos + Vec2(8, -8), pos + Vec2(0, 8)});
                body         = tri->body;
                body.mass    = 1.5f;
                body.movable = true;
                verts        = tri->vertices;
                break;
            }
        }
        body.velocity = Vec2(vel(rng), vel(rng));
        world.addOwned(i % 50, body, verts);
    }
}

/// Run `measured` ticks after a warm-up and return ms/tick.
static double timeTicks(World& world, int warmup, int measured) {
    for (int i = 0; i < warmup; ++i) world.step();

    const auto t0 = Clock::now();
    for (int i = 0; i < measured; ++i) world.step();
    const auto t1 = Clock::now();

    return std::chrono::duration<double, std::milli>(t1 - t0).count() / measured;
}

// ── Main ──────────────────────────────────────────────────────────────────

int main(int argc, char** argv) {
    const int measured = (argc > 1) ? std::max(1, std::atoi(argv[1])) : 100;
    const double budgetMs = 1000.0 / 60.0;

    std::puts("==========================================================================");
    std::puts("  Arena Physics: Tick Benchmark");
    std::puts("  Pairwise broad phase + SAT narrow phase, fixed dt = 1/60 s");
    std::puts("==========================================================================");
    std::puts("");
    std::printf("%-6s  %10s  %10s  %10s  %10s\n",
                "N", "ms/tick", "ticks/s", "contacts", "budget");
    std::puts("--------------------------------------------------------------------------");

    const std::vector<int> Ns = {50, 100, 250, 500, 1000};

    for (int N : Ns) {
        World world;
        populateWorld(world, N);

        const double ms      = timeTicks(world, 10, measured);
        const int    contacts = static_cast<int>(world.lastContacts().size());
        const double share   = 100.0 * ms / budgetMs;

        std::printf("%-6d  %10.4f  %10.1f  %10d  %9.1f%%%s\n",
                    N, ms, 1000.0 / ms, contacts, share,
                    share > 100.0 ? "  <-- over budget" : "");
    }

    std::puts("");
    std::puts("==========================================================================");
    return 0;
}
