/// @file test_collision.cpp
/// @brief Google Test suite for CollisionDetector (broad phase, circle pairs and SAT).

#include <gtest/gtest.h>
#include <cmath>
#include <sstream>

#include "arena/physics/RigidBody.h"
#include "arena/physics/CollisionInfo.h"
#include "arena/physics/CollisionDetector.h"
#include "arena/physics/PolygonRegistry.h"

using namespace arena;

static constexpr float kEps = 1e-4f;

// Helper: check two Vec2 are approximately equal.
static void ExpectVec2Near(const Vec2& a, const Vec2& b, float eps = kEps) {
    EXPECT_NEAR(a.x, b.x, eps) << "x mismatch";
    EXPECT_NEAR(a.y, b.y, eps) << "y mismatch";
}

// Helper: polygon-typed body with an explicit id and bounding size.
static RigidBody makePolygonBody(BodyId id, const Vec2& pos, float w, float h) {
    RigidBody body = RigidBody::makeRectangle(w, h, 0.0f, pos);
    body.id         = id;
    body.shape.type = ShapeType::Polygon;
    return body;
}

// ═══════════════════════════════════════════════════════════════════════════
//  Broad Phase Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(BroadPhaseTests, CircleCircleByDistance) {
    const RigidBody a = RigidBody::makeCircle(10, 1, {0, 0});
    const RigidBody b = RigidBody::makeCircle(10, 1, {19, 0});
    const RigidBody c = RigidBody::makeCircle(10, 1, {15, 15}); // boxes overlap, circles do not
    EXPECT_TRUE(CollisionDetector::aabbOverlap(a, b));
    EXPECT_FALSE(CollisionDetector::aabbOverlap(a, c));
}

TEST(BroadPhaseTests, CircleBoxUsesClampedPoint) {
    const RigidBody box    = RigidBody::makeRectangle(20, 20, 0, {0, 0});
    const RigidBody side   = RigidBody::makeCircle(5, 1, {14, 0});
    const RigidBody corner = RigidBody::makeCircle(5, 1, {14, 14}); // outside the rounded corner
    EXPECT_TRUE(CollisionDetector::aabbOverlap(box, side));
    EXPECT_TRUE(CollisionDetector::aabbOverlap(side, box));
    EXPECT_FALSE(CollisionDetector::aabbOverlap(box, corner));
}

TEST(BroadPhaseTests, BoxBoxHalfExtents) {
    const RigidBody a = RigidBody::makeRectangle(10, 10, 1, {0, 0});
    const RigidBody b = RigidBody::makeRectangle(10, 10, 1, {9, 9});
    const RigidBody c = RigidBody::makeRectangle(10, 10, 1, {11, 0});
    EXPECT_TRUE(CollisionDetector::aabbOverlap(a, b));
    EXPECT_FALSE(CollisionDetector::aabbOverlap(a, c));
}

TEST(BroadPhaseTests, TouchingCountsAsOverlap) {
    const RigidBody a = RigidBody::makeRectangle(10, 10, 1, {0, 0});
    const RigidBody b = RigidBody::makeRectangle(10, 10, 1, {10, 0});
    EXPECT_TRUE(CollisionDetector::aabbOverlap(a, b));
}

// ═══════════════════════════════════════════════════════════════════════════
//  Circle-Circle Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(CircleCircleTests, SeparatedNoCollision) {
    const RigidBody a = RigidBody::makeCircle(10, 1, {0, 0});
    const RigidBody b = RigidBody::makeCircle(10, 1, {25, 0});
    EXPECT_FALSE(CollisionDetector::circleCircle(a, b).collided);
}

TEST(CircleCircleTests, OverlapDepthAndDirection) {
    const RigidBody a = RigidBody::makeCircle(10, 1, {0, 0});
    const RigidBody b = RigidBody::makeCircle(10, 1, {15, 0});
    const CollisionInfo info = CollisionDetector::circleCircle(a, b);
    ASSERT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 5.0f, kEps);
    ExpectVec2Near(info.mtv, {5, 0});
    ExpectVec2Near(info.contactPoint, {10, 0}); // on A's boundary
}

TEST(CircleCircleTests, SwappingArgumentsReversesMtv) {
    const RigidBody a = RigidBody::makeCircle(8, 1, {0, 0});
    const RigidBody b = RigidBody::makeCircle(6, 1, {6, 8});
    const PolygonRegistry registry;

    const CollisionInfo ab = CollisionDetector::test(a, b, registry);
    const CollisionInfo ba = CollisionDetector::test(b, a, registry);
    ASSERT_TRUE(ab.collided);
    ASSERT_TRUE(ba.collided);
    EXPECT_NEAR(ab.depth, ba.depth, kEps);
    ExpectVec2Near(ab.mtv, -ba.mtv);
    EXPECT_GT(ab.mtv.dot(b.position - a.position), 0.0f);
}

TEST(CircleCircleTests, TouchingIsCollisionWithZeroDepth) {
    const RigidBody a = RigidBody::makeCircle(10, 1, {0, 0});
    const RigidBody b = RigidBody::makeCircle(10, 1, {20, 0});
    const CollisionInfo info = CollisionDetector::circleCircle(a, b);
    EXPECT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 0.0f, kEps);
    EXPECT_TRUE(info.mtv.isZero());
}

TEST(CircleCircleTests, CoincidentCentresPushAlongX) {
    const RigidBody a = RigidBody::makeCircle(10, 1, {3, 3});
    const RigidBody b = RigidBody::makeCircle(5, 1, {3, 3});
    const CollisionInfo info = CollisionDetector::circleCircle(a, b);
    ASSERT_TRUE(info.collided);
    ExpectVec2Near(info.mtv, {10, 0});
    EXPECT_NEAR(info.depth, 15.0f, kEps);
    ExpectVec2Near(info.contactPoint, {3, 3});
}

TEST(CircleCircleTests, CoincidentCentresReverseWhenSwapped) {
    RigidBody a = RigidBody::makeCircle(10, 1, {3, 3});
    RigidBody b = RigidBody::makeCircle(10, 1, {3, 3});
    a.id = 1;
    b.id = 2;

    const CollisionInfo ab = CollisionDetector::circleCircle(a, b);
    const CollisionInfo ba = CollisionDetector::circleCircle(b, a);
    ASSERT_TRUE(ab.collided);
    ASSERT_TRUE(ba.collided);
    ExpectVec2Near(ab.mtv, {10, 0});
    ExpectVec2Near(ba.mtv, {-10, 0});
    EXPECT_NEAR(ab.depth, ba.depth, kEps);
}

// ═══════════════════════════════════════════════════════════════════════════
//  Separating Axis Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(SATTests, SeparatedRectanglesNoCollision) {
    const RigidBody a = RigidBody::makeRectangle(10, 10, 1, {0, 0});
    const RigidBody b = RigidBody::makeRectangle(10, 10, 1, {20, 0});
    EXPECT_FALSE(CollisionDetector::test(a, b, PolygonRegistry{}).collided);
}

TEST(SATTests, RectangleMtvPointsFromAToB) {
    const RigidBody a = RigidBody::makeRectangle(20, 20, 1, {0, 0});
    const RigidBody b = RigidBody::makeRectangle(20, 20, 1, {15, 5});
    const CollisionInfo info = CollisionDetector::test(a, b, PolygonRegistry{});
    ASSERT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 5.0f, kEps);
    ExpectVec2Near(info.mtv, {5, 0});
    ExpectVec2Near(info.contactPoint, {7.5f, 2.5f});

    const CollisionInfo swapped = CollisionDetector::test(b, a, PolygonRegistry{});
    ASSERT_TRUE(swapped.collided);
    ExpectVec2Near(swapped.mtv, {-5, 0});
}

TEST(SATTests, SmallestOverlapAxisChosen) {
    const RigidBody a = RigidBody::makeRectangle(20, 20, 1, {0, 0});
    const RigidBody b = RigidBody::makeRectangle(20, 20, 1, {2, 18});
    const CollisionInfo info = CollisionDetector::test(a, b, PolygonRegistry{});
    ASSERT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 2.0f, kEps);
    ExpectVec2Near(info.mtv, {0, 2});
}

TEST(SATTests, TouchingRectanglesCollideWithZeroMtv) {
    const RigidBody a = RigidBody::makeRectangle(10, 10, 1, {0, 0});
    const RigidBody b = RigidBody::makeRectangle(10, 10, 1, {10, 0});
    const CollisionInfo info = CollisionDetector::test(a, b, PolygonRegistry{});
    EXPECT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 0.0f, kEps);
    EXPECT_TRUE(info.mtv.isZero());
}

TEST(SATTests, CircleAgainstRectangleUsesPolygonPath) {
    const RigidBody circle = RigidBody::makeCircle(10, 1, {0, 0});
    const RigidBody box    = RigidBody::makeRectangle(20, 20, 0, {18, 0});
    const CollisionInfo info = CollisionDetector::test(circle, box, PolygonRegistry{});
    ASSERT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 2.0f, 1e-3f);
    EXPECT_GT(info.mtv.x, 0.0f);
    EXPECT_NEAR(info.mtv.y, 0.0f, 1e-3f);
    ExpectVec2Near(info.contactPoint, {9, 0});
}

TEST(SATTests, RegisteredPolygonIsUsed) {
    // Right triangle whose hypotenuse faces the box; its bounding box would overlap
    PolygonRegistry registry;
    const RigidBody tri = makePolygonBody(7, {5, 5}, 10, 10);
    registry.registerPolygon(7, {{0, 0}, {10, 0}, {0, 10}});

    const RigidBody box = RigidBody::makeRectangle(4, 4, 1, {9, 9});
    EXPECT_TRUE(CollisionDetector::aabbOverlap(tri, box));
    EXPECT_FALSE(CollisionDetector::test(tri, box, registry).collided);
}

TEST(SATTests, UnregisteredPolygonFallsBackToBoundingBox) {
    const RigidBody poly = makePolygonBody(9, {0, 0}, 20, 20);
    const RigidBody box  = RigidBody::makeRectangle(10, 10, 1, {12, 0});
    const CollisionInfo info = CollisionDetector::test(poly, box, PolygonRegistry{});
    ASSERT_TRUE(info.collided);
    EXPECT_NEAR(info.depth, 3.0f, kEps);
    ExpectVec2Near(info.mtv, {3, 0});
}

TEST(SATTests, DegeneratePolygonsReportNoCollision) {
    const std::vector<Vec2> point = {{1, 1}, {1, 1}, {1, 1}};
    const CollisionInfo info = CollisionDetector::polygonPolygon(point, {1, 1}, point, {1, 1});
    EXPECT_FALSE(info.collided);

    const CollisionInfo empty = CollisionDetector::polygonPolygon({}, {0, 0}, point, {1, 1});
    EXPECT_FALSE(empty.collided);
}

// ═══════════════════════════════════════════════════════════════════════════
//  Polygon Representation Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(PolygonForTests, RectangleCornersCounterClockwise) {
    const auto v = CollisionDetector::rectangleVertices({0, 0}, 4, 2);
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[0], Vec2(-2, -1));
    EXPECT_EQ(v[1], Vec2( 2, -1));
    EXPECT_EQ(v[2], Vec2( 2,  1));
    EXPECT_EQ(v[3], Vec2(-2,  1));
}

TEST(PolygonForTests, CircleIsSixteenGonOnRadius) {
    const RigidBody c = RigidBody::makeCircle(5, 1, {10, 10});
    const auto v = CollisionDetector::polygonFor(c, PolygonRegistry{});
    ASSERT_EQ(v.size(), static_cast<std::size_t>(CollisionDetector::kCircleSegments));
    for (const Vec2& p : v) {
        EXPECT_NEAR((p - c.position).length(), 5.0f, kEps);
    }
}

TEST(PolygonForTests, TooFewSegmentsFallsBackToEight) {
    EXPECT_EQ(CollisionDetector::circleVertices({0, 0}, 1, 2).size(), 8u);
}

TEST(PolygonForTests, CollisionInfoStreamOutput) {
    std::ostringstream os;
    os << CollisionInfo{};
    EXPECT_EQ(os.str(), "{no collision}");
}
