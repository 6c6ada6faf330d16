#include <gtest/gtest.h>
#include "poolshot/algo/wall_collision.hpp"

namespace {
constexpr double kWidth = 100.0;
constexpr double kHeight = 60.0;
constexpr double kRadius = 8.0;
}

TEST(WallCollisionTest, FreeStepIsUntouched) {
    Position current(50.0, 30.0);
    Position proposed(51.0, 31.0);
    Vector velocity(1.0, 1.0);

    WallCollision hit = resolveWallStep(current, proposed, velocity, kWidth, kHeight, kRadius);

    EXPECT_FALSE(hit.collided);
    EXPECT_FALSE(hit.hitVertical);
    EXPECT_FALSE(hit.hitHorizontal);
    EXPECT_EQ(hit.point, proposed);
    EXPECT_DOUBLE_EQ(hit.velocity.x, 1.0);
    EXPECT_DOUBLE_EQ(hit.velocity.y, 1.0);
}

TEST(WallCollisionTest, RightRailClampsAndReflectsX) {
    WallCollision hit = resolveWallStep(Position(90.0, 30.0), Position(95.0, 32.0),
                                        Vector(5.0, 2.0), kWidth, kHeight, kRadius);

    EXPECT_TRUE(hit.collided);
    EXPECT_TRUE(hit.hitVertical);
    EXPECT_FALSE(hit.hitHorizontal);
    EXPECT_DOUBLE_EQ(hit.point.x, kWidth - kRadius);
    EXPECT_DOUBLE_EQ(hit.point.y, 32.0);
    EXPECT_DOUBLE_EQ(hit.velocity.x, -5.0);
    EXPECT_DOUBLE_EQ(hit.velocity.y, 2.0);
}

TEST(WallCollisionTest, LeftRailClampsAndReflectsX) {
    WallCollision hit = resolveWallStep(Position(10.0, 30.0), Position(7.0, 31.0),
                                        Vector(-3.0, 1.0), kWidth, kHeight, kRadius);

    EXPECT_TRUE(hit.collided);
    EXPECT_DOUBLE_EQ(hit.point.x, kRadius);
    EXPECT_DOUBLE_EQ(hit.velocity.x, 3.0);
    EXPECT_DOUBLE_EQ(hit.velocity.y, 1.0);
}

TEST(WallCollisionTest, TopAndBottomRailsReflectY) {
    WallCollision top = resolveWallStep(Position(50.0, 10.0), Position(51.0, 5.0),
                                        Vector(1.0, -4.0), kWidth, kHeight, kRadius);
    EXPECT_TRUE(top.hitHorizontal);
    EXPECT_FALSE(top.hitVertical);
    EXPECT_DOUBLE_EQ(top.point.y, kRadius);
    EXPECT_DOUBLE_EQ(top.point.x, 51.0);
    EXPECT_DOUBLE_EQ(top.velocity.y, 4.0);
    EXPECT_DOUBLE_EQ(top.velocity.x, 1.0);

    WallCollision bottom = resolveWallStep(Position(50.0, 50.0), Position(51.0, 54.0),
                                           Vector(1.0, 4.0), kWidth, kHeight, kRadius);
    EXPECT_TRUE(bottom.hitHorizontal);
    EXPECT_DOUBLE_EQ(bottom.point.y, kHeight - kRadius);
    EXPECT_DOUBLE_EQ(bottom.velocity.y, -4.0);
}

TEST(WallCollisionTest, CornerFlipsBothAxes) {
    WallCollision hit = resolveWallStep(Position(90.0, 50.0), Position(95.0, 55.0),
                                        Vector(5.0, 5.0), kWidth, kHeight, kRadius);

    EXPECT_TRUE(hit.collided);
    EXPECT_TRUE(hit.hitVertical);
    EXPECT_TRUE(hit.hitHorizontal);
    EXPECT_DOUBLE_EQ(hit.point.x, kWidth - kRadius);
    EXPECT_DOUBLE_EQ(hit.point.y, kHeight - kRadius);
    EXPECT_DOUBLE_EQ(hit.velocity.x, -5.0);
    EXPECT_DOUBLE_EQ(hit.velocity.y, -5.0);
}

TEST(WallCollisionTest, TouchingTheRailCounts) {
    // Leading edge exactly on the rail
    WallCollision hit = resolveWallStep(Position(90.0, 30.0), Position(kWidth - kRadius, 30.0),
                                        Vector(2.0, 0.0), kWidth, kHeight, kRadius);
    EXPECT_TRUE(hit.collided);
    EXPECT_DOUBLE_EQ(hit.velocity.x, -2.0);
}

TEST(WallCollisionTest, VelocityAlreadyPointingInwardKeepsItsSign) {
    WallCollision hit = resolveWallStep(Position(93.0, 30.0), Position(94.0, 30.0),
                                        Vector(-5.0, 0.0), kWidth, kHeight, kRadius);
    EXPECT_TRUE(hit.collided);
    EXPECT_DOUBLE_EQ(hit.velocity.x, -5.0);
}

TEST(WallCollisionTest, MagnitudeIsPreserved) {
    Vector velocity(7.0, -3.0);
    WallCollision hit = resolveWallStep(Position(88.0, 12.0), Position(95.0, 4.0),
                                        velocity, kWidth, kHeight, kRadius);
    EXPECT_DOUBLE_EQ(hit.velocity.length(), velocity.length());
}
