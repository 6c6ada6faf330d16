#include <gtest/gtest.h>
#include "poolshot/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);  // Parameterized constructor
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    v *= 0.5;
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 1.5);
}

TEST(VectorMathTest, VectorLength) {
    EXPECT_DOUBLE_EQ(Vector(3.0, 4.0).length(), 5.0);
    EXPECT_DOUBLE_EQ(Vector().length(), 0.0);
}

TEST(VectorMathTest, BearingFollowsScreenConvention) {
    EXPECT_DOUBLE_EQ(Vector(1.0, 0.0).bearingDegrees(), 0.0);
    EXPECT_DOUBLE_EQ(Vector(0.0, 1.0).bearingDegrees(), 90.0);   // downward on screen
    EXPECT_DOUBLE_EQ(Vector(-1.0, 0.0).bearingDegrees(), 180.0);
    EXPECT_DOUBLE_EQ(Vector(0.0, -1.0).bearingDegrees(), -90.0);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position moved = p1 + Vector(3.0, 4.0);
    EXPECT_DOUBLE_EQ(moved.x, 4.0);
    EXPECT_DOUBLE_EQ(moved.y, 6.0);

    Vector between = p2 - p1;
    EXPECT_DOUBLE_EQ(between.x, 2.0);
    EXPECT_DOUBLE_EQ(between.y, 2.0);

    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)
}

TEST(VectorMathTest, PositionEquality) {
    EXPECT_EQ(Position(1.5, 2.5), Position(1.5, 2.5));
    EXPECT_FALSE(Position(1.5, 2.5) == Position(1.5, 2.50001));
}

TEST(VectorMathTest, DisplacementByScaledVelocity) {
    // Movement integrates as pos + vel * dt
    Position const p(10.0, 20.0);
    Vector const vel(5.0, -2.5);
    Position const next = p + vel * 0.08;
    EXPECT_NEAR(next.x, 10.4, 1e-12);
    EXPECT_NEAR(next.y, 19.8, 1e-12);
}
