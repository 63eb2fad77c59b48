#include <gtest/gtest.h>
#include "contagion/math/point.hpp"

TEST(PointTest, PointConstruction) {
    Point p1;  // Default constructor
    EXPECT_DOUBLE_EQ(p1.x, 0.0);
    EXPECT_DOUBLE_EQ(p1.y, 0.0);

    Point p2(3.0, -4.0);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, -4.0);
}

TEST(PointTest, PointAddition) {
    Point a(1.0, 2.0);
    Point b(3.0, -4.0);

    Point sum = a.add(b);
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, -2.0);

    // Operands are left untouched
    EXPECT_DOUBLE_EQ(a.x, 1.0);
    EXPECT_DOUBLE_EQ(b.y, -4.0);

    EXPECT_EQ(a + b, sum);
    EXPECT_EQ(add(a, b), sum);

    a += b;
    EXPECT_EQ(a, sum);
}

TEST(PointTest, Distance) {
    Point a(0.0, 0.0);
    Point b(3.0, 4.0);

    EXPECT_DOUBLE_EQ(a.distance(b), 5.0);
    EXPECT_DOUBLE_EQ(distance(a, b), 5.0);
}

TEST(PointTest, DistanceIsSymmetric) {
    const Point points[] = {
        Point(0.0, 0.0), Point(-12.5, 7.25), Point(199.0, -200.0), Point(1e-3, 3e3)
    };

    for (const auto& a : points) {
        EXPECT_DOUBLE_EQ(a.distance(a), 0.0);
        for (const auto& b : points) {
            EXPECT_DOUBLE_EQ(a.distance(b), b.distance(a));
            EXPECT_GE(a.distance(b), 0.0);
        }
    }
}

TEST(PointTest, NearlyEqual) {
    EXPECT_TRUE(nearlyEqual(1.0, 1.0 + 1e-12));
    EXPECT_FALSE(nearlyEqual(1.0, 1.001));
    EXPECT_TRUE(nearlyEqual(1.0, 1.001, 0.01));
}
