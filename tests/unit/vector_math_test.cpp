#include <gtest/gtest.h>
#include "gunpong/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_FLOAT_EQ(v1.x, 0.0F);
    EXPECT_FLOAT_EQ(v1.y, 0.0F);

    Vector v2(3.0F, 4.0F);  // Parameterized constructor
    EXPECT_FLOAT_EQ(v2.x, 3.0F);
    EXPECT_FLOAT_EQ(v2.y, 4.0F);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0F, 2.0F);
    Vector v2(3.0F, 4.0F);

    // Test operator+
    Vector result = v1 + v2;
    EXPECT_FLOAT_EQ(result.x, 4.0F);
    EXPECT_FLOAT_EQ(result.y, 6.0F);

    // Test operator+=
    v1 += v2;
    EXPECT_FLOAT_EQ(v1.x, 4.0F);
    EXPECT_FLOAT_EQ(v1.y, 6.0F);

    // Test operator-=
    v1 -= v2;
    EXPECT_EQ(v1, Vector(1.0F, 2.0F));
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0F, 3.0F);

    Vector mult_result = v * 2.0F;
    EXPECT_FLOAT_EQ(mult_result.x, 4.0F);
    EXPECT_FLOAT_EQ(mult_result.y, 6.0F);

    Vector div_result = v / 0.5F;
    EXPECT_FLOAT_EQ(div_result.x, 4.0F);
    EXPECT_FLOAT_EQ(div_result.y, 6.0F);

    v *= 0.95F;
    EXPECT_FLOAT_EQ(v.x, 1.9F);

    Vector neg = -v;
    EXPECT_FLOAT_EQ(neg.y, -v.y);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0F, 4.0F);

    EXPECT_FLOAT_EQ(v.length(), 5.0F);
    EXPECT_FLOAT_EQ(v.lengthSquared(), 25.0F);

    Vector unit = v.normalized();
    EXPECT_FLOAT_EQ(unit.length(), 1.0F);
    EXPECT_FLOAT_EQ(unit.x, 0.6F);

    // Zero vector stays zero instead of producing NaN
    Vector zero = Vector().normalized();
    EXPECT_EQ(zero, Vector());

    Vector v5(1.0F, 2.0F);
    Vector v6(3.0F, -1.0F);
    EXPECT_FLOAT_EQ(v5.dotProduct(v6), 1.0F);
}

TEST(VectorMathTest, ComponentDivide) {
    Vector offset(8.0F, -32.0F);
    Vector scaled = offset.componentDivide(Vector(16.0F, 64.0F));
    EXPECT_FLOAT_EQ(scaled.x, 0.5F);
    EXPECT_FLOAT_EQ(scaled.y, -0.5F);
}

TEST(VectorMathTest, NearlyEqual) {
    EXPECT_TRUE(nearlyEqual(1.0F, 1.0F + 1e-6F));
    EXPECT_FALSE(nearlyEqual(1.0F, 1.001F));
    EXPECT_TRUE(nearlyEqual(1.0F, 1.001F, 0.01F));
    EXPECT_NE(Vector(1.0F, 0.0F), Vector(0.0F, 1.0F));
}
