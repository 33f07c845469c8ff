#include <gtest/gtest.h>
#include "gaskit/base/types.hpp"

using namespace gaskit;


TEST(Vec2Test, DefaultConstructorIsZero) {
	constexpr vec2 v;
	EXPECT_EQ(v.x, 0);
	EXPECT_EQ(v.y, 0);
}

TEST(Vec2Test, SplatConstructor) {
	const vec2 v(3.5);
	EXPECT_EQ(v, vec2(3.5, 3.5));
}

TEST(Vec2Test, Arithmetic) {
	const vec2 a{1, 2};
	const vec2 b{3, -4};

	EXPECT_EQ(a + b, vec2(4, -2));
	EXPECT_EQ(a - b, vec2(-2, 6));
	EXPECT_EQ(a * b, vec2(3, -8));
	EXPECT_EQ(b / a, vec2(3, -2));
	EXPECT_EQ(-a, vec2(-1, -2));
	EXPECT_EQ(a * 2.0, vec2(2, 4));
	EXPECT_EQ(2.0 * a, vec2(2, 4));
	EXPECT_EQ(b / 2.0, vec2(1.5, -2));
}

TEST(Vec2Test, CompoundAssignment) {
	vec2 v{1, 1};
	v += {2, 3};
	EXPECT_EQ(v, vec2(3, 4));
	v -= {1, 1};
	EXPECT_EQ(v, vec2(2, 3));
	v *= 2.0;
	EXPECT_EQ(v, vec2(4, 6));
	v /= 4.0;
	EXPECT_EQ(v, vec2(1, 1.5));
}

TEST(Vec2Test, DotAndNorm) {
	const vec2 v{3, 4};
	EXPECT_DOUBLE_EQ(v.dot({1, 0}), 3);
	EXPECT_DOUBLE_EQ(v.norm_squared(), 25);
	EXPECT_DOUBLE_EQ(v.norm(), 5);
}

TEST(Vec2Test, ComponentwiseOrdering) {
	const vec2 a{1, 2};
	EXPECT_TRUE(a <= vec2(1, 3));
	EXPECT_FALSE(a <= vec2(0, 3));
	EXPECT_TRUE(vec2(2, 2) >= a);
}

TEST(Vec2Test, IndexAccess) {
	vec2 v{7, 8};
	EXPECT_EQ(v[0], 7);
	EXPECT_EQ(v[1], 8);
	v[1] = 9;
	EXPECT_EQ(v.y, 9);
}

TEST(Vec2Test, MinMaxAndPredicates) {
	const vec2 v{-1, 4};
	EXPECT_EQ(v.min(), -1);
	EXPECT_EQ(v.max(), 4);
	EXPECT_TRUE(v.any([](const double c) { return c < 0; }));
	EXPECT_FALSE(v.all([](const double c) { return c < 0; }));
}

TEST(Vec2Test, ToString) {
	EXPECT_EQ(int2(1, -2).to_string(), "{1, -2}");
}
