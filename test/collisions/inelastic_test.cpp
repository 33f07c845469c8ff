#include <gtest/gtest.h>
#include "utils.h"

using namespace gaskit;


TEST(InelasticCollisionTest, OverlapIsStrict) {
	const auto a = make_particle({0, 0}, {}, 1.0);
	EXPECT_TRUE(Inelastic::overlaps(a, make_particle({1.9, 0}, {}, 1.0)));
	EXPECT_FALSE(Inelastic::overlaps(a, make_particle({2.0, 0}, {}, 1.0)));
	EXPECT_FALSE(Inelastic::overlaps(a, make_particle({3.0, 0}, {}, 1.0)));
}

// head on: relative normal velocity after = -e * before, momentum conserved
TEST(InelasticCollisionTest, Resolve_HeadOnImpact) {
	const Inelastic collision(0.9);
	auto a = make_particle({0, 0}, {1, 0}, 1.0);
	auto b = make_particle({1.5, 0}, {-1, 0}, 1.0);

	EXPECT_EQ(collision.resolve(a, b), Contact::Impact);

	const double rel_after = (b.velocity - a.velocity).x;
	EXPECT_NEAR(rel_after, 0.9 * 2.0, 1e-12);
	EXPECT_NEAR((a.velocity + b.velocity).x, 0.0, 1e-12);
	EXPECT_NEAR(a.velocity.x, -0.9, 1e-12);
	EXPECT_NEAR(b.velocity.x, 0.9, 1e-12);

	// overlap of 0.5 split evenly
	EXPECT_NEAR(a.position.x, -0.25, 1e-12);
	EXPECT_NEAR(b.position.x, 1.75, 1e-12);
	EXPECT_GE((b.position - a.position).norm(), a.radius + b.radius - 1e-9);
}

// only the normal component changes
TEST(InelasticCollisionTest, Resolve_KeepsTangentialVelocity) {
	const Inelastic collision(0.5);
	auto a = make_particle({0, 0}, {1, 2}, 1.0);
	auto b = make_particle({1, 0}, {0, -3}, 1.0);

	EXPECT_EQ(collision.resolve(a, b), Contact::Impact);
	EXPECT_DOUBLE_EQ(a.velocity.y, 2);
	EXPECT_DOUBLE_EQ(b.velocity.y, -3);
	EXPECT_NEAR((b.velocity - a.velocity).x, 0.5, 1e-12);
}

TEST(InelasticCollisionTest, Resolve_SeparatingPairOnlyMovesApart) {
	const Inelastic collision(0.9);
	auto a = make_particle({0, 0}, {-1, 0}, 1.0);
	auto b = make_particle({1, 0}, {1, 0}, 1.0);

	EXPECT_EQ(collision.resolve(a, b), Contact::Separating);
	EXPECT_DOUBLE_EQ(a.velocity.x, -1);
	EXPECT_DOUBLE_EQ(b.velocity.x, 1);
	EXPECT_NEAR((b.position - a.position).norm(), 2.0, 1e-12);
}

TEST(InelasticCollisionTest, Resolve_NonOverlappingPairUntouched) {
	const Inelastic collision(0.9);
	const auto a0 = make_particle({0, 0}, {1, 0}, 1.0);
	const auto b0 = make_particle({5, 0}, {-1, 0}, 1.0);
	auto a = a0;
	auto b = b0;

	EXPECT_EQ(collision.resolve(a, b), Contact::None);
	EXPECT_EQ(a, a0);
	EXPECT_EQ(b, b0);
}

TEST(InelasticCollisionTest, Resolve_CoincidentCentresSkipped) {
	const Inelastic collision(0.9);
	const auto a0 = make_particle({3, 3}, {1, 0}, 1.0);
	const auto b0 = make_particle({3, 3}, {-1, 0}, 1.0);
	auto a = a0;
	auto b = b0;

	EXPECT_EQ(collision.resolve(a, b), Contact::Coincident);
	EXPECT_EQ(a, a0);
	EXPECT_EQ(b, b0);
}

// touching discs closing in: after the impulse they no longer approach
TEST(InelasticCollisionTest, Collide_TouchingClosingPair) {
	const Inelastic collision(0.9);
	auto a = make_particle({0, 0}, {1, 0}, 1.0);
	auto b = make_particle({2, 0}, {-1, 0}, 1.0);

	EXPECT_TRUE(collision.collide(a, b));

	const vec2 normal = (b.position - a.position) / (b.position - a.position).norm();
	EXPECT_GE((b.velocity - a.velocity).dot(normal), 0.0);
	EXPECT_GE((b.position - a.position).norm(), a.radius + b.radius - 1e-12);
}

TEST(InelasticCollisionTest, Collide_CoincidentReturnsFalse) {
	const Inelastic collision(0.9);
	auto a = make_particle({1, 1}, {1, 0}, 1.0);
	auto b = make_particle({1, 1}, {-1, 0}, 1.0);
	EXPECT_FALSE(collision.collide(a, b));
	EXPECT_DOUBLE_EQ(a.velocity.x, 1);
}
