#pragma once

#include <cmath>
#include <string>
#include <cstdint>

#include "gaskit/base/macros.hpp"
#include "gaskit/env/particle.hpp"

namespace gaskit::collision {

	// what happened to a pair during resolution
	enum class Contact : uint8_t {
		None = 0,		// discs do not overlap
		Coincident,		// centres coincide, no normal can be defined
		Separating,		// overlap removed, no impulse (already moving apart)
		Impact			// impulse applied and overlap removed
	};

	// Inelastic hard disc collision between two particles of equal mass.
	// The impulse acts along the centre line so that the relative normal velocity
	// after the collision is -restitution times the one before.
	class Inelastic {
	public:
		explicit Inelastic(const double restitution) : restitution_(restitution) {
			GK_ASSERT(restitution > 0 && restitution < 1,
				"restitution must lie in (0, 1), got " + std::to_string(restitution));
		}

		[[nodiscard]] double restitution() const noexcept { return restitution_; }

		[[nodiscard]] static bool overlaps(const env::Particle & p1, const env::Particle & p2) noexcept {
			const vec2 d = p2.position - p1.position;
			const double r = p1.radius + p2.radius;
			return d.norm_squared() < r * r;
		}

		// velocity change only, normal points from p1 to p2 and has unit length
		GK_FORCE_INLINE void apply_impulse(env::Particle & p1, env::Particle & p2, const vec2 & normal) const noexcept {
			const double rel_vel = (p2.velocity - p1.velocity).dot(normal);
			if (rel_vel > 0) return; // already separating

			const double impulse = -(1 + restitution_) * rel_vel / 2;
			p1.velocity -= impulse * normal;
			p2.velocity += impulse * normal;
		}

		// impulse exchange along the current centre line, regardless of overlap.
		// Returns false if the centres coincide.
		bool collide(env::Particle & p1, env::Particle & p2) const noexcept {
			const vec2 d = p2.position - p1.position;
			const double dist = d.norm();
			if (dist == 0) return false;
			apply_impulse(p1, p2, d / dist);
			return true;
		}

		// pushes both discs apart along the normal by half the overlap each
		static void separate(env::Particle & p1, env::Particle & p2, const vec2 & normal, const double overlap) noexcept {
			const vec2 sep = normal * (overlap / 2);
			p1.position -= sep;
			p2.position += sep;
		}

		GK_FORCE_INLINE Contact resolve(env::Particle & p1, env::Particle & p2) const noexcept {
			const vec2 d = p2.position - p1.position;
			const double dist = d.norm();
			const double contact_dist = p1.radius + p2.radius;

			if (dist >= contact_dist) return Contact::None;
			if (dist == 0) return Contact::Coincident;

			const vec2 normal = d / dist;
			const bool closing = (p2.velocity - p1.velocity).dot(normal) <= 0;
			apply_impulse(p1, p2, normal);
			separate(p1, p2, normal, contact_dist - dist);

			return closing ? Contact::Impact : Contact::Separating;
		}

	private:
		double restitution_;
	};
}
