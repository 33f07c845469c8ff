#pragma once

#include <string>

#include "gaskit/base/types.hpp"


namespace gaskit::env {

	// one gas molecule. All particles of an ensemble share the same radius.
	struct Particle {
		vec2 position;      					// The position of the particle.
		vec2 velocity;      					// The velocity of the particle.
		double radius{};						// The radius of the particle.

		// fluent setters
		Particle& at(const vec2& p) noexcept {
			position = p; return *this;
		}
		Particle& at(const vec2::type x, const vec2::type y) noexcept {
			position = {x, y}; return *this;
		}
		Particle& with_velocity(const vec2& v) noexcept {
			velocity = v; return *this;
		}
		Particle& with_velocity(const vec2::type x, const vec2::type y) noexcept {
			velocity = {x, y}; return *this;
		}
		Particle& with_radius(const double r) noexcept {
			radius = r; return *this;
		}

		[[nodiscard]] double speed() const noexcept {
			return velocity.norm();
		}

		// kinetic energy of a unit mass particle
		[[nodiscard]] double kinetic_energy() const noexcept {
			return 0.5 * velocity.norm_squared();
		}

		bool operator==(const Particle&) const = default;
	};

	std::string particle_to_string(const Particle& p);

} // namespace gaskit::env
