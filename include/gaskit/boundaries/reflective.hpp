#pragma once

#include <cmath>
#include <string>

#include "gaskit/boundaries/boundary.hpp"
#include "gaskit/env/particle.hpp"
#include "gaskit/env/domain.hpp"

namespace gaskit::boundary {

	// Hard wall: a disc crossing a face is clamped back so that it touches the face
	// and the velocity component along the face normal is forced to point inwards.
	struct Reflective {

		// returns true if the particle touched this face
		bool apply(env::Particle & particle, const env::Box & domain_box, const Face face) const noexcept {
			const int ax = axis_of_face(face);
			const double r = particle.radius;

			if (face_sign_pos(face)) {
				const double limit = domain_box.max[ax] - r;
				if (particle.position[ax] <= limit) return false;
				particle.position[ax] = limit;
				particle.velocity[ax] = -std::abs(particle.velocity[ax]);
			} else {
				const double limit = domain_box.min[ax] + r;
				if (particle.position[ax] >= limit) return false;
				particle.position[ax] = limit;
				particle.velocity[ax] = std::abs(particle.velocity[ax]);
			}
			return true;
		}

		// checks both axes independently. On each axis the near face wins,
		// the far face is only checked if the near face did not fire.
		unsigned apply(env::Particle & particle, const env::Box & domain_box) const noexcept {
			unsigned bounces = 0;
			for (uint8_t ax = 0; ax < 2; ++ax) {
				if (apply(particle, domain_box, face_of(ax, false))) {
					++bounces;
				} else if (apply(particle, domain_box, face_of(ax, true))) {
					++bounces;
				}
			}

			GK_ASSERT(domain_box.contains(particle.position, particle.radius) || domain_box.extent.min() < 2 * particle.radius,
				"particle outside of domain after wall pass! \n\t" + particle.position.to_string());
			return bounces;
		}
	};
}
