#pragma once

#include <cstdint>

#include "gaskit/env/environment.hpp"
#include "gaskit/env/domain.hpp"
#include "gaskit/system/system.hpp"


namespace gaskit::core {

	struct BuildInfo {
		bool generated_particles = false;	// true if the ensemble was sampled, false if taken from the environment
		size_t particle_count = 0;
		uint64_t seed = 0;
		env::Box simulation_box;
		double initial_mean_speed = 0;
	};

	namespace internal {
		// throw std::invalid_argument describing the first violated constraint
		void validate_environment(const env::internal::EnvironmentData & data);

		// uniform positions in the box, random directions, speed k * sqrt(T). Draws from its own engine seeded with data.seed
		std::vector<env::Particle> sample_particles(const env::internal::EnvironmentData & data, const env::Box & box);
	}

} // namespace gaskit::core
