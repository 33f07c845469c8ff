#include "gaskit/system/build.hpp"

#include <cmath>
#include <string>
#include <stdexcept>
#include <utility>

#include "gaskit/math/random.hpp"


namespace gaskit::core::internal {

	void validate_environment(const env::internal::EnvironmentData & data) {
		if (data.particles.empty() && data.particle_count == 0) {
			throw std::invalid_argument("Ensemble is empty: set a particle count or add particles.");
		}

		if (!(data.extent.x > 0) || !(data.extent.y > 0)) {
			throw std::invalid_argument(
				"Domain extent must be positive on both axes. Got: " + data.extent.to_string());
		}

		if (!(data.radius > 0)) {
			throw std::invalid_argument(
				"Particle radius must be positive. Got: " + std::to_string(data.radius));
		}

		if (2 * data.radius > data.extent.min()) {
			throw std::invalid_argument(
				"Particle of radius " + std::to_string(data.radius) +
				" does not fit into a domain of extent " + data.extent.to_string());
		}

		if (!(data.restitution > 0 && data.restitution < 1)) {
			throw std::invalid_argument(
				"Restitution coefficient must lie in (0, 1). Got: " + std::to_string(data.restitution));
		}

		if (!(data.speed_scale >= 0)) {
			throw std::invalid_argument(
				"Speed scale cannot be negative. Got: " + std::to_string(data.speed_scale));
		}

		if (!(data.temperature >= 0)) {
			throw std::invalid_argument(
				"Initial temperature cannot be negative. Got: " + std::to_string(data.temperature));
		}
	}


	std::vector<env::Particle> sample_particles(const env::internal::EnvironmentData & data, const env::Box & box) {
		auto engine = math::make_random_engine(data.seed);

		const double speed = data.speed_scale * std::sqrt(data.temperature);

		std::vector<env::Particle> particles;
		particles.reserve(data.particle_count);

		for (size_t i = 0; i < data.particle_count; ++i) {
			// the first wall pass pulls particles sampled too close to a face back inside
			const double x = math::uniform(box.min.x, box.max.x, engine);
			const double y = math::uniform(box.min.y, box.max.y, engine);

			particles.push_back(env::Particle()
				.at(x, y)
				.with_velocity(math::random_velocity(speed, engine))
				.with_radius(data.radius));
		}

		return particles;
	}

} // namespace gaskit::core::internal


namespace gaskit::core {

	System build_system(const env::Environment & environment, BuildInfo * build_info) {
		const auto & data = env::internal::get_env_data(environment);
		internal::validate_environment(data);

		const auto box = env::Box::from_extent(data.extent);

		std::vector<env::Particle> particles;
		const bool generated = data.particles.empty();
		if (generated) {
			particles = internal::sample_particles(data, box);
		} else {
			particles = data.particles;
			for (auto & p : particles) {
				p.radius = data.radius;
			}
		}

		System system(
			box,
			std::move(particles),
			collision::Inelastic(data.restitution),
			controller::MeanSpeedThermostat(data.speed_scale),
			data.temperature
		);

		if (build_info) {
			build_info->generated_particles = generated;
			build_info->particle_count = system.size();
			build_info->seed = data.seed;
			build_info->simulation_box = box;
			build_info->initial_mean_speed = system.mean_speed();
		}

		return system;
	}

} // namespace gaskit::core
