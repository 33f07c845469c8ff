#pragma once

#include <cstddef>
#include <cstdint>

// defaults of the kinetics engine and the distribution model
namespace gaskit::defaults {

	// ---- kinetics ----
	inline constexpr size_t particle_count = 50;
	inline constexpr double domain_width = 400;
	inline constexpr double domain_height = 400;
	inline constexpr double particle_radius = 5;
	inline constexpr double restitution = 0.9;
	inline constexpr double speed_scale = 0.5;		// mean speed = speed_scale * sqrt(T)
	inline constexpr double temperature = 300;
	inline constexpr uint64_t seed = 42;

	// ---- temperature range accepted from the user ----
	inline constexpr double min_temperature = 100;
	inline constexpr double max_temperature = 500;

	// ---- distribution ----
	inline constexpr double effective_temperature_scale = 0.5;
	inline constexpr double effective_temperature_offset = 50;
	inline constexpr double sharpness = 2;
	inline constexpr double population = 50;
	inline constexpr double density_multiplier = 0.72;
	inline constexpr double energy_max = 600;
	inline constexpr double energy_step = 1;
	inline constexpr double activation_threshold = 400;
	inline constexpr double catalyst_activation_threshold = 300;

}
