#pragma once
#include <cmath>
#include <numbers>
#include <random>
#include "gaskit/base/types.hpp"

namespace gaskit::math {

	inline constexpr uint64_t default_seed = 42;

	using RandomEngine = std::default_random_engine;

	// Helper to get a thread-safe, consistent engine
	inline RandomEngine& get_random_engine() {
		thread_local RandomEngine engine(default_seed);
		return engine;
	}

	// independent engine, e.g. to make a build repeatable without touching the thread's stream
	inline RandomEngine make_random_engine(const uint64_t seed) {
		return RandomEngine(static_cast<RandomEngine::result_type>(seed));
	}

	// uniform sample in [lo, hi)
	inline double uniform(const double lo, const double hi, RandomEngine & engine = get_random_engine()) {
		std::uniform_real_distribution dist{lo, hi};
		return dist(engine);
	}

	/**
	 * Generates a unit vector with an angle drawn uniformly from [0, 2pi).
	 */
	inline vec2 random_direction(RandomEngine & engine = get_random_engine()) {
		const double angle = uniform(0.0, 2.0 * std::numbers::pi, engine);
		return {std::cos(angle), std::sin(angle)};
	}

	/**
	 * Generates a velocity vector with a uniformly random direction and a fixed magnitude.
	 * @param speed magnitude of the resulting vector
	 */
	inline vec2 random_velocity(const double speed, RandomEngine & engine = get_random_engine()) {
		return speed * random_direction(engine);
	}

}
