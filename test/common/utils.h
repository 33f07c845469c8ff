#pragma once

#include <vector>

# include "gaskit/gaskit.hpp"

using namespace gaskit;


inline Particle make_particle(const vec2 & position, const vec2 & velocity = {0, 0}, const double radius = 1.0) {
	return Particle().at(position).with_velocity(velocity).with_radius(radius);
}

// builds a system from explicitly placed particles, temperature and restitution as given
inline System make_system(
	const std::vector<Particle> & particles,
	const vec2 & extent = {100, 100},
	const double radius = 1.0,
	const double temperature = 300,
	const double restitution = 0.9,
	const double speed_scale = 0.5) {

	Environment env;
	env.with_particles(particles)
	   .with_extent(extent)
	   .with_radius(radius)
	   .with_temperature(temperature)
	   .with_restitution(restitution)
	   .with_speed_scale(speed_scale);
	return build_system(env);
}

inline bool disc_inside(const Particle & p, const Box & box, const double tol = 1e-9) {
	return p.position.x >= box.min.x + p.radius - tol && p.position.x <= box.max.x - p.radius + tol &&
		   p.position.y >= box.min.y + p.radius - tol && p.position.y <= box.max.y - p.radius + tol;
}

inline double mean_speed(const std::vector<Particle> & particles) {
	if (particles.empty()) return 0.0;
	double sum = 0.0;
	for (const auto & p : particles) sum += p.velocity.norm();
	return sum / static_cast<double>(particles.size());
}
