#include "gaskit/env/particle.hpp"
#include <sstream>


namespace gaskit::env {

	std::string particle_to_string(const Particle& p) {
		std::ostringstream oss;
		oss << "Position: " << p.position[0] << " " << p.position[1] << "\n"
			<< "Velocity: " << p.velocity[0] << " " << p.velocity[1] << "\n"
			<< "Radius: " << p.radius << "\n";
		return oss.str();
	}

}
