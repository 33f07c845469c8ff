#include "gaskit/system/system.hpp"

#include <utility>


namespace gaskit::core {

	System::System(const env::Box & box,
		std::vector<env::Particle> particles,
		const collision::Inelastic & collisions,
		const controller::MeanSpeedThermostat & thermostat,
		const double temperature)
	:
		simulation_box(box),
		ensemble(std::move(particles)),
		collisions_(collisions),
		thermostat_(thermostat),
		temperature_(temperature) {}


	void System::step() noexcept {
		stats = {};

		integrate();
		apply_boundary_conditions();
		resolve_collisions();
		// pair separation may push a disc back over a face
		apply_boundary_conditions();
		apply_thermostat();

		++step_;
	}


	void System::integrate() noexcept {
		for (auto & p : ensemble) {
			p.position += p.velocity;
		}
	}


	void System::apply_boundary_conditions() noexcept {
		for (auto & p : ensemble) {
			stats.wall_bounces += walls_.apply(p, simulation_box);
		}
	}


	void System::resolve_collisions() noexcept {
		// all unordered pairs in ascending (i, j) order
		for (size_t i = 0; i < ensemble.size(); ++i) {
			for (size_t j = i + 1; j < ensemble.size(); ++j) {
				switch (collisions_.resolve(ensemble[i], ensemble[j])) {
				case collision::Contact::Impact:
					++stats.impacts;
					break;
				case collision::Contact::Separating:
					++stats.separations;
					break;
				case collision::Contact::Coincident:
					++stats.coincident_pairs;
					break;
				case collision::Contact::None:
					break;
				}
			}
		}
	}


	void System::apply_thermostat() noexcept {
		stats.thermostat_factor = thermostat_.apply(ensemble, temperature_);
	}


	double System::mean_kinetic_energy() const noexcept {
		if (ensemble.empty()) return 0.0;

		double sum = 0.0;
		for (const auto & p : ensemble) {
			sum += p.kinetic_energy();
		}
		return sum / static_cast<double>(ensemble.size());
	}

} // namespace gaskit::core
