#pragma once

#include <span>
#include <vector>
#include <cstddef>

#include "gaskit/env/particle.hpp"
#include "gaskit/env/domain.hpp"
#include "gaskit/env/environment.hpp"
#include "gaskit/boundaries/reflective.hpp"
#include "gaskit/collisions/inelastic.hpp"
#include "gaskit/controllers/thermostat.hpp"
#include "gaskit/shared/trigger.hpp"


namespace gaskit::core {
	struct BuildInfo;
	class System;

	System build_system(const env::Environment & environment, BuildInfo * build_info = nullptr);


	// counters of the most recent step
	struct StepStats {
		size_t wall_bounces = 0;		// particle-face contacts
		size_t impacts = 0;				// pairs that exchanged an impulse
		size_t separations = 0;			// overlapping pairs that were already moving apart
		size_t coincident_pairs = 0;	// pairs skipped because their centres coincide
		double thermostat_factor = 1;	// velocity scale applied by the thermostat
	};


	// Owns the ensemble and advances it one unit time step per call to step().
	// The temperature is ambient state: set it between steps, it is read by the thermostat.
	class System final {
	public:
		using TrigContext = shared::TriggerContextImpl<System>;

		// -----------------
		// LIFECYCLE & STATE
		// -----------------
		[[nodiscard]] size_t step_count() const noexcept { return step_; }
		[[nodiscard]] env::Box box() const noexcept { return simulation_box; }
		[[nodiscard]] size_t size() const noexcept { return ensemble.size(); }

		[[nodiscard]] double temperature() const noexcept { return temperature_; }
		// no validation, the caller keeps T >= 0
		void set_temperature(const double T) noexcept { temperature_ = T; }

		[[nodiscard]] const StepStats & last_step() const noexcept { return stats; }

		[[nodiscard]] TrigContext trigger_context() const {
			return TrigContext(*this);
		}


		// ------------------
		// PARTICLE ACCESSORS
		// ------------------
		// "at" implies mutable access, "view" implies read-only
		[[nodiscard]] env::Particle & at(const size_t index) {
			return ensemble.at(index);
		}

		[[nodiscard]] const env::Particle & view(const size_t index) const {
			return ensemble.at(index);
		}

		[[nodiscard]] std::span<const env::Particle> particles() const noexcept {
			return ensemble;
		}

		[[nodiscard]] std::vector<env::Particle> export_particles() const {
			return ensemble;
		}


		// ----------
		// COMPONENTS
		// ----------
		[[nodiscard]] const boundary::Reflective & walls() const noexcept { return walls_; }
		[[nodiscard]] const collision::Inelastic & collisions() const noexcept { return collisions_; }
		[[nodiscard]] const controller::MeanSpeedThermostat & thermostat() const noexcept { return thermostat_; }


		// ---------------
		// STEP OPERATIONS
		// ---------------
		// advances the ensemble by one unit time step: integrate, walls, pairs, walls, thermostat
		void step() noexcept;

		void integrate() noexcept;
		void apply_boundary_conditions() noexcept;
		void resolve_collisions() noexcept;
		void apply_thermostat() noexcept;

		[[nodiscard]] double mean_speed() const noexcept {
			return controller::MeanSpeedThermostat::mean_speed(ensemble);
		}

		[[nodiscard]] double mean_kinetic_energy() const noexcept;

	private:
		System(const env::Box & box,
			std::vector<env::Particle> particles,
			const collision::Inelastic & collisions,
			const controller::MeanSpeedThermostat & thermostat,
			double temperature);

		friend System build_system(const env::Environment & environment, BuildInfo * build_info);

		env::Box simulation_box;
		std::vector<env::Particle> ensemble;

		boundary::Reflective walls_;
		collision::Inelastic collisions_;
		controller::MeanSpeedThermostat thermostat_;

		double temperature_;
		size_t step_ = 0;
		StepStats stats;
	};

} // namespace gaskit::core
