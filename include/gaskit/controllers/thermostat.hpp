#pragma once

#include <cmath>
#include <span>
#include <string>

#include "gaskit/env/particle.hpp"

namespace gaskit::controller {

	// Velocity rescaling thermostat. Pins the mean particle speed of the ensemble to
	// speed_scale * sqrt(T). Unlike a kinetic temperature thermostat it does not remove
	// the centre of mass velocity before scaling.
	class MeanSpeedThermostat {
	public:
		explicit MeanSpeedThermostat(const double speed_scale) : speed_scale_(speed_scale) {
			GK_ASSERT(speed_scale >= 0, "speed scale cannot be negative, got " + std::to_string(speed_scale));
		}

		[[nodiscard]] double speed_scale() const noexcept { return speed_scale_; }

		// caller guarantees T >= 0
		[[nodiscard]] double target_speed(const double temperature) const noexcept {
			return speed_scale_ * std::sqrt(temperature);
		}

		[[nodiscard]] static double mean_speed(std::span<const env::Particle> particles) noexcept {
			if (particles.empty()) return 0.0;

			double sum = 0.0;
			for (const auto & p : particles) {
				sum += p.speed();
			}
			return sum / static_cast<double>(particles.size());
		}

		// rescales every velocity and returns the applied factor
		double apply(std::span<env::Particle> particles, const double temperature) const noexcept {
			if (particles.empty()) return 1.0;

			const double current = mean_speed(particles);
			// a resting ensemble cannot be scaled; the factor is applied to zero velocities
			const double factor = target_speed(temperature) / (current == 0.0 ? 1.0 : current);

			for (auto & p : particles) {
				p.velocity *= factor;
			}
			return factor;
		}

	private:
		double speed_scale_;
	};

} // namespace gaskit::controller
