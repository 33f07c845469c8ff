#pragma once

#include "gaskit/defaults.hpp"

namespace gaskit::dist {

	// Constants of the modified Maxwell-Boltzmann curve. They are fitted so that the curve
	// reads well over the 100-500 K range, they are not physical constants.
	struct DistributionParams {
		double effective_temperature_scale = defaults::effective_temperature_scale;
		double effective_temperature_offset = defaults::effective_temperature_offset;
		double sharpness = defaults::sharpness;
		double population = defaults::population;
		double multiplier = defaults::density_multiplier;

		// sampled energy domain [0, energy_max]
		double energy_max = defaults::energy_max;
		double energy_step = defaults::energy_step;

		double activation_threshold = defaults::activation_threshold;
		double catalyst_activation_threshold = defaults::catalyst_activation_threshold;
	};

	// throws std::invalid_argument if the energy domain cannot be sampled
	void validate(const DistributionParams & params);

	// threshold policy: a catalyst lowers the activation energy
	[[nodiscard]] inline double activation_threshold(const bool catalyst, const DistributionParams & params = {}) noexcept {
		return catalyst ? params.catalyst_activation_threshold : params.activation_threshold;
	}

}
