#pragma once

#include "gaskit/distribution/params.hpp"

namespace gaskit::dist {

	// maps the user facing temperature onto the scale of the density formula: 0.5 T + 50 by default
	[[nodiscard]] double effective_temperature(double T, const DistributionParams & params = {}) noexcept;

	/**
	 * Modified Maxwell-Boltzmann energy density
	 *   f(E, T) = m * (2 / sqrt(pi)) * (s / T_eff)^1.5 * sqrt(E) * exp(-E / T_eff) * N
	 * with m the empirical multiplier, s the sharpness and N the population.
	 * Returns 0 if T_eff <= 0. E must be >= 0.
	 */
	[[nodiscard]] double density(double E, double T, const DistributionParams & params = {}) noexcept;

}
