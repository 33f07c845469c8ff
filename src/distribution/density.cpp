#include "gaskit/distribution/density.hpp"

#include <cmath>
#include <numbers>


namespace gaskit::dist {

	double effective_temperature(const double T, const DistributionParams & params) noexcept {
		return params.effective_temperature_scale * T + params.effective_temperature_offset;
	}

	double density(const double E, const double T, const DistributionParams & params) noexcept {
		const double T_eff = effective_temperature(T, params);
		if (T_eff <= 0) return 0.0;

		const double norm = (2.0 / std::sqrt(std::numbers::pi)) * std::pow(params.sharpness / T_eff, 1.5);
		return params.multiplier * norm * std::sqrt(E) * std::exp(-E / T_eff) * params.population;
	}

}
