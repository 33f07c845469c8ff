#include "gaskit/distribution/curve.hpp"

#include <cmath>
#include <stdexcept>
#include <string>


namespace gaskit::dist {

	namespace {
		// number of samples in [0, energy_max], tolerant to E_max / step being a hair below an integer
		size_t sample_count(const double energy_max, const double energy_step) {
			constexpr double eps = 1e-9;
			return static_cast<size_t>(std::floor(energy_max / energy_step + eps)) + 1;
		}

		DistributionParams with_domain(DistributionParams params, const double energy_max, const double energy_step) {
			params.energy_max = energy_max;
			params.energy_step = energy_step;
			validate(params);
			return params;
		}
	}


	EnergyCurve::EnergyCurve(const double temperature, const double energy_max, const double energy_step,
		const DistributionParams & params)
	:
		temperature_(temperature),
		step_(energy_step),
		count(0),
		params(with_domain(params, energy_max, energy_step))
	{
		count = sample_count(energy_max, energy_step);
	}

	EnergyCurve::EnergyCurve(const double temperature, const DistributionParams & params)
	: EnergyCurve(temperature, params.energy_max, params.energy_step, params) {}


	std::vector<EnergyPoint> EnergyCurve::to_vector() const {
		std::vector<EnergyPoint> points;
		points.reserve(count);
		for (const EnergyPoint pt : *this) {
			points.push_back(pt);
		}
		return points;
	}


	std::vector<EnergyPoint> generate_curve(
		const double temperature, const double energy_max, const double energy_step, const DistributionParams & params) {
		return EnergyCurve(temperature, energy_max, energy_step, params).to_vector();
	}

}
