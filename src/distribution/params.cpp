#include "gaskit/distribution/params.hpp"

#include <cmath>
#include <stdexcept>
#include <string>


namespace gaskit::dist {

	void validate(const DistributionParams & params) {
		if (!(params.energy_step > 0) || !std::isfinite(params.energy_step)) {
			throw std::invalid_argument(
				"Energy step must be positive and finite. Got: " + std::to_string(params.energy_step));
		}
		if (!(params.energy_max >= 0) || !std::isfinite(params.energy_max)) {
			throw std::invalid_argument(
				"Energy maximum must be non-negative and finite. Got: " + std::to_string(params.energy_max));
		}
	}

}
