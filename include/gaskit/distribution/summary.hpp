#pragma once

#include <concepts>
#include <limits>
#include <ranges>
#include <vector>

#include "gaskit/distribution/curve.hpp"

namespace gaskit::dist {

	template<typename R>
	concept IsEnergyCurve = std::ranges::input_range<R> &&
		std::same_as<std::ranges::range_value_t<R>, EnergyPoint>;


	struct DistributionSummary {
		double mode_energy = 0;				// energy of the first point with maximum density
		double mode_density = 0;			// density at the mode
		double mean_energy = 0;				// sum(E f) / sum(f), 0 for a curve without mass
		double percentage_above = 0;		// 100 * sum(f | E >= threshold) / sum(f)
		double activation_threshold = 0;
	};


	/**
	 * Single pass over the curve. The mean is the discrete density weighted average of the
	 * sampled energies; it is not renormalized by the sample spacing.
	 */
	template<IsEnergyCurve R>
	[[nodiscard]] DistributionSummary summarize(R && curve, const double activation_threshold) {
		DistributionSummary summary;
		summary.activation_threshold = activation_threshold;

		double max_density = -std::numeric_limits<double>::infinity();
		double sum_f = 0.0;
		double sum_ef = 0.0;
		double sum_above = 0.0;
		bool empty = true;

		for (const EnergyPoint & pt : curve) {
			empty = false;
			if (pt.density > max_density) {
				max_density = pt.density;
				summary.mode_energy = pt.energy;
			}

			sum_f += pt.density;
			sum_ef += pt.energy * pt.density;
			if (pt.energy >= activation_threshold) {
				sum_above += pt.density;
			}
		}

		summary.mode_density = empty ? 0.0 : max_density;
		summary.mean_energy = sum_f != 0.0 ? sum_ef / sum_f : 0.0;
		summary.percentage_above = sum_f != 0.0 ? (sum_above / sum_f) * 100.0 : 0.0;
		return summary;
	}


	// points at or above the threshold, i.e. the shaded region under the curve
	template<IsEnergyCurve R>
	[[nodiscard]] std::vector<EnergyPoint> activation_region(R && curve, const double activation_threshold) {
		std::vector<EnergyPoint> region;
		for (const EnergyPoint & pt : curve) {
			if (pt.energy >= activation_threshold) {
				region.push_back(pt);
			}
		}
		return region;
	}

}
