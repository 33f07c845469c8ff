#pragma once

#include <string>
#include <vector>

#include "gaskit/distribution/params.hpp"
#include "gaskit/distribution/curve.hpp"
#include "gaskit/distribution/summary.hpp"

namespace gaskit::dist {

	struct CurveAndSummary {
		double temperature = 0;
		std::vector<EnergyPoint> curve;
		DistributionSummary summary;
		double mean_density = 0;	// f(mean energy, T), where the mean marker sits on the curve
	};

	// fresh curve over the configured energy domain and its summary
	[[nodiscard]] CurveAndSummary curve_and_summary(
		double temperature, double activation_threshold, const DistributionParams & params = {});


	// One row of recorded results. The reaction rate is taken to be proportional to the
	// share of the population above the activation energy, with factor 1.
	struct ReactionRecord {
		double temperature = 0;
		double most_probable_energy = 0;
		double percentage_above = 0;
		double rate_of_reaction = 0;

		bool operator==(const ReactionRecord&) const = default;
	};

	[[nodiscard]] ReactionRecord record(
		double temperature, double activation_threshold, const DistributionParams & params = {});

	[[nodiscard]] ReactionRecord to_record(const DistributionSummary & summary, double temperature) noexcept;

	// text table, percentages and rates with two decimals
	[[nodiscard]] std::string format_records(const std::vector<ReactionRecord> & records);

}
