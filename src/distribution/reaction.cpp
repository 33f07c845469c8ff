#include "gaskit/distribution/reaction.hpp"

#include <iomanip>
#include <sstream>

#include "gaskit/distribution/density.hpp"


namespace gaskit::dist {

	CurveAndSummary curve_and_summary(const double temperature, const double activation_threshold,
		const DistributionParams & params) {
		CurveAndSummary result;
		result.temperature = temperature;
		result.curve = EnergyCurve(temperature, params).to_vector();
		result.summary = summarize(result.curve, activation_threshold);
		result.mean_density = density(result.summary.mean_energy, temperature, params);
		return result;
	}


	ReactionRecord to_record(const DistributionSummary & summary, const double temperature) noexcept {
		ReactionRecord rec;
		rec.temperature = temperature;
		rec.most_probable_energy = summary.mode_energy;
		rec.percentage_above = summary.percentage_above;
		rec.rate_of_reaction = summary.percentage_above;
		return rec;
	}


	ReactionRecord record(const double temperature, const double activation_threshold,
		const DistributionParams & params) {
		return to_record(summarize(EnergyCurve(temperature, params), activation_threshold), temperature);
	}


	std::string format_records(const std::vector<ReactionRecord> & records) {
		std::ostringstream oss;
		oss << std::left
			<< std::setw(18) << "Temperature (K)"
			<< std::setw(24) << "Most Probable Energy"
			<< std::setw(30) << "Percentage Above Activation"
			<< "Rate of Reaction" << "\n";

		for (const auto & rec : records) {
			std::ostringstream pct;
			pct << std::fixed << std::setprecision(2) << rec.percentage_above << "%";
			std::ostringstream rate;
			rate << std::fixed << std::setprecision(2) << rec.rate_of_reaction;

			oss << std::setw(18) << rec.temperature
				<< std::setw(24) << rec.most_probable_energy
				<< std::setw(30) << pct.str()
				<< rate.str() << "\n";
		}
		return oss.str();
	}

}
