#include "gaskit/session/session.hpp"

#include <algorithm>
#include <cmath>


namespace gaskit::session {

	Session::Session(const dist::DistributionParams & params, const double temperature)
	:
		params(params),
		temperature_(clamp_temperature(temperature))
	{
		dist::validate(params);
	}


	double Session::clamp_temperature(const double T) noexcept {
		if (std::isnan(T)) return defaults::temperature;
		return std::clamp(T, defaults::min_temperature, defaults::max_temperature);
	}

	void Session::set_temperature(const double T) noexcept {
		temperature_ = clamp_temperature(T);
	}


	void Session::take_snapshot() {
		snapshot_temperatures.push_back(temperature_);
		++snapshot_edits;
	}

	void Session::clear_snapshots() {
		if (snapshot_temperatures.empty()) return;
		snapshot_temperatures.clear();
		++snapshot_edits;
	}


	dist::ReactionRecord Session::record() {
		records_.push_back(dist::record(temperature_, activation_threshold(), params));
		return records_.back();
	}


	RefreshResult Session::refresh() {
		RefreshResult result;

		const LiveInputs inputs{temperature_, catalyst_};
		if (applied_live != inputs) {
			live_ = dist::curve_and_summary(temperature_, activation_threshold(), params);
			applied_live = inputs;
			++live_revision_;
			result.live = true;
		}

		if (applied_snapshot_edits != snapshot_edits) {
			snapshot_curves_.clear();
			snapshot_curves_.reserve(snapshot_temperatures.size());
			for (const double T : snapshot_temperatures) {
				snapshot_curves_.push_back({T, dist::EnergyCurve(T, params).to_vector()});
			}
			applied_snapshot_edits = snapshot_edits;
			++snapshot_revision_;
			result.snapshots = true;
		}

		return result;
	}

} // namespace gaskit::session
