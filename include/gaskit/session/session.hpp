#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "gaskit/defaults.hpp"
#include "gaskit/distribution/params.hpp"
#include "gaskit/distribution/curve.hpp"
#include "gaskit/distribution/reaction.hpp"
#include "gaskit/system/system.hpp"

namespace gaskit::session {

	struct SnapshotCurve {
		double temperature = 0;
		std::vector<dist::EnergyPoint> curve;
	};

	// which derived data a refresh() recomputed
	struct RefreshResult {
		bool live = false;
		bool snapshots = false;

		[[nodiscard]] bool any() const noexcept { return live || snapshots; }
	};


	// State shared by the presentation layer: the temperature set by the user, the catalyst
	// flag, recorded snapshot temperatures and the table of recorded results.
	// Derived curves are recomputed by refresh() only when their inputs changed.
	class Session {
	public:
		explicit Session(const dist::DistributionParams & params = {}, double temperature = defaults::temperature);

		// clamps into the accepted user range [min_temperature, max_temperature], NaN maps to the default
		[[nodiscard]] static double clamp_temperature(double T) noexcept;

		void set_temperature(double T) noexcept;
		[[nodiscard]] double temperature() const noexcept { return temperature_; }

		void set_catalyst(const bool on) noexcept { catalyst_ = on; }
		void toggle_catalyst() noexcept { catalyst_ = !catalyst_; }
		[[nodiscard]] bool catalyst() const noexcept { return catalyst_; }

		[[nodiscard]] double activation_threshold() const noexcept {
			return dist::activation_threshold(catalyst_, params);
		}

		// --- snapshots ---
		void take_snapshot();
		void clear_snapshots();
		[[nodiscard]] const std::vector<double> & snapshots() const noexcept { return snapshot_temperatures; }

		// --- recorded results ---
		dist::ReactionRecord record();
		[[nodiscard]] const std::vector<dist::ReactionRecord> & records() const noexcept { return records_; }

		// --- derived data ---
		RefreshResult refresh();

		// valid once refresh() ran
		[[nodiscard]] const dist::CurveAndSummary & live() const noexcept { return live_; }
		[[nodiscard]] const std::vector<SnapshotCurve> & snapshot_curves() const noexcept { return snapshot_curves_; }

		// bumped whenever refresh() recomputes the corresponding data
		[[nodiscard]] size_t live_revision() const noexcept { return live_revision_; }
		[[nodiscard]] size_t snapshot_revision() const noexcept { return snapshot_revision_; }

		// hands the current temperature to the kinetics engine
		void apply_to(core::System & system) const noexcept {
			system.set_temperature(temperature_);
		}

		[[nodiscard]] const dist::DistributionParams & distribution_params() const noexcept { return params; }

	private:
		struct LiveInputs {
			double temperature;
			bool catalyst;

			bool operator==(const LiveInputs&) const = default;
		};

		dist::DistributionParams params;
		double temperature_;
		bool catalyst_ = false;

		std::vector<double> snapshot_temperatures;
		size_t snapshot_edits = 0;
		std::vector<dist::ReactionRecord> records_;

		std::optional<LiveInputs> applied_live;
		std::optional<size_t> applied_snapshot_edits;

		dist::CurveAndSummary live_;
		std::vector<SnapshotCurve> snapshot_curves_;
		size_t live_revision_ = 0;
		size_t snapshot_revision_ = 0;
	};

} // namespace gaskit::session
