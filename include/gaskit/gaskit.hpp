#pragma once
#include "gaskit/defaults.hpp"
#include "gaskit/base/types.hpp"

#include "gaskit/env/particle.hpp"
#include "gaskit/env/domain.hpp"
#include "gaskit/env/environment.hpp"

#include "gaskit/boundaries/boundary.hpp"
#include "gaskit/boundaries/reflective.hpp"

#include "gaskit/collisions/inelastic.hpp"

#include "gaskit/controllers/thermostat.hpp"

#include "gaskit/monitors/monitor.hpp"
#include "gaskit/monitors/terminal_output.hpp"
#include "gaskit/monitors/binary_output.hpp"
#include "gaskit/monitors/progressbar.hpp"
#include "gaskit/monitors/benchmark.hpp"
#include "gaskit/monitors/energy_monitor.hpp"

#include "gaskit/integrators/integrator.hpp"

#include "gaskit/system/build.hpp"
#include "gaskit/system/system.hpp"

#include "gaskit/distribution/params.hpp"
#include "gaskit/distribution/density.hpp"
#include "gaskit/distribution/curve.hpp"
#include "gaskit/distribution/summary.hpp"
#include "gaskit/distribution/reaction.hpp"

#include "gaskit/session/session.hpp"


namespace gaskit {

	// Environment
	using env::Environment;
	using env::Particle;
	using env::Box;

	// Boundary
	using boundary::Face;
	using boundary::all_faces;
	using boundary::Reflective;

	// Collisions
	using collision::Inelastic;
	using collision::Contact;

	// Controllers
	using controller::MeanSpeedThermostat;

	// System
	using core::System;
	using core::build_system;
	using core::BuildInfo;
	using core::StepStats;

	// Monitors
	using monitor::monitors;
	using monitor::Monitor;
	using monitor::BinaryOutput;
	using monitor::TerminalOutput;
	using monitor::ProgressBar;
	using monitor::Benchmark;
	using monitor::EnergyMonitor;

	// Integrators
	using integrator::Integrator;

	// Distribution
	using dist::DistributionParams;
	using dist::EnergyPoint;
	using dist::EnergyCurve;
	using dist::DistributionSummary;
	using dist::CurveAndSummary;
	using dist::ReactionRecord;
	using dist::effective_temperature;
	using dist::density;
	using dist::generate_curve;
	using dist::summarize;
	using dist::curve_and_summary;
	using dist::format_records;

	// Session
	using session::Session;

	// shared
	using shared::Trigger;
}
