#pragma once

#include <iomanip>
#include <iostream>

#include "gaskit/monitors/monitor.hpp"

namespace gaskit::monitor {

	// one line per triggered step: temperature, mean speed against its target,
	// mean kinetic energy and the collision counters of the step
	class EnergyMonitor final : public Monitor {
	public:
		using Monitor::Monitor;

		void initialize() const {
			const auto flags = std::cout.flags();
			std::cout << std::left
				<< std::setw(8) << "step"
				<< std::setw(10) << "T"
				<< std::setw(12) << "<|v|>"
				<< std::setw(12) << "target"
				<< std::setw(12) << "<E_kin>"
				<< std::setw(8) << "walls"
				<< std::setw(8) << "impacts" << "\n";
			std::cout.flags(flags);
		}

		void record(const core::System & sys) const {
			const auto & stats = sys.last_step();
			const auto flags = std::cout.flags();
			const auto precision = std::cout.precision();

			std::cout << std::left << std::fixed << std::setprecision(3)
				<< std::setw(8) << sys.step_count()
				<< std::setw(10) << sys.temperature()
				<< std::setw(12) << sys.mean_speed()
				<< std::setw(12) << sys.thermostat().target_speed(sys.temperature())
				<< std::setw(12) << sys.mean_kinetic_energy()
				<< std::setw(8) << stats.wall_bounces
				<< std::setw(8) << stats.impacts << "\n";

			std::cout.flags(flags);
			std::cout.precision(precision);
		}
	};
}
