#pragma once

#include <iostream>
#include "gaskit/monitors/monitor.hpp"

namespace gaskit::monitor {

	class TerminalOutput final : public Monitor {
	public:
		using Monitor::Monitor;

		void record(const core::System & sys) const {
			std::cout << "\n ##########  step: " << sys.step_count() <<  "  ########## \n";

			for (const auto & p : sys.particles()) {
				std::cout << env::particle_to_string(p) << "\n";
			}
		}
	};
}
