#pragma once
#include <iomanip>
#include <iostream>

#include "gaskit/monitors/monitor.hpp"

namespace gaskit::monitor {
	class ProgressBar final : public Monitor {
	public:
		using Monitor::Monitor;

		void record(const core::System & sys) const {
			if (num_steps == 0) return;

			constexpr size_t bar_width = 50;
			const size_t done = sys.step_count() - start_step;
			const float progress = static_cast<float>(done) / static_cast<float>(num_steps);
			const auto pos = static_cast<size_t>(bar_width * progress);

			std::cout << "\r[";
			for (size_t i = 0; i < bar_width; ++i) {
				if (i < pos) std::cout << "=";
				else if (i == pos) std::cout << ">";
				else std::cout << " ";
			}
			std::cout << "] " << std::setw(3) << static_cast<int>(progress * 100.0) << "%";
			std::cout.flush();

			if (done == num_steps) {
				std::cout << std::endl;
			}
		}
	};
}
