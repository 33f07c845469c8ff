#pragma once

#include <chrono>
#include <numeric>
#include <algorithm> // for sort
#include <cmath>     // for sqrt
#include <iomanip>   // for setprecision
#include <iostream>
#include <vector>

#include "gaskit/monitors/monitor.hpp"

namespace gaskit::monitor {
	class Benchmark final : public Monitor {
	public:
		Benchmark() : Monitor(shared::Trigger::always()) {}

		void initialize() {
			glob_start_time = Clock::now();
			timings.clear();
			timings.reserve(num_steps);
			pair_checks = 0;
		}

		void before_step(const core::System & sys) {
			const uint64_t n = sys.size();
			pair_checks += n * (n - 1) / 2;
			start_time = Clock::now();
		}

		void record(const core::System &) {
			end_time = Clock::now();
			const auto elapsed = std::chrono::duration<double>(end_time - start_time).count();
			timings.push_back(elapsed);
		}

		[[nodiscard]] size_t recorded_steps() const noexcept { return timings.size(); }

		void finalize() {
			if (timings.empty()) return;

			glob_end_time = Clock::now();

			// basic sums
			const double glob_total_s = std::chrono::duration<double>(glob_end_time - glob_start_time).count();
			const double total_step_s = std::accumulate(timings.begin(), timings.end(), 0.0);
			const size_t steps = timings.size();

			// averages and throughput
			const double avg_s = total_step_s / static_cast<double>(steps);
			const double its_per_sec = avg_s > 0 ? 1.0 / avg_s : 0.0;
			const double mpcs = total_step_s > 0 ? (static_cast<double>(pair_checks) / total_step_s) / 1'000'000.0 : 0.0;

			// sort a copy to find the median without altering the recorded order
			std::vector<double> sorted_timings = timings;
			std::ranges::sort(sorted_timings);

			const double min_s = sorted_timings.front();
			const double max_s = sorted_timings.back();
			const double median_s = sorted_timings[steps / 2];

			// standard deviation
			double variance_accum = 0.0;
			for (const double t : timings) {
				variance_accum += (t - avg_s) * (t - avg_s);
			}
			const double std_dev = std::sqrt(variance_accum / static_cast<double>(steps));

			const auto flags = std::cout.flags();
			const auto precision = std::cout.precision();

			std::cout << "\n" << std::string(40, '-') << "\n";
			std::cout << " [GASKIT BENCHMARK REPORT] \n";
			std::cout << std::string(40, '-') << "\n";

			std::cout << std::fixed << std::setprecision(5);
			std::cout << "  Steps processed:    " << steps << "\n";
			std::cout << "  Pair checks:        " << pair_checks << "\n";
			std::cout << "  Wall time (total):  " << glob_total_s << " s\n";
			std::cout << "  Step time (total):  " << total_step_s << " s\n";
			std::cout << std::string(40, '-') << "\n";

			std::cout << std::setprecision(2);
			std::cout << "  Throughput:         " << its_per_sec << " it/s\n";
			std::cout << "  Performance:        " << mpcs << " M pair checks/s\n";
			std::cout << std::string(40, '-') << "\n";

			std::cout << std::setprecision(6);
			std::cout << "  Avg step time:      " << avg_s << " s\n";
			std::cout << "  Median step time:   " << median_s << " s\n";
			std::cout << "  Min step time:      " << min_s << " s\n";
			std::cout << "  Max step time:      " << max_s << " s\n";
			std::cout << "  Std Deviation:      " << std_dev << " s\n";
			std::cout << std::string(40, '-') << "\n\n";

			std::cout.flags(flags);
			std::cout.precision(precision);
		}

	private:
		using Clock = std::chrono::steady_clock;
		Clock::time_point glob_start_time;
		Clock::time_point glob_end_time;
		Clock::time_point start_time;
		Clock::time_point end_time;
		std::vector<double> timings;
		uint64_t pair_checks = 0;
	};

}
