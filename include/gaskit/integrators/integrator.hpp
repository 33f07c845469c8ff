#pragma once
#include <functional>
#include <optional>
#include <vector>
#include <stdexcept>
#include <string>
#include <utility>

#include "gaskit/system/system.hpp"
#include "gaskit/monitors/monitor.hpp"
#include "gaskit/shared/pack_storage.hpp"

namespace gaskit::integrator {

	// Headless scheduler: calls System::step() once per tick for a fixed number of ticks
	// and dispatches monitors around each step. A GUI frame loop takes its place interactively.
	template<class Pack> class Integrator;  // primary template

	template <class... TMonitors>  // partial specialization
	class Integrator<monitor::MonitorPack<TMonitors...>> {
	public:
		using TemperatureSchedule = std::function<double(size_t)>;

		explicit Integrator(core::System& sys_ref)
			: sys(sys_ref)
		{}

		Integrator(core::System& s, monitor::MonitorPack<TMonitors...>) : sys(s) {}

		template<typename T> requires same_as_any<T, TMonitors...>
		void add_monitor(T monitor) {
			monitors.add(std::move(monitor));
		}

		template<typename... Ts>
		void add_monitors(Ts&&... ms) {
			(add_monitor(std::forward<Ts>(ms)), ...);
		}

		// DSL-style chaining
		template<typename T> requires same_as_any<T, TMonitors...>
		Integrator& with_monitor(T monitor) {
			add_monitor(std::move(monitor));
			return *this;
		}

		void set_steps(const size_t steps) {
			num_steps = steps;
		}

		// temperature as a function of the step index, applied before the step runs
		void set_temperature_schedule(TemperatureSchedule schedule) {
			temperature_schedule = std::move(schedule);
		}

		Integrator& for_steps(const size_t steps) {
			set_steps(steps);
			return *this;
		}

		Integrator& with_temperature_schedule(TemperatureSchedule schedule) {
			set_temperature_schedule(std::move(schedule));
			return *this;
		}

		Integrator& run() {
			if (!num_steps.has_value()) {
				throw std::invalid_argument("number of steps has not been specified!");
			}

			const size_t start = sys.step_count();
			init_monitors(start);
			dispatch_initialize_monitors();

			// simulation loop
			for (size_t i = 0; i < *num_steps; ++i) {
				if (temperature_schedule) {
					sys.set_temperature(temperature_schedule(sys.step_count()));
				}
				dispatch_monitor_preparation();
				sys.step();
				dispatch_monitor_recording();
			}

			finalize_monitors();

			return *this;
		}

		// Integrate for explicit number of steps
		Integrator& run_for_steps(const size_t steps) {
			return for_steps(steps).run();
		}

		template<typename T> requires same_as_any<T, TMonitors...>
		std::vector<T>& get_monitors() {
			return monitors.template get_list<T>();
		}

	protected:
		core::System & sys;
		std::optional<size_t> num_steps;
		TemperatureSchedule temperature_schedule;

	private:
		shared::internal::PackStorage<TMonitors...> monitors;

		void init_monitors(const size_t start) {
			monitors.for_each_item([&](auto& mon){ mon.init(start, *num_steps); });
		}

		void dispatch_initialize_monitors() {
			monitors.for_each_item([&](auto& mon){ monitor::internal::dispatch_initialize(mon); });
		}

		void dispatch_monitor_preparation() {
			const auto ctx = sys.trigger_context();
			monitors.for_each_item([&](auto & mon) {
				if (mon.should_trigger(ctx)) {
					monitor::internal::dispatch_before_step(mon, sys);
				}
			});
		}

		void dispatch_monitor_recording() {
			const auto ctx = sys.trigger_context();
			monitors.for_each_item([&](auto & mon) {
				if (mon.should_trigger(ctx)) {
					monitor::internal::dispatch_record(mon, sys);
				}
			});
		}

		void finalize_monitors() {
			monitors.for_each_item([&](auto& mon){ monitor::internal::dispatch_finalize(mon); });
		}
	};

	// Deduction guide so user can write Integrator(sys, monitors<M1, M2, M3>)
	template<class... Ms>
	Integrator(core::System&, monitor::MonitorPack<Ms...>)
		-> Integrator<monitor::MonitorPack<Ms...>>;

	// Deduction guide so user can write Integrator(sys)
	Integrator(core::System&) -> Integrator<monitor::MonitorPack<>>;
}
