#pragma once

#include <utility>
#include <concepts>

#include "gaskit/system/system.hpp"
#include "gaskit/shared/trigger.hpp"

namespace gaskit::monitor {

	// Base of all step observers. Subclasses implement
	//   void record(const core::System &)            required, called after a triggered step
	//   void initialize()                             optional, called once before the first step
	//   void before_step(const core::System &)        optional, called before a triggered step
	//   void finalize()                               optional, called once after the last step
	class Monitor {
	public:
		explicit Monitor(shared::Trigger trig) : trigger(std::move(trig)) {}

		[[nodiscard]] bool should_trigger(const shared::TriggerContext & sys) const {
			return trigger(sys);
		}

		// Called once at the start with the step index the run starts at and the run length
		void init(const size_t start, const size_t steps) {
			start_step = start;
			num_steps = steps;
		}

	protected:
		size_t start_step{};
		size_t num_steps{};
		shared::Trigger trigger;
	};


	template <class M> concept IsMonitor = std::derived_from<M, Monitor>;

	template<IsMonitor... Ms> struct MonitorPack {};

	template<class... Ms> inline constexpr MonitorPack<Ms...> monitors{};


	namespace internal {
		template<IsMonitor M>
		void dispatch_initialize(M & mon) {
			if constexpr (requires { mon.initialize(); }) {
				mon.initialize();
			}
		}

		template<IsMonitor M>
		void dispatch_before_step(M & mon, const core::System & sys) {
			if constexpr (requires { mon.before_step(sys); }) {
				mon.before_step(sys);
			}
		}

		template<IsMonitor M>
		void dispatch_record(M & mon, const core::System & sys) {
			static_assert(
				requires { mon.record(sys); },
				"Monitor subclass must implement: void record(const core::System &)"
			);
			mon.record(sys);
		}

		template<IsMonitor M>
		void dispatch_finalize(M & mon) {
			if constexpr (requires { mon.finalize(); }) {
				mon.finalize();
			}
		}
	}
}
