#include <gaskit/gaskit.hpp>
#include <filesystem>
#include <iostream>

using namespace gaskit;
namespace fs = std::filesystem;

int main() {
	const auto dir_path = fs::path(PROJECT_SOURCE_DIR) / "output/gas_box";
	fs::remove_all(dir_path);   // delete the directory and all contents
	fs::create_directories(dir_path); // recreate the empty directory

	auto env = Environment()
		.with_particle_count(50)
		.with_extent(400, 400)
		.with_radius(5)
		.with_restitution(0.9)
		.with_speed_scale(0.5)
		.with_temperature(100);

	BuildInfo info;
	auto system = build_system(env, &info);

	std::cout << "built " << info.particle_count << " particles in box "
		<< info.simulation_box.extent.to_string() << " (mean speed " << info.initial_mean_speed << ")\n";

	Session session;

	// heat the gas from 100 K to 500 K over the run
	constexpr size_t steps = 500;
	auto integrator = Integrator(system, monitors<Benchmark, ProgressBar, EnergyMonitor, BinaryOutput>)
		.with_monitor(EnergyMonitor(Trigger::every(100)))
		.with_monitor(ProgressBar(Trigger::every(10)))
		.with_monitor(BinaryOutput(Trigger::every(100), dir_path.string(), "gas_box"))
		.with_monitor(Benchmark())
		.with_temperature_schedule([](const size_t step) {
			return 100.0 + 400.0 * static_cast<double>(step) / static_cast<double>(steps - 1);
		})
		.run_for_steps(steps);

	// record the distribution at a few temperatures, with and without catalyst
	for (const double T : {100.0, 300.0, 500.0}) {
		session.set_temperature(T);
		session.take_snapshot();
		session.record();
	}
	session.toggle_catalyst();
	session.record();

	session.set_temperature(system.temperature());
	session.refresh();

	const auto & live = session.live();
	std::cout << "\nT = " << live.temperature << " K"
		<< ", T_eff = " << effective_temperature(live.temperature, session.distribution_params())
		<< ", E_a = " << live.summary.activation_threshold << "\n"
		<< "  most probable energy: " << live.summary.mode_energy << "\n"
		<< "  mean energy:          " << live.summary.mean_energy << "\n"
		<< "  above activation:     " << live.summary.percentage_above << " %\n\n";

	std::cout << format_records(session.records());
}
