#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>

#include "utils.h"
#include "step_recorder.h"

using namespace gaskit;
using testing::ElementsAre;


TEST(IntegratorTest, RunsFixedNumberOfSteps) {
	auto sys = build_system(Environment().with_particle_count(10));

	Integrator integrator(sys);
	integrator.run_for_steps(25);

	EXPECT_EQ(sys.step_count(), 25u);
}

TEST(IntegratorTest, ThrowsWithoutStepCount) {
	auto sys = build_system(Environment().with_particle_count(10));
	Integrator integrator(sys);
	EXPECT_THROW(integrator.run(), std::invalid_argument);
}

TEST(IntegratorTest, ZeroStepsLeavesSystemUnchanged) {
	auto sys = build_system(Environment().with_particle_count(10));
	const auto before = sys.export_particles();

	Integrator(sys).run_for_steps(0);

	EXPECT_EQ(sys.step_count(), 0u);
	EXPECT_EQ(sys.export_particles(), before);
}

TEST(IntegratorTest, MonitorHooksCalledInOrder) {
	auto sys = build_system(Environment().with_particle_count(5));

	auto integrator = Integrator(sys, monitors<StepRecorder>)
		.with_monitor(StepRecorder())
		.run_for_steps(3);

	const auto & rec = integrator.get_monitors<StepRecorder>().front();
	EXPECT_EQ(rec.initialized, 1);
	EXPECT_EQ(rec.finalized, 1);
	EXPECT_EQ(rec.run_start(), 0u);
	EXPECT_EQ(rec.run_length(), 3u);
	// before_step sees the step index before it runs, record the one after
	EXPECT_THAT(rec.before, ElementsAre(0u, 1u, 2u));
	EXPECT_THAT(rec.steps, ElementsAre(1u, 2u, 3u));
}

TEST(IntegratorTest, TriggerSelectsRecordedSteps) {
	auto sys = build_system(Environment().with_particle_count(5));

	Integrator integrator(sys, monitors<StepRecorder>);
	integrator.add_monitors(StepRecorder(Trigger::every(2)), StepRecorder(Trigger::at_step(3)));
	integrator.for_steps(6).run();

	const auto & recs = integrator.get_monitors<StepRecorder>();
	ASSERT_EQ(recs.size(), 2u);
	EXPECT_THAT(recs[0].steps, ElementsAre(2u, 4u, 6u));
	EXPECT_THAT(recs[1].steps, ElementsAre(3u));
}

// a second run continues from the current step
TEST(IntegratorTest, ConsecutiveRuns) {
	auto sys = build_system(Environment().with_particle_count(5));

	Integrator integrator(sys, monitors<StepRecorder>);
	integrator.add_monitor(StepRecorder());
	integrator.run_for_steps(2);
	integrator.run_for_steps(2);

	const auto & rec = integrator.get_monitors<StepRecorder>().front();
	EXPECT_EQ(rec.initialized, 2);
	EXPECT_EQ(rec.run_start(), 2u);
	EXPECT_THAT(rec.steps, ElementsAre(1u, 2u, 3u, 4u));
	EXPECT_EQ(sys.step_count(), 4u);
}

TEST(IntegratorTest, TemperatureScheduleAppliedBeforeEachStep) {
	auto sys = build_system(Environment().with_particle_count(20).with_temperature(100));

	auto integrator = Integrator(sys, monitors<StepRecorder>)
		.with_monitor(StepRecorder())
		.with_temperature_schedule([](const size_t step) { return 100.0 + 100.0 * static_cast<double>(step); })
		.run_for_steps(4);

	const auto & rec = integrator.get_monitors<StepRecorder>().front();
	EXPECT_THAT(rec.temperatures, ElementsAre(100.0, 200.0, 300.0, 400.0));
	EXPECT_DOUBLE_EQ(sys.temperature(), 400.0);
	EXPECT_NEAR(sys.mean_speed(), 0.5 * 20.0, 1e-9);
}

TEST(IntegratorTest, GasStaysContainedAndPinned) {
	auto sys = build_system(Environment()
		.with_particle_count(50)
		.with_extent(200, 200)
		.with_temperature(300));

	Integrator(sys).run_for_steps(200);

	for (const auto & p : sys.particles()) {
		EXPECT_TRUE(disc_inside(p, sys.box()));
	}
	EXPECT_NEAR(sys.mean_speed(), 0.5 * std::sqrt(300.0), 1e-9);
}
