#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <bit>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "utils.h"

using namespace gaskit;
using testing::HasSubstr;
namespace fs = std::filesystem;


// helper to read raw bytes
template<typename T> static T read_binary(std::ifstream& in) {
	T val;
	in.read(reinterpret_cast<char*>(&val), sizeof(val));
	return val;
}


class BinaryOutputTest : public testing::Test {
protected:
	fs::path dir;
	std::string base{"bin_test"};

	void SetUp() override {
		dir = fs::path(".") / "binary_output_test";
		fs::remove_all(dir);
		fs::create_directories(dir);
	}
	void TearDown() override {
		fs::remove_all(dir);
	}
};


TEST_F(BinaryOutputTest, FileNamePaddedWithStep) {
	const BinaryOutput out(Trigger::always(), dir.string(), base);
	EXPECT_EQ(out.file_for_step(42), dir / "bin_test_00042.bin");
}

TEST_F(BinaryOutputTest, HeaderAndParticles) {
	auto sys = make_system({
		make_particle({10, 20}, {1, -2}),
		make_particle({30, 40}, {-3, 4}),
	}, {100, 100}, 2.0, 250);

	const BinaryOutput out(Trigger::always(), dir.string(), base);
	out.record(sys);

	const auto path = dir / (base + "_00000.bin");
	ASSERT_TRUE(fs::exists(path));
	std::ifstream in{path, std::ios::binary};
	ASSERT_TRUE(in.good());

	char magic[4]; in.read(magic, 4);
	constexpr char expected_magic[4] = { 'G', 'K', 'I', 'N' };
	EXPECT_EQ(std::memcmp(magic, expected_magic, 4), 0);

	EXPECT_EQ(read_binary<uint32_t>(in), 1u);		// version
	EXPECT_EQ(read_binary<uint64_t>(in), 0u);		// step
	EXPECT_EQ(read_binary<uint64_t>(in), 2u);		// count
	EXPECT_DOUBLE_EQ(read_binary<double>(in), 250.0);

	for (const auto & p : sys.particles()) {
		EXPECT_FLOAT_EQ(read_binary<float>(in), static_cast<float>(p.position.x));
		EXPECT_FLOAT_EQ(read_binary<float>(in), static_cast<float>(p.position.y));
		EXPECT_FLOAT_EQ(read_binary<float>(in), static_cast<float>(p.velocity.x));
		EXPECT_FLOAT_EQ(read_binary<float>(in), static_cast<float>(p.velocity.y));
		EXPECT_FLOAT_EQ(read_binary<float>(in), 2.0f);
	}

	// No further data
	EXPECT_TRUE(in.peek() == EOF);
}

// fields are written in the host layout, little-endian on the supported targets
TEST_F(BinaryOutputTest, HeaderFieldsInHostLayout) {
	if constexpr (std::endian::native != std::endian::little) {
		GTEST_SKIP() << "big-endian host";
	}

	auto sys = make_system({make_particle({50, 50})});
	BinaryOutput(Trigger::always(), dir.string(), base).record(sys);

	std::ifstream in{dir / (base + "_00000.bin"), std::ios::binary};
	unsigned char bytes[4 + 4 + 8 + 8];
	in.read(reinterpret_cast<char*>(bytes), sizeof(bytes));
	ASSERT_TRUE(in.good());

	// version = 1, step = 0, count = 1
	EXPECT_EQ(bytes[4], 1);
	EXPECT_EQ(bytes[5] | bytes[6] | bytes[7], 0);
	EXPECT_EQ(bytes[16], 1);
	for (int i = 17; i < 24; ++i) EXPECT_EQ(bytes[i], 0) << "byte " << i;
}

TEST_F(BinaryOutputTest, OneFilePerTriggeredStep) {
	auto sys = make_system({make_particle({50, 50}, {1, 0})});

	Integrator(sys, monitors<BinaryOutput>)
		.with_monitor(BinaryOutput(Trigger::every(2), dir.string(), base))
		.run_for_steps(4);

	EXPECT_TRUE(fs::exists(dir / (base + "_00002.bin")));
	EXPECT_TRUE(fs::exists(dir / (base + "_00004.bin")));
	EXPECT_FALSE(fs::exists(dir / (base + "_00001.bin")));
	EXPECT_FALSE(fs::exists(dir / (base + "_00003.bin")));
}


TEST(TerminalOutputTest, PrintsEveryParticle) {
	auto sys = make_system({
		make_particle({1.5, 2}, {0, 0}),
		make_particle({3, 4}, {0, 0}),
	});

	testing::internal::CaptureStdout();
	TerminalOutput(Trigger::always()).record(sys);
	const std::string out = testing::internal::GetCapturedStdout();

	EXPECT_THAT(out, HasSubstr("step: 0"));
	EXPECT_THAT(out, HasSubstr("Position: 1.5 2"));
	EXPECT_THAT(out, HasSubstr("Position: 3 4"));
	EXPECT_THAT(out, HasSubstr("Radius: 1"));
}

TEST(EnergyMonitorTest, PrintsHeaderAndRows) {
	auto sys = make_system({make_particle({50, 50}, {3, 4})}, {100, 100}, 1.0, 100);

	testing::internal::CaptureStdout();
	Integrator(sys, monitors<EnergyMonitor>)
		.with_monitor(EnergyMonitor(Trigger::every(2)))
		.run_for_steps(2);
	const std::string out = testing::internal::GetCapturedStdout();

	EXPECT_THAT(out, HasSubstr("<E_kin>"));
	// after one step the speed is pinned to 0.5 * sqrt(100) = 5
	EXPECT_THAT(out, HasSubstr("100.000"));
	EXPECT_THAT(out, HasSubstr("5.000"));
	EXPECT_THAT(out, HasSubstr("12.500"));
}

TEST(ProgressBarTest, ReachesHundredPercent) {
	auto sys = make_system({make_particle({50, 50}, {1, 0})});

	testing::internal::CaptureStdout();
	Integrator(sys, monitors<ProgressBar>)
		.with_monitor(ProgressBar(Trigger::always()))
		.run_for_steps(10);
	const std::string out = testing::internal::GetCapturedStdout();

	EXPECT_THAT(out, HasSubstr("100%"));
}

TEST(BenchmarkTest, ReportsAllSteps) {
	auto sys = build_system(Environment().with_particle_count(10));

	testing::internal::CaptureStdout();
	auto integrator = Integrator(sys, monitors<Benchmark>)
		.with_monitor(Benchmark())
		.run_for_steps(5);
	const std::string out = testing::internal::GetCapturedStdout();

	EXPECT_EQ(integrator.get_monitors<Benchmark>().front().recorded_steps(), 5u);
	EXPECT_THAT(out, HasSubstr("GASKIT BENCHMARK REPORT"));
	EXPECT_THAT(out, HasSubstr("Steps processed:    5"));
	EXPECT_THAT(out, HasSubstr("Pair checks:        225"));
}
