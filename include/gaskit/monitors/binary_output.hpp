#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "gaskit/monitors/monitor.hpp"


namespace gaskit::monitor {

	// Writes one binary snapshot of the ensemble per triggered step.
	// Layout (little-endian host layout, fields are not byte swapped):
	//   char[4] magic "GKIN" | uint32 version | uint64 step | uint64 count | double temperature
	//   count x { float x, float y, float vx, float vy, float radius }
	class BinaryOutput final : public Monitor {
	public:
		explicit BinaryOutput(
			const shared::Trigger & trigger,
			std::string dir = "output",
			std::string base_name = "output")
		:
			Monitor(trigger), base_name(std::move(base_name)), dir(std::move(dir)) {}

		[[nodiscard]] std::filesystem::path file_for_step(const size_t step) const {
			std::ostringstream filename;
			filename << base_name << "_" << std::setw(5) << std::setfill('0') << step << ".bin";
			return std::filesystem::path(dir) / filename.str();
		}

		void record(const core::System & sys) const {
			namespace fs = std::filesystem;

			fs::create_directories(dir);
			const fs::path full_path = file_for_step(sys.step_count());

			std::ofstream out(full_path, std::ios::binary);
			if (!out) throw std::runtime_error("Failed to create output file: " + full_path.string());

			// Write header
			out.write(magic, sizeof(magic));							// 4 bytes
			write_binary(out, version);									// 4 bytes
			write_binary(out, static_cast<uint64_t>(sys.step_count()));	// 8 bytes
			write_binary(out, static_cast<uint64_t>(sys.size()));		// 8 bytes
			write_binary(out, sys.temperature());						// 8 bytes

			for (const auto & p : sys.particles()) {
				write_binary(out, static_cast<float>(p.position.x));
				write_binary(out, static_cast<float>(p.position.y));
				write_binary(out, static_cast<float>(p.velocity.x));
				write_binary(out, static_cast<float>(p.velocity.y));
				write_binary(out, static_cast<float>(p.radius));
			}

			if (!out) throw std::runtime_error("Failed to write output file: " + full_path.string());
		}

		template<typename T> static void write_binary(std::ofstream& out, const T& value) {
			out.write(reinterpret_cast<const char*>(&value), sizeof(T));
		}

		static constexpr char magic[4] = { 'G', 'K', 'I', 'N' };
		static constexpr uint32_t version = 1;

	private:
		std::string base_name;
		std::string dir;
	};

} // namespace gaskit::monitor
