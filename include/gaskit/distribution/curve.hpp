#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

#include "gaskit/distribution/params.hpp"
#include "gaskit/distribution/density.hpp"

namespace gaskit::dist {

	struct EnergyPoint {
		double energy{};
		double density{};

		bool operator==(const EnergyPoint&) const = default;
	};


	// Lazy, restartable sequence of EnergyPoints for E = 0, step, 2 step, ... <= E_max.
	// Points are computed from their index, so iterating twice yields identical values.
	class EnergyCurve {
	public:
		struct Iterator {
			using iterator_category = std::forward_iterator_tag;
			using difference_type   = std::ptrdiff_t;
			using value_type        = EnergyPoint;
			using reference         = EnergyPoint;

			const EnergyCurve * curve = nullptr;
			size_t current = 0;

			Iterator() = default;
			Iterator(const EnergyCurve * c, const size_t i) : curve(c), current(i) {}

			Iterator& operator++() noexcept {
				++current; return *this;
			}
			Iterator operator++(int) noexcept {
				const Iterator tmp = *this; ++current; return tmp;
			}

			EnergyPoint operator*() const noexcept { return (*curve)[current]; }

			bool operator==(const Iterator& other) const noexcept {
				return current == other.current;
			}
		};

		// throws std::invalid_argument for a non-positive step or a negative E_max
		EnergyCurve(double temperature, double energy_max, double energy_step, const DistributionParams & params = {});

		// curve over the energy domain configured in params
		explicit EnergyCurve(double temperature, const DistributionParams & params = {});

		[[nodiscard]] size_t size() const noexcept { return count; }
		[[nodiscard]] bool empty() const noexcept { return count == 0; }

		[[nodiscard]] double temperature() const noexcept { return temperature_; }
		[[nodiscard]] double step() const noexcept { return step_; }

		[[nodiscard]] double energy_at(const size_t i) const noexcept {
			return static_cast<double>(i) * step_;
		}

		[[nodiscard]] EnergyPoint operator[](const size_t i) const noexcept {
			const double E = energy_at(i);
			return {E, density(E, temperature_, params)};
		}

		[[nodiscard]] Iterator begin() const noexcept { return {this, 0}; }
		[[nodiscard]] Iterator end() const noexcept { return {this, count}; }

		[[nodiscard]] std::vector<EnergyPoint> to_vector() const;

	private:
		double temperature_;
		double step_;
		size_t count;
		DistributionParams params;
	};


	// eagerly materialized curve for E = 0, step, ..., E_max
	[[nodiscard]] std::vector<EnergyPoint> generate_curve(
		double temperature, double energy_max, double energy_step, const DistributionParams & params = {});

}
