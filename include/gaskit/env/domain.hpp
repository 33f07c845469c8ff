#pragma once

#include <string>
#include <stdexcept>

#include "gaskit/base/types.hpp"

namespace gaskit::env {

	// axis aligned simulation box. The kinetics domain always starts at the origin.
	struct Box {
		Box() = default;

		Box(const vec2& min_corner, const vec2& max_corner):
			min(min_corner), max(max_corner), extent(max_corner - min_corner) {

			GK_ASSERT(min_corner.x <= max_corner.x, "min_corner.x (" + std::to_string(min_corner.x) + ") "
				"is not <= than max_corner.x (" + std::to_string(max_corner.x)+")");
			GK_ASSERT(min_corner.y <= max_corner.y, "min_corner.y (" + std::to_string(min_corner.y) + ") "
				"is not <= than max_corner.y (" + std::to_string(max_corner.y)+")");
		}

		[[nodiscard]] static Box from_extent(const vec2& extent) {
			return {vec2{0, 0}, extent};
		}

		[[nodiscard]] bool contains(const vec2 & p) const noexcept {
			return (p.x >= min.x && p.x <= max.x) &&
				  (p.y >= min.y && p.y <= max.y);
		}

		// true if a disc of radius r centred at p lies fully inside the box
		[[nodiscard]] bool contains(const vec2 & p, const double r) const noexcept {
			return (p.x >= min.x + r && p.x <= max.x - r) &&
				  (p.y >= min.y + r && p.y <= max.y - r);
		}

		vec2 min;
		vec2 max;
		vec2 extent;
	};
}
