#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gaskit::boundary {

	enum class Face : uint8_t {
		XMinus = 0, XPlus = 1,
		YMinus = 2, YPlus = 3,
	};

	inline constexpr std::array all_faces = {
		Face::XMinus, Face::XPlus,
		Face::YMinus, Face::YPlus,
	};


	constexpr int face_to_int(const Face f) noexcept {
		return static_cast<int>(f);
	}

	constexpr uint8_t axis_of_face(const Face f) noexcept {
		return static_cast<uint8_t>(face_to_int(f) / 2);
	}

	constexpr bool face_sign_pos(const Face f) noexcept {
		return (face_to_int(f) & 1) != 0;
	}

	inline Face face_of(const uint8_t axis, const bool plus) {
		if (axis > 1) {
			throw std::logic_error("got a different axis than {0,1}. A 2D box has no axis " + std::to_string(axis));
		}
		return static_cast<Face>(axis * 2 + (plus ? 1 : 0));
	}
}
