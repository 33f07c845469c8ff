#pragma once
#include <cstdint>
#include <concepts>

#ifndef VEC2_TYPE
#define VEC2_TYPE double
#endif

#include "gaskit/math/vec2.hpp"


namespace gaskit {
	// vector aliases
	using vec2 = math::Vec2<VEC2_TYPE>; // general purpose vec2 (e.g. particle data)

	using int2 = math::Vec2<int32_t>;

	template <typename T, typename... Ts> concept same_as_any = (... or std::same_as<T, Ts>);

} // namespace gaskit
