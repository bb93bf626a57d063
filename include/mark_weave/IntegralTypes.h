#ifndef MARK_WEAVE_INTEGRAL_TYPES_H
#define MARK_WEAVE_INTEGRAL_TYPES_H

#include <cstddef>
#include <cstdint>

namespace mark_weave {
	using UTinyInt = uint8_t;
	using UHalfInt = uint16_t;
	using UInt = uint32_t;
	using Offset = std::size_t;
	using NestLevel = uint16_t;

	constexpr Offset NPOS = static_cast<Offset>(-1);
	constexpr UInt UNBOUNDED = static_cast<UInt>(-1);
}

#endif
