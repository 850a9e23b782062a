#ifndef EDGEWFC_RGBA_HPP
#define EDGEWFC_RGBA_HPP

#include <cstdint>

struct RGBA
{
	uint8_t r, g, b, a;

	uint32_t packed() const
	{
		return (uint32_t(r) << 24) | (uint32_t(g) << 16) | (uint32_t(b) << 8) | uint32_t(a);
	}

	bool operator==(RGBA o) const
	{
		return r == o.r
		    && g == o.g
		    && b == o.b
		    && a == o.a;
	}

	bool operator!=(RGBA o) const { return !(*this == o); }
	bool operator< (RGBA o) const { return packed() < o.packed(); }
};
static_assert(sizeof(RGBA) == 4, "");

#endif
