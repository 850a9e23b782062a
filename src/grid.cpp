#include <emilib/strprintf.hpp>
#include "grid.hpp"

const char* to_string(Side side)
{
	return side == kTop    ? "top"
	     : side == kLeft   ? "left"
	     : side == kBottom ? "bottom"
	     : "right";
}

std::string to_string(Coord coord)
{
	return emilib::strprintf("(%d, %d)", coord.row, coord.col);
}

std::vector<Neighbor> neighbors(Coord coord, size_t width, size_t height)
{
	static const int kOffsets[4][2] = {
		{-1,  0}, // top
		{ 0, -1}, // left
		{ 1,  0}, // bottom
		{ 0,  1}, // right
	};

	std::vector<Neighbor> result;
	result.reserve(4);
	for (int side = 0; side < 4; ++side) {
		const Coord neighbor{coord.row + kOffsets[side][0], coord.col + kOffsets[side][1]};
		if (in_bounds(neighbor, width, height)) {
			result.emplace_back(static_cast<Side>(side), neighbor);
		}
	}
	return result;
}
