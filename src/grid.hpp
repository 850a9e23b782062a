#ifndef EDGEWFC_GRID_HPP
#define EDGEWFC_GRID_HPP

#include <string>
#include <utility>
#include <vector>

// The order matters: it is the order of the edge signatures of a tile,
// and opposite(side) == (side + 2) % 4.
enum Side
{
	kTop    = 0,
	kLeft   = 1,
	kBottom = 2,
	kRight  = 3,
};

inline Side opposite(Side side) { return static_cast<Side>((side + 2) % 4); }

const char* to_string(Side side);

struct Coord
{
	int row, col;

	bool operator==(Coord o) const { return row == o.row && col == o.col; }
	bool operator!=(Coord o) const { return !(*this == o); }

	// Natural reading order: row first, then column.
	bool operator<(Coord o) const
	{
		return row != o.row ? row < o.row : col < o.col;
	}
};

std::string to_string(Coord coord);

inline bool in_bounds(Coord coord, size_t width, size_t height)
{
	return 0 <= coord.row && coord.row < static_cast<int>(height)
	    && 0 <= coord.col && coord.col < static_cast<int>(width);
}

using Neighbor = std::pair<Side, Coord>;

// The valid neighbors of coord in Side order, each tagged with the side of coord facing it.
std::vector<Neighbor> neighbors(Coord coord, size_t width, size_t height);

#endif
