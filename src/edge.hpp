#ifndef EDGEWFC_EDGE_HPP
#define EDGEWFC_EDGE_HPP

#include <array>
#include <vector>
#include "constants.hpp"
#include "grid.hpp"

// The pixels along one side of a tile, left to right for top/bottom and
// top to bottom for left/right. All edges in a TileSet have the same length.
using EdgeSignature = std::vector<RGBA>;
using EdgeHash      = uint64_t;
using Borders       = std::array<EdgeSignature, 4>; // Indexed by Side

EdgeSignature read_edge(const Image& image, Side side);
Borders       read_borders(const Image& image);

EdgeHash hash_from_edge(const EdgeSignature& edge);

struct EdgeHasher
{
	size_t operator()(const EdgeSignature& edge) const { return hash_from_edge(edge); }
};

#endif
