#ifndef EDGEWFC_TILE_SET_HPP
#define EDGEWFC_TILE_SET_HPP

#include <array>
#include <string>
#include <unordered_map>
#include <vector>
#include "constants.hpp"
#include "edge.hpp"
#include "result.hpp"
#include "tile.hpp"

// A catalog of canonical tile variants with their weights, indexed by border.
// Built once, then only read from.
class TileSet
{
public:
	TileSet() = default;
	explicit TileSet(TileLoader tile_loader) : _tile_loader(std::move(tile_loader)) {}

	// Loads the base image through the tile loader, then adds it as below.
	Result add_tile(const std::string& name, double weight);

	// Adds every distinct rotation/reflection of image, splitting weight evenly between them.
	// Fails, leaving the set untouched, if the image is not square, does not have the size
	// of the tiles already added, if weight is not positive or if name was already added.
	Result add_tile(const std::string& name, const Image& image, double weight);

	double get_weight(const Tile& tile) const;

	// All tiles whose border on the given side is exactly signature.
	const Tiles& match_border(const EdgeSignature& signature, Side side) const;

	// nullptr if there is no such variant (e.g. it was a duplicate of another one).
	const Tile* find(const std::string& source, bool reflected, int rotation) const;

	const std::vector<Tile>& tiles() const { return _tiles; } // Sorted by identity

	size_t size()        const { return _tiles.size();  }
	bool   empty()       const { return _tiles.empty(); }
	size_t tile_width()  const { return _tile_width;    }
	size_t tile_height() const { return _tile_height;   }

private:
	using BorderMap = std::unordered_map<EdgeSignature, Tiles, EdgeHasher>;

	TileLoader                                   _tile_loader;
	std::vector<Tile>                            _tiles;
	std::unordered_map<Tile, double, TileHasher> _weights;
	std::array<BorderMap, 4>                     _border_map; // Indexed by Side
	size_t                                       _tile_width  = 0;
	size_t                                       _tile_height = 0;
};

#endif
