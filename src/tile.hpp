#ifndef EDGEWFC_TILE_HPP
#define EDGEWFC_TILE_HPP

#include <memory>
#include <set>
#include <string>
#include <vector>
#include "constants.hpp"
#include "edge.hpp"

Image reflect(const Image& image);
Image rotate(const Image& image); // A quarter turn counter-clockwise

// Mirror left-right if reflected, then rotate the given number of quarter turns.
Image transform(const Image& image, bool reflected, int rotation);

// One symmetry variant of a base tile.
// Identity (and therefore ==, < and hashing) is (source, reflected, rotation) only.
// The transformed image and its borders are derived and shared between copies.
class Tile
{
public:
	Tile(std::string source, bool reflected, int rotation, const Image& base_image);

	const std::string& source()    const { return _source;    }
	bool               reflected() const { return _reflected; }
	int                rotation()  const { return _rotation;  }

	const Image&         image()            const { return _derived->image;         }
	size_t               width()            const { return _derived->image.width();  }
	size_t               height()           const { return _derived->image.height(); }
	const Borders&       borders()          const { return _derived->borders;       }
	const EdgeSignature& border(Side side)  const { return _derived->borders[side]; }

	bool operator==(const Tile& o) const
	{
		return _source == o._source && _reflected == o._reflected && _rotation == o._rotation;
	}
	bool operator!=(const Tile& o) const { return !(*this == o); }

	bool operator<(const Tile& o) const
	{
		if (_source    != o._source)    { return _source    < o._source;    }
		if (_reflected != o._reflected) { return _reflected < o._reflected; }
		return _rotation < o._rotation;
	}

private:
	struct Derived
	{
		Image   image;
		Borders borders;
	};

	std::string                    _source;
	bool                           _reflected;
	int                            _rotation;
	std::shared_ptr<const Derived> _derived;
};

struct TileHasher
{
	size_t operator()(const Tile& tile) const;
};

using Tiles = std::set<Tile>; // Ordered by identity

std::string to_string(const Tile& tile);

// The distinct variants of a base image, sorted by identity.
// Variants whose pixels equal an earlier variant (reflection outer, rotation inner) are dropped.
std::vector<Tile> canonical_variants(const std::string& source, const Image& base_image);

#endif
