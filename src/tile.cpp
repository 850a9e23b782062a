#include <algorithm>
#include <emilib/strprintf.hpp>
#include <loguru.hpp>
#include "tile.hpp"

Image reflect(const Image& image)
{
	Image result(image.width(), image.height());
	for (const auto y : irange(image.height())) {
		for (const auto x : irange(image.width())) {
			result.set(x, y, image.get(image.width() - 1 - x, y));
		}
	}
	return result;
}

Image rotate(const Image& image)
{
	CHECK_EQ_F(image.width(), image.height(), "Only square tiles can be rotated");
	const size_t tile_size = image.width();
	Image result(tile_size, tile_size);
	for (const auto y : irange(tile_size)) {
		for (const auto x : irange(tile_size)) {
			result.set(x, y, image.get(tile_size - 1 - y, x));
		}
	}
	return result;
}

Image transform(const Image& image, bool reflected, int rotation)
{
	CHECK_F(0 <= rotation && rotation < 4, "Bad rotation: %d", rotation);
	Image result = reflected ? reflect(image) : image;
	for (int i = 0; i < rotation; ++i) {
		result = rotate(result);
	}
	return result;
}

Tile::Tile(std::string source, bool reflected, int rotation, const Image& base_image)
	: _source(std::move(source))
	, _reflected(reflected)
	, _rotation(rotation)
{
	auto derived = std::make_shared<Derived>();
	derived->image   = transform(base_image, reflected, rotation);
	derived->borders = read_borders(derived->image);
	_derived = std::move(derived);
}

size_t TileHasher::operator()(const Tile& tile) const
{
	size_t result = std::hash<std::string>()(tile.source());
	result = result * 31 + (tile.reflected() ? 1 : 0);
	result = result * 31 + static_cast<size_t>(tile.rotation());
	return result;
}

std::string to_string(const Tile& tile)
{
	return emilib::strprintf("Tile(%s, %s, %d)",
		tile.source().c_str(), tile.reflected() ? "reflected" : "unreflected", tile.rotation());
}

std::vector<Tile> canonical_variants(const std::string& source, const Image& base_image)
{
	std::vector<Image> exists;
	std::vector<Tile>  result;

	for (const bool reflected : {false, true}) {
		for (int rotation = 0; rotation < 4; ++rotation) {
			Tile tile(source, reflected, rotation, base_image);
			if (std::find(exists.begin(), exists.end(), tile.image()) != exists.end()) {
				continue;
			}
			exists.push_back(tile.image());
			result.push_back(std::move(tile));
		}
	}

	std::sort(result.begin(), result.end());
	return result;
}
