#include <algorithm>
#include <loguru.hpp>
#include "tile_set.hpp"

Result TileSet::add_tile(const std::string& name, double weight)
{
	CHECK_F(static_cast<bool>(_tile_loader), "No tile loader to load '%s' with", name.c_str());
	return add_tile(name, _tile_loader(name), weight);
}

Result TileSet::add_tile(const std::string& name, const Image& image, double weight)
{
	if (image.width() == 0 || image.width() != image.height()) {
		LOG_F(ERROR, "Tile '%s' is %lux%lu, but tiles must be square",
		      name.c_str(), image.width(), image.height());
		return Result::kFail;
	}

	if (!_tiles.empty() && (image.width() != _tile_width || image.height() != _tile_height)) {
		LOG_F(ERROR, "Tile '%s' is %lux%lu, but the other tiles are %lux%lu",
		      name.c_str(), image.width(), image.height(), _tile_width, _tile_height);
		return Result::kFail;
	}

	if (!(weight > 0)) {
		LOG_F(ERROR, "Tile '%s' has weight %f, but weights must be positive", name.c_str(), weight);
		return Result::kFail;
	}

	const bool already_added = std::any_of(_tiles.begin(), _tiles.end(),
		[&](const Tile& tile) { return tile.source() == name; });
	if (already_added) {
		LOG_F(ERROR, "Tile '%s' was already added", name.c_str());
		return Result::kFail;
	}

	_tile_width  = image.width();
	_tile_height = image.height();

	const auto variants = canonical_variants(name, image);
	const double variant_weight = weight / variants.size();

	for (const auto& tile : variants) {
		_weights[tile] = variant_weight;
		for (int side = 0; side < 4; ++side) {
			_border_map[side][tile.border(static_cast<Side>(side))].insert(tile);
		}
		_tiles.insert(std::upper_bound(_tiles.begin(), _tiles.end(), tile), tile);
	}

	LOG_F(1, "Tile '%s': %lu distinct variants of weight %.3f", name.c_str(), variants.size(), variant_weight);
	return Result::kSuccess;
}

double TileSet::get_weight(const Tile& tile) const
{
	const auto it = _weights.find(tile);
	CHECK_F(it != _weights.end(), "%s is not in the tile set", to_string(tile).c_str());
	return it->second;
}

const Tiles& TileSet::match_border(const EdgeSignature& signature, Side side) const
{
	static const Tiles kNoTiles;
	const auto& border_map = _border_map[side];
	const auto it = border_map.find(signature);
	return it == border_map.end() ? kNoTiles : it->second;
}

const Tile* TileSet::find(const std::string& source, bool reflected, int rotation) const
{
	for (const auto& tile : _tiles) {
		if (tile.source() == source && tile.reflected() == reflected && tile.rotation() == rotation) {
			return &tile;
		}
	}
	return nullptr;
}
