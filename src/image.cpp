#include <algorithm>
#include <cmath>
#include "image.hpp"

Image upsample(const Image& image, size_t factor)
{
	CHECK_GT_F(factor, 0u);
	Image result(image.width() * factor, image.height() * factor);
	for (const auto y : irange(result.height())) {
		for (const auto x : irange(result.width())) {
			result.set(x, y, image.get(x / factor, y / factor));
		}
	}
	return result;
}

static void blit(Image* canvas, Coord coord, const Image& tile_image)
{
	const size_t x0 = coord.col * tile_image.width();
	const size_t y0 = coord.row * tile_image.height();
	for (const auto yt : irange(tile_image.height())) {
		for (const auto xt : irange(tile_image.width())) {
			canvas->set(x0 + xt, y0 + yt, tile_image.get(xt, yt));
		}
	}
}

static uint8_t to_channel(double value)
{
	return static_cast<uint8_t>(std::min(255L, std::max(0L, std::lround(value))));
}

Image rasterize(const Placement& placed, size_t width, size_t height, size_t tile_size)
{
	Image result(width * tile_size, height * tile_size, kUnplacedColor);

	for (const auto& it : placed) {
		CHECK_EQ_F(it.second.width(), tile_size, "%s has the wrong size", to_string(it.second).c_str());
		blit(&result, it.first, it.second.image());
	}

	return result;
}

Image preview(const Collapse& collapse, const TileSet& tile_set)
{
	const size_t tile_size = tile_set.tile_width();
	Image result = rasterize(collapse.placed(), collapse.width(), collapse.height(), tile_size);

	for (const auto& it : collapse.frontier()) {
		const Tiles& candidates = it.second;
		if (candidates.empty()) { continue; } // The contradiction, if any

		double sum = 0;
		for (const auto& tile : candidates) {
			sum += tile_set.get_weight(tile);
		}

		Image blend(tile_size, tile_size);
		for (const auto yt : irange(tile_size)) {
			for (const auto xt : irange(tile_size)) {
				double r = 0, g = 0, b = 0, a = 0;
				for (const auto& tile : candidates) {
					const double w = tile_set.get_weight(tile) / sum;
					const RGBA   c = tile.image().get(xt, yt);
					r += c.r * w;
					g += c.g * w;
					b += c.b * w;
					a += c.a * w;
				}
				blend.set(xt, yt, RGBA{to_channel(r), to_channel(g), to_channel(b), to_channel(a)});
			}
		}
		blit(&result, it.first, blend);
	}

	return result;
}
