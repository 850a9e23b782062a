#include "edge.hpp"

EdgeSignature read_edge(const Image& image, Side side)
{
	CHECK_F(image.width() > 0 && image.height() > 0, "Can't read the edge of an empty image");

	const size_t last_x = image.width() - 1;
	const size_t last_y = image.height() - 1;

	EdgeSignature result;
	if (side == kTop || side == kBottom) {
		const size_t y = side == kTop ? 0 : last_y;
		for (const auto x : irange(image.width())) {
			result.push_back(image.get(x, y));
		}
	} else {
		const size_t x = side == kLeft ? 0 : last_x;
		for (const auto y : irange(image.height())) {
			result.push_back(image.get(x, y));
		}
	}
	return result;
}

Borders read_borders(const Image& image)
{
	return Borders{{
		read_edge(image, kTop),
		read_edge(image, kLeft),
		read_edge(image, kBottom),
		read_edge(image, kRight),
	}};
}

EdgeHash hash_from_edge(const EdgeSignature& edge)
{
	// FNV-1a over the packed pixels.
	EdgeHash result = 14695981039346656037ull;
	for (const RGBA& pixel : edge) {
		result ^= pixel.packed();
		result *= 1099511628211ull;
	}
	return result;
}
