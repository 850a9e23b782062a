#ifndef EDGEWFC_IMAGE_HPP
#define EDGEWFC_IMAGE_HPP

#include "collapse.hpp"
#include "constants.hpp"

Image upsample(const Image& image, size_t factor);

// Blit every placed tile. Cells without a tile are kUnplacedColor.
Image rasterize(const Placement& placed, size_t width, size_t height, size_t tile_size);

// Like rasterize, but frontier cells show the weighted average of their candidates.
Image preview(const Collapse& collapse, const TileSet& tile_set);

#endif
