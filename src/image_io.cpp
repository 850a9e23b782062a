#include <loguru.hpp>
#include <stb_image.h>
#include <stb_image_write.h>
#include "image_io.hpp"

Image load_image(const std::string& path)
{
	ERROR_CONTEXT("loading tile image", path.c_str());
	int width, height, comp;
	RGBA* rgba = reinterpret_cast<RGBA*>(stbi_load(path.c_str(), &width, &height, &comp, 4));
	CHECK_NOTNULL_F(rgba, "%s", stbi_failure_reason());
	const auto num_pixels = width * height;

	Image result(width, height, std::vector<RGBA>(rgba, rgba + num_pixels));
	stbi_image_free(rgba);
	return result;
}

void write_png(const std::string& path, const Image& image)
{
	CHECK_F(stbi_write_png(path.c_str(), image.width(), image.height(), 4, image.data(), 0) != 0,
	        "Failed to write image to %s", path.c_str());
	LOG_F(INFO, "Wrote %s", path.c_str());
}
