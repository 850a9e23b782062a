#ifndef EDGEWFC_IMAGE_IO_HPP
#define EDGEWFC_IMAGE_IO_HPP

#include <string>
#include "constants.hpp"

// Any format stb_image understands, as RGBA. Images without alpha come out opaque.
Image load_image(const std::string& path);

void write_png(const std::string& path, const Image& image);

#endif
