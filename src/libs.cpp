// Implementations of the single-header libraries.

#define LOGURU_IMPLEMENTATION 1
#include <loguru.hpp>

#define CONFIGURU_IMPLEMENTATION 1
#include <configuru.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <jo_gif.cpp>
