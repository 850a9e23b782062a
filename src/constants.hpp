#ifndef EDGEWFC_CONSTANTS_HPP
#define EDGEWFC_CONSTANTS_HPP

#include <functional>
#include <string>
#include <emilib/irange.hpp>
#include "array2d.hpp"
#include "rgba.hpp"

const auto kUsage = R"(
edgewfc [-h/--help] [--gif] [job=samples.cfg, ...]
	-h/--help   Print this help
	--gif       Export GIF images of the process
	file        Jobs to run
)";

using emilib::irange;

using Image        = Array2D<RGBA>;
using RandomDouble = std::function<double()>; // Uniform in [0, 1)
using TileLoader   = std::function<Image(const std::string& tile_name)>;

const unsigned kDefaultSeed         = 8675309;
const size_t   kDefaultAttempts     =  10; // Fresh seeds to try before giving up on an image
const bool     kGifSeparatePalette  = true;
const size_t   kGifInterval         =  16; // Save a frame every X placements
const int      kGifDelayCentiSec    =   1;
const int      kGifEndPauseCentiSec = 200;
const RGBA     kUnplacedColor       = {0, 0, 0, 255};

#endif
