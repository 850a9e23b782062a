#ifndef EDGEWFC_JOB_HPP
#define EDGEWFC_JOB_HPP

#include <string>
#include <configuru.hpp>

#define JO_GIF_HEADER_FILE_ONLY
#include <jo_gif.cpp>

#include "collapse.hpp"
#include "options.hpp"
#include "tile_set.hpp"

// Tiles are loaded from tile_dir/<name>.png
TileSet make_tile_set(const std::string& tile_dir, const configuru::Config& config);

// The "pins" of a job. Every pin must name a variant in tile_set and lie inside the grid.
Seeds make_seeds(const TileSet& tile_set, const configuru::Config& config, size_t width, size_t height);

// Like Collapse::run, but records a frame every kGifInterval placements if gif_out is set.
Result run(Collapse* collapse, const TileSet& tile_set, const Seeds& seeds,
           RandomDouble& random_double, jo_gif_t* gif_out);

void run_and_write(const Options& options, const std::string& name,
                   const configuru::Config& config, const TileSet& tile_set);

void run_config_file(const Options& options, const std::string& path);

#endif
