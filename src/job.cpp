#include <emilib/strprintf.hpp>
#include <loguru.hpp>
#include "image.hpp"
#include "image_io.hpp"
#include "job.hpp"
#include "random.hpp"

TileSet make_tile_set(const std::string& tile_dir, const configuru::Config& config)
{
	const TileLoader tile_loader = [tile_dir](const std::string& tile_name) -> Image
	{
		return load_image(emilib::strprintf("%s%s.png", tile_dir.c_str(), tile_name.c_str()));
	};

	TileSet tile_set(tile_loader);

	for (const auto& tile : config["tiles"].as_array()) {
		const std::string tile_name = tile["name"].as_string();
		const double      weight    = tile.get_or("weight", 1.0);
		CHECK_F(tile_set.add_tile(tile_name, weight) == Result::kSuccess,
		        "Failed to add tile '%s' from %s", tile_name.c_str(), tile_dir.c_str());
	}

	LOG_F(INFO, "%lu distinct tiles of size %lux%lu",
	      tile_set.size(), tile_set.tile_width(), tile_set.tile_height());
	return tile_set;
}

Seeds make_seeds(const TileSet& tile_set, const configuru::Config& config, size_t width, size_t height)
{
	Seeds seeds;
	if (!config.count("pins")) { return seeds; }

	for (const auto& pin : config["pins"].as_array()) {
		const Coord       coord{pin["row"].get<int>(), pin["col"].get<int>()};
		const std::string tile_name = pin["tile"].as_string();
		const bool        reflected = pin.get_or("reflected", false);
		const int         rotation  = pin.get_or("rotation",  0);

		CHECK_F(in_bounds(coord, width, height), "Pin at %s is outside the %lux%lu grid",
		        to_string(coord).c_str(), width, height);

		const Tile* tile = tile_set.find(tile_name, reflected, rotation);
		CHECK_F(tile != nullptr, "No tile variant (%s, %s, %d): unknown, or a duplicate of another variant",
		        tile_name.c_str(), reflected ? "reflected" : "unreflected", rotation);

		seeds.emplace_back(coord, *tile);
	}

	return seeds;
}

static void add_frame(jo_gif_t* gif_out, const Collapse& collapse, const TileSet& tile_set, int delay)
{
	const auto image = preview(collapse, tile_set);
	jo_gif_frame(gif_out, (uint8_t*)image.data(), delay, kGifSeparatePalette);
}

Result run(Collapse* collapse, const TileSet& tile_set, const Seeds& seeds,
           RandomDouble& random_double, jo_gif_t* gif_out)
{
	if (!gif_out) {
		return collapse->run(seeds, random_double);
	}

	Result result = collapse->seed(seeds, random_double);
	if (result == Result::kSuccess) {
		result = collapse->done() ? Result::kSuccess : Result::kUnfinished;
	}

	for (size_t l = 0; result == Result::kUnfinished; ++l) {
		if (l % kGifInterval == 0) {
			add_frame(gif_out, *collapse, tile_set, kGifDelayCentiSec);
		}
		result = collapse->step(random_double);
	}

	// Pause on the last image:
	add_frame(gif_out, *collapse, tile_set, kGifEndPauseCentiSec);

	LOG_F(INFO, "%s after placing %lu tiles", to_string(result), collapse->placed().size());
	return result;
}

void run_and_write(const Options& options, const std::string& name,
                   const configuru::Config& config, const TileSet& tile_set)
{
	const size_t   out_width   = config.get_or("width",       48);
	const size_t   out_height  = config.get_or("height",      48);
	const size_t   upscale     = config.get_or("upscale",      1);
	const size_t   screenshots = config.get_or("screenshots",  2);
	const size_t   attempts    = config.get_or("attempts",    (int)kDefaultAttempts);
	const unsigned base_seed   = config.get_or("seed",        (int)kDefaultSeed);

	const Seeds seeds = make_seeds(tile_set, config, out_width, out_height);

	for (const auto i : irange(screenshots)) {
		bool succeeded = false;

		for (const auto attempt : irange(attempts)) {
			const unsigned seed = base_seed + static_cast<unsigned>(i * attempts + attempt);
			LOG_SCOPE_F(INFO, "Attempt %lu with seed %u", attempt, seed);

			RandomDouble random_double = make_random_double(seed);
			Collapse collapse(tile_set, out_width, out_height);

			jo_gif_t gif;

			if (options.export_gif) {
				const auto gif_path = emilib::strprintf("output/%s_%lu.gif", name.c_str(), i);
				const int gif_palette_size = 255;
				gif = jo_gif_start(gif_path.c_str(),
				                   out_width * tile_set.tile_width(), out_height * tile_set.tile_height(),
				                   0, gif_palette_size);
			}

			const auto result = run(&collapse, tile_set, seeds, random_double, options.export_gif ? &gif : nullptr);

			if (options.export_gif) {
				jo_gif_end(&gif);
			}

			if (result == Result::kSuccess) {
				const auto image = rasterize(collapse.placed(), out_width, out_height, tile_set.tile_width());
				write_png(emilib::strprintf("output/%s_%lu.png", name.c_str(), i), upsample(image, upscale));
				succeeded = true;
				break;
			}

			LOG_F(WARNING, "Contradiction at %s", to_string(collapse.contradiction()).c_str());
		}

		if (!succeeded) {
			LOG_F(ERROR, "Gave up on %s_%lu after %lu attempts", name.c_str(), i, attempts);
		}
	}
}

void run_config_file(const Options& options, const std::string& path)
{
	LOG_F(INFO, "Running all jobs in %s", path.c_str());
	const auto jobs = configuru::parse_file(path, configuru::CFG);
	const auto image_dir = jobs["image_dir"].as_string();

	if (jobs.count("tiled")) {
		for (const auto& p : jobs["tiled"].as_object()) {
			LOG_SCOPE_F(INFO, "Tiled %s", p.key().c_str());
			const std::string subdir   = p.value()["subdir"].as_string();
			const auto        tile_set = make_tile_set(image_dir + subdir + "/", p.value());
			run_and_write(options, p.key(), p.value(), tile_set);
			p.value().check_dangling();
		}
	}
}
