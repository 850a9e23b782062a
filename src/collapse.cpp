#include <algorithm>
#include <iterator>
#include <loguru.hpp>
#include "collapse.hpp"
#include "random.hpp"

Collapse::Collapse(const TileSet& tile_set, size_t width, size_t height)
	: _tile_set(tile_set)
	, _width(width)
	, _height(height)
{
	CHECK_GT_F(width,  0u);
	CHECK_GT_F(height, 0u);
}

Result Collapse::place(Coord coord, const Tile& tile)
{
	if (_failed) { return Result::kFail; }

	CHECK_F(in_bounds(coord, _width, _height), "%s is outside the %lux%lu grid",
	        to_string(coord).c_str(), _width, _height);
	CHECK_F(_placed.count(coord) == 0, "%s was already placed", to_string(coord).c_str());

	_placed.emplace(coord, tile);
	_frontier.erase(coord);

	for (const auto& neighbor : neighbors(coord, _width, _height)) {
		const Side  side           = neighbor.first;
		const Coord frontier_coord = neighbor.second;
		if (_placed.count(frontier_coord)) { continue; }

		const Tiles& valid_tiles = _tile_set.match_border(tile.border(side), opposite(side));

		auto it = _frontier.find(frontier_coord);
		if (it == _frontier.end()) {
			it = _frontier.emplace(frontier_coord, valid_tiles).first;
		} else {
			Tiles narrowed;
			std::set_intersection(it->second.begin(), it->second.end(),
			                      valid_tiles.begin(), valid_tiles.end(),
			                      std::inserter(narrowed, narrowed.end()));
			it->second = std::move(narrowed);
		}

		if (it->second.empty()) {
			LOG_F(INFO, "Contradiction at %s after placing %s at %s",
			      to_string(frontier_coord).c_str(), to_string(tile).c_str(), to_string(coord).c_str());
			_failed        = true;
			_contradiction = frontier_coord;
			return Result::kFail;
		}
	}

	return Result::kSuccess;
}

Result Collapse::seed(const Seeds& seeds, RandomDouble& random_double)
{
	if (seeds.empty()) {
		CHECK_F(!_tile_set.empty(), "Can't generate anything from an empty tile set");
		const auto& tiles = _tile_set.tiles();
		return place(Coord{0, 0}, tiles[pick_uniform(tiles.size(), random_double())]);
	}

	for (const auto& seed : seeds) {
		if (place(seed.first, seed.second) == Result::kFail) {
			return Result::kFail;
		}
	}
	return Result::kSuccess;
}

Coord Collapse::find_most_constrained() const
{
	CHECK_F(!_frontier.empty(), "Nothing on the frontier");

	// _frontier is ordered by (row, col), so keeping the first minimum breaks ties.
	auto best = _frontier.begin();
	for (auto it = _frontier.begin(); it != _frontier.end(); ++it) {
		if (it->second.size() < best->second.size()) {
			best = it;
		}
	}
	return best->first;
}

Result Collapse::step(RandomDouble& random_double)
{
	if (_failed) { return Result::kFail; }
	if (done())  { return Result::kSuccess; }

	const Coord coord = find_most_constrained();
	const std::vector<Tile> possibilities(_frontier.at(coord).begin(), _frontier.at(coord).end());

	std::vector<double> weights;
	weights.reserve(possibilities.size());
	for (const auto& tile : possibilities) {
		weights.push_back(_tile_set.get_weight(tile));
	}

	const size_t r = spin_the_bottle(weights, random_double());
	if (place(coord, possibilities[r]) == Result::kFail) {
		return Result::kFail;
	}

	return done() ? Result::kSuccess : Result::kUnfinished;
}

Result Collapse::run(const Seeds& seeds, RandomDouble& random_double)
{
	if (seed(seeds, random_double) == Result::kFail) {
		LOG_F(INFO, "fail while seeding");
		return Result::kFail;
	}

	Result result = done() ? Result::kSuccess : Result::kUnfinished;
	while (result == Result::kUnfinished) {
		result = step(random_double);
	}

	LOG_F(INFO, "%s after placing %lu of %lu tiles", to_string(result), _placed.size(), _width * _height);
	return result;
}

Result generate(
	const TileSet& tile_set,
	size_t         width,
	size_t         height,
	const Seeds&   seeds,
	RandomDouble&  random_double,
	Placement*     out_placed,
	Coord*         out_contradiction)
{
	CHECK_NOTNULL_F(out_placed);

	Collapse collapse(tile_set, width, height);
	const Result result = collapse.run(seeds, random_double);

	if (result == Result::kSuccess) {
		*out_placed = collapse.placed();
	} else if (out_contradiction) {
		*out_contradiction = collapse.contradiction();
	}
	return result;
}
