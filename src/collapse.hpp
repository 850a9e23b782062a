#ifndef EDGEWFC_COLLAPSE_HPP
#define EDGEWFC_COLLAPSE_HPP

#include <map>
#include <utility>
#include <vector>
#include "constants.hpp"
#include "grid.hpp"
#include "result.hpp"
#include "tile.hpp"
#include "tile_set.hpp"

using Placement = std::map<Coord, Tile>;  // What has been decided
using Frontier  = std::map<Coord, Tiles>; // Undecided cells next to decided ones, with what they still allow
using Seeds     = std::vector<std::pair<Coord, Tile>>;

// One generation run over a width X height grid.
// Cells are placed one at a time; each placement narrows the candidates of its
// unplaced neighbors to the tiles whose facing border matches.
// There is no backtracking: once a cell runs out of candidates the run has failed
// and refuses to do anything more.
class Collapse
{
public:
	Collapse(const TileSet& tile_set, size_t width, size_t height);

	// Place tile at coord and propagate to its neighbors.
	// Returns kFail on contradiction (see contradiction()), else kSuccess.
	Result place(Coord coord, const Tile& tile);

	// Place the seeds in order. Without seeds a random tile is placed at (0, 0).
	Result seed(const Seeds& seeds, RandomDouble& random_double);

	// Resolve the most constrained frontier cell.
	// kUnfinished if there is more to do, kSuccess when the grid is full.
	Result step(RandomDouble& random_double);

	// seed, then step until done or failed.
	Result run(const Seeds& seeds, RandomDouble& random_double);

	// The frontier cell with the fewest candidates. Ties go to the first in (row, col) order.
	Coord find_most_constrained() const;

	bool done()   const { return _placed.size() == _width * _height; }
	bool failed() const { return _failed; }

	// The cell that ran out of candidates. Only valid if failed().
	Coord contradiction() const { return _contradiction; }

	const Placement& placed()   const { return _placed;   }
	const Frontier&  frontier() const { return _frontier; }
	size_t           width()    const { return _width;    }
	size_t           height()   const { return _height;   }

private:
	const TileSet& _tile_set;
	size_t         _width;
	size_t         _height;
	Placement      _placed;
	Frontier       _frontier;
	bool           _failed        = false;
	Coord          _contradiction = {-1, -1};
};

// Fill a width X height grid. On success *out_placed has every cell.
// On failure *out_contradiction (if given) is the cell that ran out of candidates.
Result generate(
	const TileSet& tile_set,
	size_t         width,
	size_t         height,
	const Seeds&   seeds,
	RandomDouble&  random_double,
	Placement*     out_placed,
	Coord*         out_contradiction = nullptr);

#endif
