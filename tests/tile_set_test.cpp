#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include "tile_set.hpp"
#include "test_tiles.hpp"

TEST(TileSetTest, SplitsWeightBetweenVariants)
{
	TileSet tile_set;
	ASSERT_EQ(tile_set.add_tile("abcd",  asymmetric_image(),     3.0), Result::kSuccess);
	ASSERT_EQ(tile_set.add_tile("solid", solid_image(2, kRed),   5.0), Result::kSuccess);
	EXPECT_EQ(tile_set.size(), 9u);

	std::map<std::string, double> sums;
	for (const auto& tile : tile_set.tiles()) {
		sums[tile.source()] += tile_set.get_weight(tile);
	}
	EXPECT_NEAR(sums["abcd"],  3.0, 1e-9);
	EXPECT_NEAR(sums["solid"], 5.0, 1e-9);

	const Tile* variant = tile_set.find("abcd", true, 2);
	ASSERT_NE(variant, nullptr);
	EXPECT_NEAR(tile_set.get_weight(*variant), 3.0 / 8, 1e-9);
}

TEST(TileSetTest, KnotWeightsAreConserved)
{
	const TileSet knots = make_knots();
	EXPECT_EQ(knots.size(), 16u);

	std::map<std::string, double> sums;
	for (const auto& tile : knots.tiles()) {
		sums[tile.source()] += knots.get_weight(tile);
	}
	EXPECT_NEAR(sums["corner"], 4.0, 1e-9);
	EXPECT_NEAR(sums["cross"],  2.0, 1e-9);
	EXPECT_NEAR(sums["empty"],  1.0, 1e-9);
	EXPECT_NEAR(sums["end"],    1.0, 1e-9);
	EXPECT_NEAR(sums["line"],   2.0, 1e-9);
	EXPECT_NEAR(sums["t"],      4.0, 1e-9);
}

TEST(TileSetTest, TilesAreSortedByIdentity)
{
	TileSet tile_set;
	tile_set.add_tile("zebra", asymmetric_image(),   1.0);
	tile_set.add_tile("apple", solid_image(2, kRed), 1.0);

	const auto& tiles = tile_set.tiles();
	EXPECT_TRUE(std::is_sorted(tiles.begin(), tiles.end()));
	EXPECT_EQ(tiles.front().source(), "apple");
}

TEST(TileSetTest, RejectsDimensionMismatch)
{
	TileSet tile_set;
	ASSERT_EQ(tile_set.add_tile("small", solid_image(2, kRed), 1.0), Result::kSuccess);
	EXPECT_EQ(tile_set.add_tile("big", solid_image(3, kRed), 1.0), Result::kFail);
	EXPECT_EQ(tile_set.size(), 1u);
	EXPECT_EQ(tile_set.tile_width(),  2u);
	EXPECT_EQ(tile_set.tile_height(), 2u);
	EXPECT_EQ(tile_set.find("big", false, 0), nullptr);
}

TEST(TileSetTest, RejectsBadTiles)
{
	TileSet tile_set;
	EXPECT_EQ(tile_set.add_tile("wide",  Image(3, 2, kRed),      1.0), Result::kFail);
	EXPECT_EQ(tile_set.add_tile("empty", Image(),                1.0), Result::kFail);
	EXPECT_EQ(tile_set.add_tile("free",  solid_image(2, kRed),   0.0), Result::kFail);
	EXPECT_TRUE(tile_set.empty());

	ASSERT_EQ(tile_set.add_tile("red", solid_image(2, kRed), 1.0), Result::kSuccess);
	EXPECT_EQ(tile_set.add_tile("red", solid_image(2, kBlue), 1.0), Result::kFail);
	EXPECT_EQ(tile_set.size(), 1u);
}

TEST(TileSetTest, LoadsThroughTileLoader)
{
	std::vector<std::string> requested;
	TileSet tile_set([&](const std::string& name) {
		requested.push_back(name);
		return solid_image(4, kGreen);
	});

	ASSERT_EQ(tile_set.add_tile("grass", 2.0), Result::kSuccess);
	EXPECT_EQ(requested, std::vector<std::string>{"grass"});
	EXPECT_EQ(tile_set.tile_width(), 4u);
	EXPECT_NEAR(tile_set.get_weight(tile_set.tiles()[0]), 2.0, 1e-9);
}

TEST(TileSetTest, MatchesBordersBySide)
{
	const TileSet knots = make_knots();
	const EdgeSignature connected    = {kBlue, kWhite, kBlue};
	const EdgeSignature disconnected = {kBlue, kBlue,  kBlue};

	for (int side = 0; side < 4; ++side) {
		const Tiles& open   = knots.match_border(connected,    static_cast<Side>(side));
		const Tiles& closed = knots.match_border(disconnected, static_cast<Side>(side));
		EXPECT_EQ(open.size(),   8u);
		EXPECT_EQ(closed.size(), 8u);
		for (const auto& tile : open) {
			EXPECT_EQ(tile.border(static_cast<Side>(side)), connected);
		}
	}

	// The unrotated end connects at the top but not on the left.
	const Tile* end = knots.find("end", false, 0);
	ASSERT_NE(end, nullptr);
	EXPECT_EQ(knots.match_border(connected, kTop).count(*end), 1u);
	EXPECT_EQ(knots.match_border(connected, kLeft).count(*end), 0u);

	EXPECT_TRUE(knots.match_border({kRed, kRed, kRed}, kTop).empty());
}

TEST(TileSetTest, FindsOnlySurvivingVariants)
{
	const TileSet knots = make_knots();
	EXPECT_NE(knots.find("cross", false, 0), nullptr);
	EXPECT_EQ(knots.find("cross", false, 1), nullptr);
	EXPECT_EQ(knots.find("cross", true,  0), nullptr);
	EXPECT_NE(knots.find("line",  false, 1), nullptr);
	EXPECT_EQ(knots.find("line",  false, 2), nullptr);
	EXPECT_EQ(knots.find("nope",  false, 0), nullptr);
}
