#include <gtest/gtest.h>
#include <algorithm>
#include <unordered_set>
#include "tile.hpp"
#include "test_tiles.hpp"

TEST(TileTest, ReadsEdgesInTraversalOrder)
{
	// a b
	// c d
	const Image image = asymmetric_image();
	const Borders borders = read_borders(image);

	EXPECT_EQ(borders[kTop],    (EdgeSignature{kRed,   kGreen}));
	EXPECT_EQ(borders[kLeft],   (EdgeSignature{kRed,   kBlue}));
	EXPECT_EQ(borders[kBottom], (EdgeSignature{kBlue,  kYellow}));
	EXPECT_EQ(borders[kRight],  (EdgeSignature{kGreen, kYellow}));
}

TEST(TileTest, RotatesCounterClockwise)
{
	// a b    b d
	// c d -> a c
	const Image rotated = rotate(asymmetric_image());
	EXPECT_EQ(rotated, Image(2, 2, std::vector<RGBA>{kGreen, kYellow, kRed, kBlue}));
}

TEST(TileTest, ReflectsLeftRight)
{
	const Image reflected = reflect(asymmetric_image());
	EXPECT_EQ(reflected, Image(2, 2, std::vector<RGBA>{kGreen, kRed, kYellow, kBlue}));
}

TEST(TileTest, ReflectsBeforeRotating)
{
	// Mirror then a quarter turn counter-clockwise is a transpose.
	const Image transformed = transform(asymmetric_image(), true, 1);
	EXPECT_EQ(transformed, Image(2, 2, std::vector<RGBA>{kRed, kBlue, kGreen, kYellow}));

	const Tile tile("abcd", true, 1, asymmetric_image());
	EXPECT_EQ(tile.image(), transformed);
	EXPECT_EQ(tile.border(kTop), (EdgeSignature{kRed, kBlue}));
}

TEST(TileTest, FourRotationsAreIdentity)
{
	EXPECT_EQ(transform(asymmetric_image(), false, 0), asymmetric_image());
	EXPECT_EQ(rotate(transform(asymmetric_image(), false, 3)), asymmetric_image());
}

TEST(TileTest, IdentityIgnoresPixels)
{
	const Tile a("same", false, 0, solid_image(2, kRed));
	const Tile b("same", false, 0, solid_image(2, kBlue));
	const Tile c("same", false, 1, solid_image(2, kRed));
	const Tile d("other", false, 0, solid_image(2, kRed));

	EXPECT_EQ(a, b);
	EXPECT_EQ(TileHasher()(a), TileHasher()(b));
	EXPECT_NE(a, c);
	EXPECT_NE(a, d);
}

TEST(TileTest, OrdersBySourceThenReflectionThenRotation)
{
	const Image image = solid_image(2, kRed);
	EXPECT_LT(Tile("a", true,  3, image), Tile("b", false, 0, image));
	EXPECT_LT(Tile("a", false, 3, image), Tile("a", true,  0, image));
	EXPECT_LT(Tile("a", false, 1, image), Tile("a", false, 2, image));
	EXPECT_FALSE(Tile("a", false, 1, image) < Tile("a", false, 1, image));
}

TEST(TileTest, FullySymmetricTileHasOneVariant)
{
	const auto variants = canonical_variants("solid", solid_image(3, kRed));
	ASSERT_EQ(variants.size(), 1u);
	EXPECT_EQ(variants[0], Tile("solid", false, 0, solid_image(3, kRed)));

	EXPECT_EQ(canonical_variants("cross", image_from_rows({".#.", "###", ".#."})).size(), 1u);
}

TEST(TileTest, AsymmetricTileHasEightVariants)
{
	const auto variants = canonical_variants("abcd", asymmetric_image());
	ASSERT_EQ(variants.size(), 8u);

	std::unordered_set<Tile, TileHasher> unique(variants.begin(), variants.end());
	EXPECT_EQ(unique.size(), 8u);
	EXPECT_TRUE(std::is_sorted(variants.begin(), variants.end()));
}

TEST(TileTest, PartialSymmetries)
{
	EXPECT_EQ(canonical_variants("line",   image_from_rows({".#.", ".#.", ".#."})).size(), 2u);
	EXPECT_EQ(canonical_variants("corner", image_from_rows({".#.", ".##", "..."})).size(), 4u);
	EXPECT_EQ(canonical_variants("t",      image_from_rows({".#.", "###", "..."})).size(), 4u);
}

TEST(TileTest, KeepsFirstOfDuplicateVariants)
{
	// A vertical line is its own mirror image, so only unreflected variants survive.
	const auto variants = canonical_variants("line", image_from_rows({".#.", ".#.", ".#."}));
	ASSERT_EQ(variants.size(), 2u);
	EXPECT_EQ(variants[0].reflected(), false);
	EXPECT_EQ(variants[0].rotation(), 0);
	EXPECT_EQ(variants[1].reflected(), false);
	EXPECT_EQ(variants[1].rotation(), 1);
}
