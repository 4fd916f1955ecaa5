// =============================================================================
// GEOID levels and prefixes
// =============================================================================

#include <gtest/gtest.h>

#include "geo/geoid.hpp"

#include "duckdb/common/exception.hpp"

using namespace census_geocode;

TEST(GeoidTest, PrefixLengths) {
	const std::string block = "060372073011001";
	EXPECT_EQ(GeoidPrefix(block, GeoLevel::STATE), "06");
	EXPECT_EQ(GeoidPrefix(block, GeoLevel::COUNTY), "06037");
	EXPECT_EQ(GeoidPrefix(block, GeoLevel::TRACT), "06037207301");
	EXPECT_EQ(GeoidPrefix(block, GeoLevel::BLOCK_GROUP), "060372073011");
	EXPECT_EQ(GeoidPrefix(block, GeoLevel::BLOCK), block);
}

TEST(GeoidTest, PrefixesNest) {
	const std::string block = "360610076001000";
	const GeoLevel levels[] = {GeoLevel::STATE, GeoLevel::COUNTY, GeoLevel::TRACT, GeoLevel::BLOCK_GROUP,
	                           GeoLevel::BLOCK};
	for (size_t i = 1; i < sizeof(levels) / sizeof(levels[0]); i++) {
		auto coarse = GeoidPrefix(block, levels[i - 1]);
		auto fine = GeoidPrefix(block, levels[i]);
		EXPECT_EQ(fine.compare(0, coarse.size(), coarse), 0) << GeoLevelName(levels[i]);
		EXPECT_EQ(fine.size(), GeoidLength(levels[i]));
	}
}

TEST(GeoidTest, SplitBlockGeoid) {
	GeoidParts parts;
	ASSERT_TRUE(SplitBlockGeoid("060372073011001", parts));
	EXPECT_EQ(parts.state, "06");
	EXPECT_EQ(parts.county, "06037");
	EXPECT_EQ(parts.tract, "06037207301");
	EXPECT_EQ(parts.block_group, "060372073011");
	EXPECT_EQ(parts.block, "1001");

	EXPECT_FALSE(SplitBlockGeoid("06037207301", parts));
	EXPECT_FALSE(SplitBlockGeoid("06037207301100X", parts));
}

TEST(GeoidTest, ParseGeoLevel) {
	GeoLevel level;
	ASSERT_TRUE(TryParseGeoLevel("Tract", level));
	EXPECT_EQ(level, GeoLevel::TRACT);
	ASSERT_TRUE(TryParseGeoLevel(" block group ", level));
	EXPECT_EQ(level, GeoLevel::BLOCK_GROUP);
	ASSERT_TRUE(TryParseGeoLevel("bg", level));
	EXPECT_EQ(level, GeoLevel::BLOCK_GROUP);
	EXPECT_FALSE(TryParseGeoLevel("zcta", level));

	EXPECT_EQ(ParseGeoLevel("BLOCK"), GeoLevel::BLOCK);
	EXPECT_THROW(ParseGeoLevel("neighbourhood"), duckdb::InvalidInputException);
	EXPECT_STREQ(GeoLevelName(GeoLevel::BLOCK_GROUP), "block_group");
}

TEST(GeoidTest, ExtractGeoid) {
	EXPECT_EQ(ExtractGeoid("1000000US060372073011001"), "060372073011001");
	EXPECT_EQ(ExtractGeoid("1400000US06037207301"), "06037207301");
	EXPECT_EQ(ExtractGeoid("06037207301 "), "06037207301");
	EXPECT_EQ(ExtractGeoid("no digits"), "");
}

TEST(GeoidTest, Validation) {
	EXPECT_TRUE(IsValidBlockGeoid("060372073011001"));
	EXPECT_FALSE(IsValidBlockGeoid("60372073011001"));
	EXPECT_FALSE(IsValidBlockGeoid(""));
	EXPECT_TRUE(IsDigitString("0123"));
	EXPECT_FALSE(IsDigitString("01a3"));
}
