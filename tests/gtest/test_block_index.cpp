// =============================================================================
// Block polygon resolver
// =============================================================================

#include <gtest/gtest.h>

#include "geo/block_index.hpp"
#include "geo/geometry_codec.hpp"
#include "test_fixtures.hpp"

#include "duckdb/common/exception.hpp"

#include <atomic>
#include <thread>

using namespace census_geocode;
using namespace census_geocode::testing_support;

class BlockIndexTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(index.AddWkt(BLOCK_A, BoxWkt(-118.0, 33.99, -117.995, 34.01)));
		ASSERT_TRUE(index.AddWkt(BLOCK_B, BoxWkt(-117.995, 33.99, -117.99, 34.01)));
		ASSERT_TRUE(index.AddWkt(BLOCK_C, BoxWkt(-117.99, 33.99, -117.98, 34.01)));
		index.Build();
	}

	BlockIndex index;
};

TEST_F(BlockIndexTest, InteriorPoints) {
	std::string geoid;
	ASSERT_TRUE(index.Resolve(LonLat {-117.998, 34.0}, geoid));
	EXPECT_EQ(geoid, BLOCK_A);
	ASSERT_TRUE(index.Resolve(LonLat {-117.992, 34.005}, geoid));
	EXPECT_EQ(geoid, BLOCK_B);
	ASSERT_TRUE(index.Resolve(LonLat {-117.985, 33.995}, geoid));
	EXPECT_EQ(geoid, BLOCK_C);
}

TEST_F(BlockIndexTest, SharedEdgeResolvesToSmallestGeoid) {
	std::string geoid;
	for (int i = 0; i < 10; i++) {
		ASSERT_TRUE(index.Resolve(LonLat {-117.995, 34.0}, geoid));
		EXPECT_EQ(geoid, BLOCK_A);
	}
	// B and C share lon -117.99
	ASSERT_TRUE(index.Resolve(LonLat {-117.99, 34.0}, geoid));
	EXPECT_EQ(geoid, BLOCK_B);
}

TEST_F(BlockIndexTest, OutsideEveryBlock) {
	std::string geoid = "unchanged";
	EXPECT_FALSE(index.Resolve(LonLat {-117.5, 34.0}, geoid));
	EXPECT_FALSE(index.Resolve(LonLat {-117.998, 35.0}, geoid));
	EXPECT_EQ(geoid, "unchanged");
}

TEST_F(BlockIndexTest, ConcurrentResolve) {
	struct Query {
		LonLat point;
		std::string expected;
	};
	const std::vector<Query> queries = {{LonLat {-117.998, 34.0}, BLOCK_A},
	                                    {LonLat {-117.992, 34.005}, BLOCK_B},
	                                    {LonLat {-117.985, 33.995}, BLOCK_C},
	                                    {LonLat {-117.995, 34.0}, BLOCK_A},
	                                    {LonLat {-117.5, 34.0}, ""}};
	std::vector<std::thread> threads;
	std::atomic<int> mismatches {0};
	for (int t = 0; t < 8; t++) {
		threads.emplace_back([&, t]() {
			for (int i = 0; i < 500; i++) {
				const auto &query = queries[(t + i) % queries.size()];
				std::string geoid;
				const bool found = index.Resolve(query.point, geoid);
				if (found != !query.expected.empty() || (found && geoid != query.expected)) {
					mismatches++;
				}
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}
	EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(BlockIndexTest, AddAfterBuildThrows) {
	EXPECT_THROW(index.AddWkt("060372073011003", BoxWkt(0, 0, 1, 1)), duckdb::InternalException);
}

TEST(BlockIndexSetupTest, RejectsUnusableEntries) {
	BlockIndex index;
	EXPECT_FALSE(index.AddWkt("060372073011001", "LINESTRING(0 0, 1 1)"));
	EXPECT_FALSE(index.AddWkt("0603720730", BoxWkt(0, 0, 1, 1)));
	EXPECT_FALSE(index.AddWkt("060372073011001", "POLYGON EMPTY"));
	EXPECT_TRUE(index.AddWkt("060372073011001", "MULTIPOLYGON(((0 0, 1 0, 1 1, 0 1, 0 0)))"));
	EXPECT_EQ(index.Size(), 1u);

	std::string geoid;
	EXPECT_THROW(index.Resolve(LonLat {0.5, 0.5}, geoid), duckdb::InternalException);
	index.Build();
	ASSERT_TRUE(index.Resolve(LonLat {0.5, 0.5}, geoid));
	EXPECT_EQ(geoid, "060372073011001");
}

TEST(BlockIndexSetupTest, EmptyIndexResolvesNothing) {
	BlockIndex index;
	index.Build();
	std::string geoid;
	EXPECT_FALSE(index.Resolve(LonLat {0, 0}, geoid));
}

TEST(GeometryCodecTest, DecodesEveryEncoding) {
	auto factory = geos::geom::GeometryFactory::create();
	auto from_wkt = ReadAnyGeometry(*factory, "POLYGON((0 0, 1 0, 1 1, 0 1, 0 0))", false);
	ASSERT_TRUE(from_wkt);
	EXPECT_TRUE(IsPolygonal(*from_wkt));

	// POINT(1 2), little endian
	const std::string hex = "0101000000000000000000F03F0000000000000040";
	auto from_hex = ReadAnyGeometry(*factory, hex, false);
	ASSERT_TRUE(from_hex);
	EXPECT_FALSE(IsPolygonal(*from_hex));

	auto line = ReadWkt(*factory, "LINESTRING(0 0, 3 0, 3 1)");
	auto vertices = LineVertices(*line);
	ASSERT_EQ(vertices.size(), 3u);
	EXPECT_DOUBLE_EQ(vertices[1].lon, 3);
	EXPECT_DOUBLE_EQ(vertices[2].lat, 1);
}
