// =============================================================================
// House number interpolation
// =============================================================================

#include <gtest/gtest.h>

#include "geo/interpolator.hpp"

using namespace census_geocode;

TEST(InterpolatorTest, RangeFraction) {
	HouseRange range {100, 200, true, 0};
	EXPECT_DOUBLE_EQ(RangeFraction(range, 100), 0.0);
	EXPECT_DOUBLE_EQ(RangeFraction(range, 150), 0.5);
	EXPECT_DOUBLE_EQ(RangeFraction(range, 200), 1.0);
	// outside the range clamps to the nearest end
	EXPECT_DOUBLE_EQ(RangeFraction(range, 50), 0.0);
	EXPECT_DOUBLE_EQ(RangeFraction(range, 900), 1.0);
}

TEST(InterpolatorTest, DescendingRangeRunsBackwards) {
	HouseRange range {200, 100, true, 0};
	EXPECT_DOUBLE_EQ(RangeFraction(range, 200), 0.0);
	EXPECT_DOUBLE_EQ(RangeFraction(range, 125), 0.75);
}

TEST(InterpolatorTest, DegenerateRangeIsMidpoint) {
	HouseRange range {42, 42, true, 0};
	EXPECT_DOUBLE_EQ(RangeFraction(range, 42), 0.5);
	EXPECT_DOUBLE_EQ(RangeFraction(range, 7), 0.5);
}

TEST(InterpolatorTest, MonotonicAlongSegment) {
	AddressRangeRecord record;
	record.left = HouseRange {101, 199, true, 0};
	record.start = LonLat {-118.0, 34.0};
	record.end = LonLat {-117.99, 34.01};

	double previous_lon = -1000;
	double previous_lat = -1000;
	for (uint32_t number = 101; number <= 199; number += 2) {
		auto point = InterpolateAddress(record, StreetSide::LEFT, number);
		EXPECT_GE(point.lon, previous_lon);
		EXPECT_GE(point.lat, previous_lat);
		EXPECT_GE(point.lon, -118.0);
		EXPECT_LE(point.lon, -117.99);
		previous_lon = point.lon;
		previous_lat = point.lat;
	}
	auto first = InterpolateAddress(record, StreetSide::LEFT, 101);
	EXPECT_DOUBLE_EQ(first.lon, -118.0);
	EXPECT_DOUBLE_EQ(first.lat, 34.0);
	auto last = InterpolateAddress(record, StreetSide::LEFT, 199);
	EXPECT_NEAR(last.lon, -117.99, 1e-12);
	EXPECT_NEAR(last.lat, 34.01, 1e-12);
}

TEST(InterpolatorTest, FollowsShapeByLength) {
	// an L-shaped line: 3 units east then 1 unit north
	std::vector<LonLat> shape = {LonLat {0, 0}, LonLat {3, 0}, LonLat {3, 1}};
	auto mid = InterpolateAlongShape(shape, 0.5);
	EXPECT_DOUBLE_EQ(mid.lon, 2.0);
	EXPECT_DOUBLE_EQ(mid.lat, 0.0);
	auto late = InterpolateAlongShape(shape, 0.875);
	EXPECT_DOUBLE_EQ(late.lon, 3.0);
	EXPECT_DOUBLE_EQ(late.lat, 0.5);
	auto end = InterpolateAlongShape(shape, 1.0);
	EXPECT_DOUBLE_EQ(end.lon, 3.0);
	EXPECT_DOUBLE_EQ(end.lat, 1.0);

	AddressRangeRecord record;
	record.right = HouseRange {0, 100, true, 0};
	record.start = shape.front();
	record.end = shape.back();
	record.shape = shape;
	auto point = InterpolateAddress(record, StreetSide::RIGHT, 50);
	EXPECT_DOUBLE_EQ(point.lon, 2.0);
	EXPECT_DOUBLE_EQ(point.lat, 0.0);
}

TEST(InterpolatorTest, DegenerateShapes) {
	std::vector<LonLat> single = {LonLat {5, 6}};
	auto point = InterpolateAlongShape(single, 0.3);
	EXPECT_DOUBLE_EQ(point.lon, 5);
	EXPECT_DOUBLE_EQ(point.lat, 6);

	std::vector<LonLat> collapsed = {LonLat {1, 1}, LonLat {1, 1}};
	point = InterpolateAlongShape(collapsed, 0.7);
	EXPECT_DOUBLE_EQ(point.lon, 1);
	EXPECT_DOUBLE_EQ(point.lat, 1);
}
