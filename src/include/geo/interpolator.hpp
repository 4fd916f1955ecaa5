#pragma once

#include "address/address_range.hpp"

#include <cstdint>
#include <vector>

namespace census_geocode {

// Fractional position of `number` within [from, to], clamped to [0, 1].
// A degenerate range (from == to) yields 0.5.
double RangeFraction(const HouseRange &range, uint32_t number);

LonLat InterpolateAlongSegment(const LonLat &start, const LonLat &end, double t);

// Point at fraction t of the polyline's planar length. Falls back to the
// vertex for lines of fewer than two points or zero length.
LonLat InterpolateAlongShape(const std::vector<LonLat> &shape, double t);

// Interpolated coordinate of `number` on `side` of the record's segment.
LonLat InterpolateAddress(const AddressRangeRecord &record, StreetSide side, uint32_t number);

} // namespace census_geocode
