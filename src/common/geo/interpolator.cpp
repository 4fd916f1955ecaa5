#include "geo/interpolator.hpp"

#include <cmath>

namespace census_geocode {

double RangeFraction(const HouseRange &range, uint32_t number) {
	if (range.from == range.to) {
		return 0.5;
	}
	double t = (static_cast<double>(number) - static_cast<double>(range.from)) /
	           (static_cast<double>(range.to) - static_cast<double>(range.from));
	if (t < 0) {
		return 0;
	}
	if (t > 1) {
		return 1;
	}
	return t;
}

LonLat InterpolateAlongSegment(const LonLat &start, const LonLat &end, double t) {
	LonLat out;
	out.lon = start.lon + t * (end.lon - start.lon);
	out.lat = start.lat + t * (end.lat - start.lat);
	return out;
}

LonLat InterpolateAlongShape(const std::vector<LonLat> &shape, double t) {
	if (shape.empty()) {
		return LonLat();
	}
	if (shape.size() == 1) {
		return shape.front();
	}
	double total = 0;
	for (size_t i = 1; i < shape.size(); i++) {
		total += std::hypot(shape[i].lon - shape[i - 1].lon, shape[i].lat - shape[i - 1].lat);
	}
	if (total <= 0) {
		return shape.front();
	}
	double target = t * total;
	for (size_t i = 1; i < shape.size(); i++) {
		double piece = std::hypot(shape[i].lon - shape[i - 1].lon, shape[i].lat - shape[i - 1].lat);
		if (target <= piece && piece > 0) {
			return InterpolateAlongSegment(shape[i - 1], shape[i], target / piece);
		}
		target -= piece;
	}
	return shape.back();
}

LonLat InterpolateAddress(const AddressRangeRecord &record, StreetSide side, uint32_t number) {
	const double t = RangeFraction(record.Range(side), number);
	if (record.shape.size() >= 2) {
		return InterpolateAlongShape(record.shape, t);
	}
	return InterpolateAlongSegment(record.start, record.end, t);
}

} // namespace census_geocode
