#include "geo/geometry_codec.hpp"

#include <geos/geom/Coordinate.h>
#include <geos/geom/CoordinateSequence.h>
#include <geos/io/WKBReader.h>
#include <geos/io/WKTReader.h>

#include <cctype>
#include <sstream>

namespace census_geocode {

std::unique_ptr<geos::geom::Geometry> ReadWkb(const geos::geom::GeometryFactory &factory, const std::string &bytes) {
	std::istringstream stream(bytes, std::ios::in | std::ios::binary);
	geos::io::WKBReader reader(factory);
	return reader.read(stream);
}

std::unique_ptr<geos::geom::Geometry> ReadHexWkb(const geos::geom::GeometryFactory &factory, const std::string &hex) {
	std::istringstream stream(hex);
	geos::io::WKBReader reader(factory);
	return reader.readHEX(stream);
}

std::unique_ptr<geos::geom::Geometry> ReadWkt(const geos::geom::GeometryFactory &factory, const std::string &wkt) {
	geos::io::WKTReader reader(factory);
	return reader.read(wkt);
}

std::unique_ptr<geos::geom::Geometry> ReadAnyGeometry(const geos::geom::GeometryFactory &factory,
                                                      const std::string &payload, bool is_blob) {
	if (is_blob) {
		return ReadWkb(factory, payload);
	}
	bool hex = !payload.empty() && payload.size() % 2 == 0;
	for (char c : payload) {
		if (!std::isxdigit(static_cast<unsigned char>(c))) {
			hex = false;
			break;
		}
	}
	return hex ? ReadHexWkb(factory, payload) : ReadWkt(factory, payload);
}

bool IsPolygonal(const geos::geom::Geometry &geometry) {
	const auto type = geometry.getGeometryTypeId();
	return type == geos::geom::GEOS_POLYGON || type == geos::geom::GEOS_MULTIPOLYGON;
}

std::vector<LonLat> LineVertices(const geos::geom::Geometry &geometry) {
	std::vector<LonLat> out;
	auto coords = geometry.getCoordinates();
	out.reserve(coords->getSize());
	for (size_t i = 0; i < coords->getSize(); i++) {
		const geos::geom::Coordinate &c = coords->getAt(i);
		LonLat point;
		point.lon = c.x;
		point.lat = c.y;
		out.push_back(point);
	}
	return out;
}

} // namespace census_geocode
