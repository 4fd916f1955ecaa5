#pragma once

#include "address/address_range.hpp"

#include <geos/geom/Geometry.h>
#include <geos/geom/GeometryFactory.h>

#include <memory>
#include <string>
#include <vector>

namespace census_geocode {

// Decoders for the geometry encodings found in cached TIGER files. All throw
// geos::util::GEOSException (or a subclass) on malformed input.
std::unique_ptr<geos::geom::Geometry> ReadWkb(const geos::geom::GeometryFactory &factory, const std::string &bytes);
std::unique_ptr<geos::geom::Geometry> ReadHexWkb(const geos::geom::GeometryFactory &factory, const std::string &hex);
std::unique_ptr<geos::geom::Geometry> ReadWkt(const geos::geom::GeometryFactory &factory, const std::string &wkt);

// Picks the decoder from the payload: raw WKB bytes, hex WKB, or WKT text.
std::unique_ptr<geos::geom::Geometry> ReadAnyGeometry(const geos::geom::GeometryFactory &factory,
                                                      const std::string &payload, bool is_blob);

bool IsPolygonal(const geos::geom::Geometry &geometry);

// Vertices of a (multi)line in order.
std::vector<LonLat> LineVertices(const geos::geom::Geometry &geometry);

} // namespace census_geocode
