#include "geo/block_index.hpp"

#include "geo/geoid.hpp"
#include "geo/geometry_codec.hpp"

#include "duckdb/common/exception.hpp"

#include <geos/geom/Coordinate.h>
#include <geos/geom/Point.h>

#include <utility>

namespace census_geocode {

BlockIndex::BlockIndex() : factory(geos::geom::GeometryFactory::create()) {
}

bool BlockIndex::Add(const std::string &geoid, std::unique_ptr<geos::geom::Geometry> boundary) {
	if (built) {
		throw duckdb::InternalException("BlockIndex::Add called after Build");
	}
	if (!boundary || boundary->isEmpty() || !IsPolygonal(*boundary) || !IsValidBlockGeoid(geoid)) {
		return false;
	}
	auto entry = std::make_unique<BlockEntry>();
	entry->geoid = geoid;
	entry->envelope = *boundary->getEnvelopeInternal();
	entry->boundary = std::move(boundary);
	blocks.push_back(std::move(entry));
	return true;
}

bool BlockIndex::AddWkt(const std::string &geoid, const std::string &wkt) {
	return Add(geoid, ReadWkt(*factory, wkt));
}

void BlockIndex::Build() {
	if (built) {
		return;
	}
	for (auto &entry : blocks) {
		tree.insert(entry->envelope, static_cast<const BlockEntry *>(entry.get()));
	}
	tree.build();
	built = true;
}

bool BlockIndex::Resolve(const LonLat &point, std::string &geoid_out) const {
	if (!built) {
		throw duckdb::InternalException("BlockIndex::Resolve called before Build");
	}
	if (blocks.empty()) {
		return false;
	}
	const geos::geom::Coordinate coordinate(point.lon, point.lat);
	const geos::geom::Envelope probe_envelope(coordinate);
	std::vector<const BlockEntry *> hits;
	tree.query(probe_envelope, hits);
	if (hits.empty()) {
		return false;
	}

	std::unique_ptr<geos::geom::Point> probe(factory->createPoint(coordinate));
	const BlockEntry *best = nullptr;
	for (auto entry : hits) {
		if (best && entry->geoid >= best->geoid) {
			continue;
		}
		if (entry->boundary->covers(probe.get())) {
			best = entry;
		}
	}
	if (!best) {
		return false;
	}
	geoid_out = best->geoid;
	return true;
}

} // namespace census_geocode
