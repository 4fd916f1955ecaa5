#pragma once

#include "address/address_range.hpp"

#include <geos/geom/Envelope.h>
#include <geos/geom/Geometry.h>
#include <geos/geom/GeometryFactory.h>
#include <geos/index/strtree/TemplateSTRtree.h>

#include <memory>
#include <string>
#include <vector>

namespace census_geocode {

// Block polygons of one state behind an STR-tree. Fill with Add, call Build
// once, then Resolve from any number of threads.
class BlockIndex {
public:
	BlockIndex();

	// Takes ownership of `boundary`. Returns false (and drops it) for
	// non-polygonal or empty geometries and for a malformed GEOID.
	bool Add(const std::string &geoid, std::unique_ptr<geos::geom::Geometry> boundary);
	// WKT convenience used by fixtures and tools.
	bool AddWkt(const std::string &geoid, const std::string &wkt);

	void Build();
	bool IsBuilt() const {
		return built;
	}
	size_t Size() const {
		return blocks.size();
	}

	// GEOID of the block covering `point` (boundary points included). When
	// several blocks cover it the lexicographically smallest GEOID wins.
	// Returns false (NoContainment) when no block covers the point.
	bool Resolve(const LonLat &point, std::string &geoid_out) const;

	const geos::geom::GeometryFactory &Factory() const {
		return *factory;
	}

private:
	struct BlockEntry {
		std::string geoid;
		std::unique_ptr<geos::geom::Geometry> boundary;
		geos::geom::Envelope envelope;
	};

	geos::geom::GeometryFactory::Ptr factory;
	std::vector<std::unique_ptr<BlockEntry>> blocks;
	// query() is non-const only because it builds lazily; Build() runs first,
	// after which concurrent queries only read the tree.
	mutable geos::index::strtree::TemplateSTRtree<const BlockEntry *> tree;
	bool built = false;
};

} // namespace census_geocode
