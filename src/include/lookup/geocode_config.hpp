#pragma once

#include "address/range_match_params.hpp"
#include "geo/geoid.hpp"

#include <string>

namespace census_geocode {

struct GeocodeConfig {
	// Root of the cached TIGER / census files (tiger/..., census/...)
	std::string data_dir = DefaultDataDir();
	GeoLevel default_geo_level = GeoLevel::BLOCK;
	// Worker threads for batch geocoding; 0 picks the hardware concurrency.
	// Larger values are clamped to it.
	unsigned batch_threads = 0;
	RangeMatchParams match;
	// Use the range record's GEOIDL/GEOIDR when no block polygon contains the point
	bool use_segment_side_geoid = false;
	// Applied when the address names no state; empty means NoState
	std::string default_state;
	std::string log_level = "info";

	// Defaults overlaid with CENSUS_GEOCODE_DATA_DIR, CENSUS_GEOCODE_THREADS,
	// CENSUS_GEOCODE_LOG_LEVEL and CENSUS_GEOCODE_DEFAULT_STATE.
	static GeocodeConfig FromEnvironment();

	// $HOME/.census-lookup, or ./.census-lookup without HOME.
	static std::string DefaultDataDir();

	// std::thread::hardware_concurrency(), at least 1.
	static unsigned HardwareThreads();

	unsigned EffectiveThreads() const;
};

} // namespace census_geocode
