#pragma once

#include "duckdb.hpp"
#include "duckdb/function/function_set.hpp"

#include "lookup/geocode_pipeline.hpp"

#include <memory>

namespace duckdb {

// census_normalize_street(label) -> canonical "[PREDIR] NAME [TYPE] [POSTDIR]"
ScalarFunction GetCensusNormalizeStreetFunction();

// census_parse_address(text) -> STRUCT of labeled address fields + status
ScalarFunction GetCensusParseAddressFunction();

// census_geoid_part(geoid, level) -> prefix at level (4-digit code for 'block')
ScalarFunction GetCensusGeoidPartFunction();

// census_geocode(address[, level[, variables]]) -> geocode result STRUCT
ScalarFunctionSet GetCensusGeocodeFunctionSet();

// census_lookup_point(lon, lat, state[, level[, variables]]) -> geocode result STRUCT
ScalarFunctionSet GetCensusLookupPointFunctionSet();

// Extension options read by the geocoding functions at bind time.
static constexpr const char *CENSUS_DATA_DIR_OPTION = "census_data_dir";
static constexpr const char *CENSUS_GEO_LEVEL_OPTION = "census_geo_level";

void RegisterCensusGeocodeOptions(DatabaseInstance &instance);

// One pipeline (and dataset cache) per data directory, shared by every
// connection of the process.
std::shared_ptr<census_geocode::GeocodePipeline> GetCensusGeocodePipeline(ClientContext &context);

// Default geo level: the census_geo_level option, else the pipeline config's.
census_geocode::GeoLevel GetCensusDefaultGeoLevel(ClientContext &context,
                                                  const census_geocode::GeocodePipeline &pipeline);

} // namespace duckdb
