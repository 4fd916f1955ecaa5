#pragma once

#include "census/census_table.hpp"
#include "geo/geoid.hpp"

#include <optional>
#include <string>
#include <vector>

namespace census_geocode {

struct CensusValue {
	std::string code;
	std::optional<double> value;
};

// Attaches `variables` for the block `block_geoid` at `level`.
//
// PL 94-171 counts are native to blocks: looked up directly at block level and
// summed over every block sharing the GEOID prefix at coarser levels.
// ACS estimates are native to tracts and never summed: they are read from the
// block's tract row whatever the requested level.
// Codes of neither family are read from whichever table carries the column.
//
// Output follows request order with repeated codes dropped. A missing value or
// column yields a null value. Throws DatasetUnavailableException when a
// requested family has no table for the state (`pl` / `acs` null); the
// matching `*_missing_reason` is appended to its message.
std::vector<CensusValue> JoinCensusVariables(const CensusVariableTable *pl, const CensusVariableTable *acs,
                                             const std::string &state_fips, const std::string &block_geoid,
                                             GeoLevel level, const std::vector<std::string> &variables,
                                             const std::string &pl_missing_reason = std::string(),
                                             const std::string &acs_missing_reason = std::string());

// Same output shape with every value null, for unmatched addresses.
std::vector<CensusValue> NullCensusValues(const std::vector<std::string> &variables);

} // namespace census_geocode
