#pragma once

#include "address/address_range.hpp"
#include "census/census_table.hpp"
#include "geo/block_index.hpp"
#include "lookup/dataset_errors.hpp"

#include <memory>
#include <string>

namespace census_geocode {

// Everything the pipeline reads for one state. Immutable once published by
// the dataset cache; shared read-only across lookups.
struct StateDataset {
	std::string state_fips;
	AddressRangeSet ranges;
	std::unique_ptr<BlockIndex> blocks;
	// Optional tables; null with the reason recorded when unavailable
	std::unique_ptr<CensusVariableTable> pl94171;
	std::unique_ptr<CensusVariableTable> acs5;
	std::string pl94171_missing_reason;
	std::string acs5_missing_reason;
};

// Supplies typed tables for a state. Every method either returns usable data
// or throws DatasetUnavailableException; implementations must be callable
// from several threads for different states.
class DatasetProvider {
public:
	virtual ~DatasetProvider() = default;

	virtual AddressRangeSet LoadAddressRanges(const std::string &state_fips) = 0;
	// Returned index is already built.
	virtual std::unique_ptr<BlockIndex> LoadBlockPolygons(const std::string &state_fips) = 0;
	// `kind` is PL94171 or ACS5.
	virtual std::unique_ptr<CensusVariableTable> LoadCensusTable(const std::string &state_fips, DatasetKind kind) = 0;
};

} // namespace census_geocode
