#pragma once

#include "lookup/state_dataset.hpp"

#include "duckdb.hpp"

#include <memory>
#include <string>

namespace census_geocode {

// Reads the cached per-state files under `data_dir` through an in-memory
// DuckDB instance:
//
//   tiger/addrfeat/<fips>.{parquet,csv}      address ranges
//   tiger/blocks/<fips>.{parquet,csv}        block polygons
//   census/pl94171/<fips>.{parquet,csv}      PL 94-171, block level
//   census/acs5/tract/<fips>.{parquet,csv}   ACS 5-year, tract level
//
// Parquet wins when both exist. Rows with unusable values are skipped with a
// warning; a missing or unreadable file raises DatasetUnavailableException.
class DuckDBDatasetProvider : public DatasetProvider {
public:
	explicit DuckDBDatasetProvider(std::string data_dir);

	AddressRangeSet LoadAddressRanges(const std::string &state_fips) override;
	std::unique_ptr<BlockIndex> LoadBlockPolygons(const std::string &state_fips) override;
	std::unique_ptr<CensusVariableTable> LoadCensusTable(const std::string &state_fips, DatasetKind kind) override;

	// Path of the file backing (state, kind), or empty when none exists.
	std::string ResolveFile(const std::string &state_fips, DatasetKind kind) const;

	const std::string &DataDir() const {
		return data_dir;
	}

private:
	duckdb::unique_ptr<duckdb::MaterializedQueryResult> ReadTable(const std::string &state_fips, DatasetKind kind);

	std::string data_dir;
	duckdb::DuckDB db;
	duckdb::unique_ptr<duckdb::FileSystem> fs;
};

} // namespace census_geocode
