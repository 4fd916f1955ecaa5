#include "lookup/dataset_errors.hpp"

namespace census_geocode {

const char *DatasetKindName(DatasetKind kind) {
	switch (kind) {
	case DatasetKind::ADDRESS_RANGES:
		return "address_ranges";
	case DatasetKind::BLOCK_POLYGONS:
		return "block_polygons";
	case DatasetKind::PL94171:
		return "pl94171";
	case DatasetKind::ACS5:
		return "acs5";
	}
	return "unknown";
}

DatasetUnavailableException::DatasetUnavailableException(const std::string &state_fips, DatasetKind kind,
                                                         const std::string &reason)
    : duckdb::IOException("Dataset %s unavailable for state %s: %s", DatasetKindName(kind), state_fips, reason),
      state_fips(state_fips), kind(kind) {
}

} // namespace census_geocode
