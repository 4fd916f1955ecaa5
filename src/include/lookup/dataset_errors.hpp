#pragma once

#include "duckdb/common/exception.hpp"

#include <cstdint>
#include <string>

namespace census_geocode {

enum class DatasetKind : uint8_t { ADDRESS_RANGES, BLOCK_POLYGONS, PL94171, ACS5 };

const char *DatasetKindName(DatasetKind kind);

// A state's dataset could not be supplied (missing, unreadable or corrupt).
// Distinct from a plain non-match so callers can fetch the data and retry.
class DatasetUnavailableException : public duckdb::IOException {
public:
	DatasetUnavailableException(const std::string &state_fips, DatasetKind kind, const std::string &reason);

	const std::string &StateFips() const {
		return state_fips;
	}
	DatasetKind Kind() const {
		return kind;
	}

private:
	std::string state_fips;
	DatasetKind kind;
};

} // namespace census_geocode
