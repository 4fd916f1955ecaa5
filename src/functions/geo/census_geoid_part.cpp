#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "census_geocode_functions.hpp"
#include "geo/geoid.hpp"

#include <string>

namespace duckdb {

using census_geocode::GeoLevel;

static void GeoidPartScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	BinaryExecutor::ExecuteWithNulls<string_t, string_t, string_t>(
	    args.data[0], args.data[1], result, args.size(),
	    [&](const string_t &geoid_val, const string_t &level_val, ValidityMask &mask, idx_t idx) -> string_t {
		    const auto level = census_geocode::ParseGeoLevel(level_val.GetString());
		    const auto geoid = geoid_val.GetString();
		    const auto needed = census_geocode::GeoidLength(level);
		    if (!census_geocode::IsDigitString(geoid) || geoid.size() < needed ||
		        geoid.size() > census_geocode::BLOCK_GEOID_LENGTH) {
			    mask.SetInvalid(idx);
			    return string_t();
		    }
		    if (level == GeoLevel::BLOCK) {
			    return StringVector::AddString(result, geoid.substr(census_geocode::TRACT_GEOID_LENGTH, 4));
		    }
		    return StringVector::AddString(result, census_geocode::GeoidPrefix(geoid, level));
	    });
}

ScalarFunction GetCensusGeoidPartFunction() {
	return ScalarFunction("census_geoid_part", {LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                      GeoidPartScalar);
}

} // namespace duckdb
