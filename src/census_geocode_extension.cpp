#define DUCKDB_EXTENSION_MAIN // must precede DuckDB headers
#include "census_geocode_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "census_geocode_functions.hpp"
#include "lookup/geocode_log.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	RegisterCensusGeocodeOptions(loader.GetDatabaseInstance());

	loader.RegisterFunction(GetCensusNormalizeStreetFunction());
	loader.RegisterFunction(GetCensusParseAddressFunction());
	loader.RegisterFunction(GetCensusGeoidPartFunction());
	loader.RegisterFunction(GetCensusGeocodeFunctionSet());
	loader.RegisterFunction(GetCensusLookupPointFunctionSet());

	census_geocode::GeocodeLogger()->debug("census_geocode extension loaded");
}

void CensusGeocodeExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string CensusGeocodeExtension::Name() {
	return "census_geocode";
}

std::string CensusGeocodeExtension::Version() const {
#ifdef EXT_VERSION_CENSUS_GEOCODE
	return EXT_VERSION_CENSUS_GEOCODE;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(census_geocode, loader) {
	duckdb::LoadInternal(loader);
}
}
