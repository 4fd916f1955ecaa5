#include "duckdb.hpp"
#include "duckdb/main/config.hpp"

#include "census_geocode_functions.hpp"
#include "lookup/geocode_log.hpp"

#include <map>
#include <mutex>
#include <string>

namespace duckdb {

using census_geocode::GeocodeConfig;
using census_geocode::GeocodePipeline;

void RegisterCensusGeocodeOptions(DatabaseInstance &instance) {
	auto &config = DBConfig::GetConfig(instance);
	config.AddExtensionOption(CENSUS_DATA_DIR_OPTION,
	                          "Directory holding the cached TIGER and census files (empty: "
	                          "CENSUS_GEOCODE_DATA_DIR or ~/.census-lookup)",
	                          LogicalType::VARCHAR, Value(""));
	config.AddExtensionOption(CENSUS_GEO_LEVEL_OPTION,
	                          "Default geo level for census_geocode (state, county, tract, block_group, block)",
	                          LogicalType::VARCHAR, Value(""));
}

static std::string GetStringSetting(ClientContext &context, const char *name) {
	Value value;
	if (!context.TryGetCurrentSetting(name, value) || value.IsNull()) {
		return std::string();
	}
	auto text = value.ToString();
	StringUtil::Trim(text);
	return text;
}

std::shared_ptr<GeocodePipeline> GetCensusGeocodePipeline(ClientContext &context) {
	static std::mutex registry_lock;
	static std::map<std::string, std::shared_ptr<GeocodePipeline>> registry;

	auto config = GeocodeConfig::FromEnvironment();
	auto data_dir = GetStringSetting(context, CENSUS_DATA_DIR_OPTION);
	if (!data_dir.empty()) {
		config.data_dir = data_dir;
	}

	std::lock_guard<std::mutex> guard(registry_lock);
	auto it = registry.find(config.data_dir);
	if (it != registry.end()) {
		return it->second;
	}
	census_geocode::GeocodeLogger()->info("census_geocode: using data directory {}", config.data_dir);
	std::shared_ptr<GeocodePipeline> pipeline = GeocodePipeline::Create(config);
	registry.emplace(config.data_dir, pipeline);
	return pipeline;
}

census_geocode::GeoLevel GetCensusDefaultGeoLevel(ClientContext &context, const GeocodePipeline &pipeline) {
	auto name = GetStringSetting(context, CENSUS_GEO_LEVEL_OPTION);
	if (name.empty()) {
		return pipeline.Config().default_geo_level;
	}
	return census_geocode::ParseGeoLevel(name);
}

} // namespace duckdb
