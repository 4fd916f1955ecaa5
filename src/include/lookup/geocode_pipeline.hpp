#pragma once

#include "address/address_token.hpp"
#include "lookup/dataset_cache.hpp"
#include "lookup/geocode_config.hpp"
#include "lookup/geocode_result.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace census_geocode {

// Address -> token -> key -> range -> coordinate -> block -> census values.
// The pipeline owns the dataset cache; everything else is read-only, so a
// single instance serves any number of threads.
class GeocodePipeline {
public:
	GeocodePipeline(GeocodeConfig config, std::shared_ptr<DatasetProvider> provider,
	                std::shared_ptr<const AddressTokenizer> tokenizer = nullptr);

	// DuckDB-backed provider over config.data_dir and the rule-based tokenizer.
	static std::unique_ptr<GeocodePipeline> Create(const GeocodeConfig &config);

	// Per-address failures come back as unmatched results. Throws
	// DatasetUnavailableException when the state's data cannot be supplied.
	GeocodeResult Geocode(const std::string &address, GeoLevel level,
	                      const std::vector<std::string> &variables) const;
	GeocodeResult Geocode(const std::string &address) const {
		return Geocode(address, config.default_geo_level, {});
	}

	// Census lookup for a caller supplied point (no address matching).
	GeocodeResult LookupCoordinate(double longitude, double latitude, const std::string &state, GeoLevel level,
	                               const std::vector<std::string> &variables) const;

	// Output order equals input order; no row failure aborts the batch.
	std::vector<GeocodeResult> GeocodeBatch(const std::vector<std::string> &addresses, GeoLevel level,
	                                        const std::vector<std::string> &variables) const;

	// Chunked batch: `sink` receives each chunk's results in input order and
	// returns false to abandon the remaining rows. Returns the rows delivered.
	using BatchSink = std::function<bool(size_t first_row, std::vector<GeocodeResult> &chunk)>;
	size_t GeocodeBatchStreaming(const std::vector<std::string> &addresses, GeoLevel level,
	                             const std::vector<std::string> &variables, size_t chunk_size,
	                             const BatchSink &sink) const;

	const GeocodeConfig &Config() const {
		return config;
	}
	StateDatasetCache &Cache() const {
		return *cache;
	}

private:
	void ResolveGeography(const StateDataset &dataset, const LonLat &point, const std::string &side_geoid,
	                      GeoLevel level, const std::vector<std::string> &variables, GeocodeResult &result) const;
	GeocodeResult GeocodeRow(const std::string &address, GeoLevel level,
	                         const std::vector<std::string> &variables) const;

	GeocodeConfig config;
	std::shared_ptr<const AddressTokenizer> tokenizer;
	std::unique_ptr<StateDatasetCache> cache;
};

} // namespace census_geocode
