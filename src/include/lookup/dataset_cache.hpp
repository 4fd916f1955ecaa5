#pragma once

#include "lookup/state_dataset.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace census_geocode {

// Per-state datasets, loaded lazily on first use and kept until evicted.
// Concurrent first requests for one state share a single load: the first
// caller loads without holding the lock, later callers wait on its future.
// A failed load is not cached; the next request retries.
class StateDatasetCache {
public:
	using CacheValue = std::shared_ptr<const StateDataset>;

	explicit StateDatasetCache(std::shared_ptr<DatasetProvider> provider);

	// Throws DatasetUnavailableException when the address ranges or block
	// polygons cannot be loaded. Missing census tables only leave the
	// corresponding table null.
	CacheValue Get(const std::string &state_fips);
	void Preload(const std::string &state_fips) {
		Get(state_fips);
	}

	// States with a completed load, sorted.
	std::vector<std::string> LoadedStates() const;
	bool Evict(const std::string &state_fips);
	void Clear();

	// Number of loads started against the provider.
	uint64_t LoadCount() const {
		return load_count.load();
	}

private:
	CacheValue Load(const std::string &state_fips);

	struct CacheItem {
		std::shared_future<CacheValue> value;
		uint64_t generation;
	};

	std::shared_ptr<DatasetProvider> provider;
	mutable std::mutex lock;
	std::unordered_map<std::string, CacheItem> items;
	uint64_t next_generation = 0;
	std::atomic<uint64_t> load_count {0};
};

} // namespace census_geocode
