#include "lookup/dataset_cache.hpp"

#include "lookup/geocode_log.hpp"

#include "duckdb/common/error_data.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace census_geocode {

StateDatasetCache::StateDatasetCache(std::shared_ptr<DatasetProvider> provider_p) : provider(std::move(provider_p)) {
	if (!provider) {
		throw duckdb::InternalException("StateDatasetCache requires a dataset provider");
	}
}

StateDatasetCache::CacheValue StateDatasetCache::Get(const std::string &state_fips) {
	std::shared_future<CacheValue> pending;
	std::promise<CacheValue> promise;
	uint64_t generation = 0;
	{
		std::lock_guard<std::mutex> guard(lock);
		auto it = items.find(state_fips);
		if (it != items.end()) {
			pending = it->second.value;
		} else {
			generation = ++next_generation;
			items.emplace(state_fips, CacheItem {promise.get_future().share(), generation});
		}
	}
	if (pending.valid()) {
		// another caller owns the load; rethrows its failure
		return pending.get();
	}

	try {
		auto value = Load(state_fips);
		promise.set_value(value);
		return value;
	} catch (const std::exception &ex) {
		{
			std::lock_guard<std::mutex> guard(lock);
			auto it = items.find(state_fips);
			if (it != items.end() && it->second.generation == generation) {
				items.erase(it);
			}
		}
		GeocodeLogger()->error("state {}: dataset load failed: {}", state_fips, duckdb::ErrorData(ex).RawMessage());
		promise.set_exception(std::current_exception());
		throw;
	}
}

StateDatasetCache::CacheValue StateDatasetCache::Load(const std::string &state_fips) {
	load_count++;
	const auto start = std::chrono::steady_clock::now();

	auto dataset = std::make_shared<StateDataset>();
	dataset->state_fips = state_fips;
	dataset->ranges = provider->LoadAddressRanges(state_fips);
	dataset->blocks = provider->LoadBlockPolygons(state_fips);
	if (!dataset->blocks || !dataset->blocks->IsBuilt()) {
		throw DatasetUnavailableException(state_fips, DatasetKind::BLOCK_POLYGONS, "provider returned no block index");
	}

	try {
		dataset->pl94171 = provider->LoadCensusTable(state_fips, DatasetKind::PL94171);
	} catch (const DatasetUnavailableException &ex) {
		dataset->pl94171_missing_reason = duckdb::ErrorData(ex).RawMessage();
		GeocodeLogger()->warn("state {}: PL 94-171 table unavailable: {}", state_fips, dataset->pl94171_missing_reason);
	}
	try {
		dataset->acs5 = provider->LoadCensusTable(state_fips, DatasetKind::ACS5);
	} catch (const DatasetUnavailableException &ex) {
		dataset->acs5_missing_reason = duckdb::ErrorData(ex).RawMessage();
		GeocodeLogger()->warn("state {}: ACS table unavailable: {}", state_fips, dataset->acs5_missing_reason);
	}

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	GeocodeLogger()->info("state {}: dataset ready ({} ranges, {} blocks) in {} ms", state_fips,
	                      dataset->ranges.Size(), dataset->blocks->Size(), elapsed.count());
	return dataset;
}

std::vector<std::string> StateDatasetCache::LoadedStates() const {
	std::vector<std::string> out;
	std::lock_guard<std::mutex> guard(lock);
	for (const auto &entry : items) {
		if (entry.second.value.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
			out.push_back(entry.first);
		}
	}
	std::sort(out.begin(), out.end());
	return out;
}

bool StateDatasetCache::Evict(const std::string &state_fips) {
	std::lock_guard<std::mutex> guard(lock);
	return items.erase(state_fips) > 0;
}

void StateDatasetCache::Clear() {
	std::lock_guard<std::mutex> guard(lock);
	items.clear();
}

} // namespace census_geocode
