#include "lookup/geocode_pipeline.hpp"

#include "address/range_matcher.hpp"
#include "address/street_normalizer.hpp"
#include "geo/interpolator.hpp"
#include "geo/state_fips.hpp"
#include "lookup/duckdb_dataset_provider.hpp"
#include "lookup/geocode_log.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace census_geocode {

const char *MatchTypeName(MatchType type) {
	switch (type) {
	case MatchType::EXACT:
		return "exact";
	case MatchType::INTERPOLATED:
		return "interpolated";
	case MatchType::UNMATCHED:
		return "unmatched";
	}
	return "unmatched";
}

const char *GeocodeFailureName(GeocodeFailure failure) {
	switch (failure) {
	case GeocodeFailure::NONE:
		return "none";
	case GeocodeFailure::INCOMPLETE_ADDRESS:
		return "incomplete_address";
	case GeocodeFailure::AMBIGUOUS_PARSE:
		return "ambiguous_parse";
	case GeocodeFailure::NO_STATE:
		return "no_state";
	case GeocodeFailure::NO_MATCH:
		return "no_match";
	case GeocodeFailure::NO_CONTAINMENT:
		return "no_containment";
	case GeocodeFailure::DATASET_UNAVAILABLE:
		return "dataset_unavailable";
	}
	return "none";
}

namespace {

void MarkUnmatched(GeocodeResult &result, GeocodeFailure failure) {
	result.match_type = MatchType::UNMATCHED;
	result.match_score = 0;
	result.failure = failure;
	result.geoid.reset();
	result.state_fips.reset();
	result.county_fips.reset();
	result.tract.reset();
	result.block_group.reset();
	result.block.reset();
}

GeocodeResult NewResult(const std::string &address, const std::vector<std::string> &variables) {
	GeocodeResult result;
	result.input_address = address;
	result.variables = NullCensusValues(variables);
	return result;
}

// Joins whatever workers were started, on every exit path.
struct ThreadJoiner {
	std::vector<std::thread> &pool;
	~ThreadJoiner() {
		for (auto &worker : pool) {
			if (worker.joinable()) {
				worker.join();
			}
		}
	}
};

// Runs fn(i) for i in [0, count) on up to `threads` workers. The first
// exception escaping fn stops the remaining work and is rethrown here.
// When the system refuses more threads the ones already running (or, with
// none, the calling thread) drain the remaining rows.
template <class FUNC>
void ParallelFor(size_t count, unsigned threads, FUNC &&fn) {
	const size_t workers = std::min<size_t>(threads, count);
	if (workers <= 1) {
		for (size_t i = 0; i < count; i++) {
			fn(i);
		}
		return;
	}
	std::atomic<size_t> next {0};
	std::atomic<bool> failed {false};
	std::exception_ptr first_error;
	std::mutex error_lock;
	auto work = [&]() {
		while (!failed.load()) {
			const size_t i = next.fetch_add(1);
			if (i >= count) {
				return;
			}
			try {
				fn(i);
			} catch (...) {
				std::lock_guard<std::mutex> guard(error_lock);
				if (!first_error) {
					first_error = std::current_exception();
				}
				failed = true;
			}
		}
	};

	std::vector<std::thread> pool;
	pool.reserve(workers);
	{
		ThreadJoiner joiner {pool};
		for (size_t w = 0; w < workers; w++) {
			try {
				pool.emplace_back(work);
			} catch (const std::system_error &ex) {
				GeocodeLogger()->warn("batch: started {} of {} workers: {}", pool.size(), workers, ex.what());
				break;
			}
		}
		if (pool.empty()) {
			work();
		}
	}
	if (first_error) {
		std::rethrow_exception(first_error);
	}
}

} // namespace

GeocodePipeline::GeocodePipeline(GeocodeConfig config_p, std::shared_ptr<DatasetProvider> provider,
                                 std::shared_ptr<const AddressTokenizer> tokenizer_p)
    : config(std::move(config_p)), tokenizer(std::move(tokenizer_p)),
      cache(std::make_unique<StateDatasetCache>(std::move(provider))) {
	if (!tokenizer) {
		tokenizer = std::make_shared<RuleBasedTokenizer>();
	}
	if (!config.default_state.empty()) {
		std::string fips;
		if (!TryNormalizeState(config.default_state, fips)) {
			throw duckdb::InvalidInputException("Unknown default state '%s'", config.default_state);
		}
		config.default_state = fips;
	}
	if (!SetGeocodeLogLevel(config.log_level)) {
		GeocodeLogger()->warn("Unknown log level '{}', keeping the current level", config.log_level);
	}
}

std::unique_ptr<GeocodePipeline> GeocodePipeline::Create(const GeocodeConfig &config) {
	auto provider = std::make_shared<DuckDBDatasetProvider>(config.data_dir);
	return std::make_unique<GeocodePipeline>(config, std::move(provider));
}

void GeocodePipeline::ResolveGeography(const StateDataset &dataset, const LonLat &point,
                                       const std::string &side_geoid, GeoLevel level,
                                       const std::vector<std::string> &variables, GeocodeResult &result) const {
	std::string block_geoid;
	if (!dataset.blocks->Resolve(point, block_geoid)) {
		if (!IsValidBlockGeoid(side_geoid) || side_geoid.compare(0, 2, dataset.state_fips) != 0) {
			MarkUnmatched(result, GeocodeFailure::NO_CONTAINMENT);
			return;
		}
		block_geoid = side_geoid;
	}

	GeoidParts parts;
	if (!SplitBlockGeoid(block_geoid, parts)) {
		MarkUnmatched(result, GeocodeFailure::NO_CONTAINMENT);
		return;
	}
	result.geoid = GeoidPrefix(block_geoid, level);
	result.state_fips = parts.state;
	result.county_fips = parts.county;
	result.tract = parts.tract;
	result.block_group = parts.block_group;
	if (level == GeoLevel::BLOCK) {
		result.block = parts.block;
	}
	result.variables =
	    JoinCensusVariables(dataset.pl94171.get(), dataset.acs5.get(), dataset.state_fips, block_geoid, level,
	                        variables, dataset.pl94171_missing_reason, dataset.acs5_missing_reason);
}

GeocodeResult GeocodePipeline::Geocode(const std::string &address, GeoLevel level,
                                       const std::vector<std::string> &variables) const {
	auto result = NewResult(address, variables);

	AddressToken token;
	switch (tokenizer->Tokenize(address, token)) {
	case ParseStatus::OK:
		break;
	case ParseStatus::EMPTY:
		MarkUnmatched(result, GeocodeFailure::INCOMPLETE_ADDRESS);
		return result;
	case ParseStatus::AMBIGUOUS:
		MarkUnmatched(result, GeocodeFailure::AMBIGUOUS_PARSE);
		return result;
	}

	std::string state_fips;
	if (!token.state.empty()) {
		if (!TryNormalizeState(token.state, state_fips)) {
			MarkUnmatched(result, GeocodeFailure::NO_STATE);
			return result;
		}
	} else if (!config.default_state.empty()) {
		state_fips = config.default_state;
	} else {
		MarkUnmatched(result, GeocodeFailure::NO_STATE);
		return result;
	}

	NormalizedKey key;
	if (!NormalizeAddressKey(token, state_fips, key)) {
		MarkUnmatched(result, GeocodeFailure::INCOMPLETE_ADDRESS);
		return result;
	}

	auto dataset = cache->Get(state_fips);

	RangeMatch match;
	if (!MatchAddressRange(key, dataset->ranges, config.match, match)) {
		MarkUnmatched(result, GeocodeFailure::NO_MATCH);
		return result;
	}

	const auto point = InterpolateAddress(*match.record, match.side, key.house_number);
	result.matched_address = match.record->street_label;
	result.longitude = point.lon;
	result.latitude = point.lat;

	const std::string side_geoid = config.use_segment_side_geoid ? match.record->BlockGeoid(match.side) : "";
	ResolveGeography(*dataset, point, side_geoid, level, variables, result);
	if (result.failure != GeocodeFailure::NONE) {
		// the interpolated point and matched street stay for diagnostics
		return result;
	}
	result.match_type = match.contained ? MatchType::EXACT : MatchType::INTERPOLATED;
	result.match_score = match.score;
	return result;
}

GeocodeResult GeocodePipeline::LookupCoordinate(double longitude, double latitude, const std::string &state,
                                                GeoLevel level, const std::vector<std::string> &variables) const {
	if (!std::isfinite(longitude) || !std::isfinite(latitude) || std::fabs(longitude) > 180 ||
	    std::fabs(latitude) > 90) {
		throw duckdb::InvalidInputException("Coordinate (%s, %s) is out of range", std::to_string(longitude),
		                                    std::to_string(latitude));
	}
	std::string state_fips;
	if (!TryNormalizeState(state, state_fips)) {
		throw duckdb::InvalidInputException("Unknown state '%s'", state);
	}
	auto result = NewResult(std::string(), variables);
	result.longitude = longitude;
	result.latitude = latitude;

	auto dataset = cache->Get(state_fips);
	LonLat point;
	point.lon = longitude;
	point.lat = latitude;
	ResolveGeography(*dataset, point, std::string(), level, variables, result);
	if (result.failure == GeocodeFailure::NONE) {
		result.match_type = MatchType::EXACT;
		result.match_score = 1.0;
	}
	return result;
}

GeocodeResult GeocodePipeline::GeocodeRow(const std::string &address, GeoLevel level,
                                          const std::vector<std::string> &variables) const {
	try {
		return Geocode(address, level, variables);
	} catch (const DatasetUnavailableException &ex) {
		auto result = NewResult(address, variables);
		MarkUnmatched(result, GeocodeFailure::DATASET_UNAVAILABLE);
		result.error = duckdb::ErrorData(ex).RawMessage();
		return result;
	}
}

size_t GeocodePipeline::GeocodeBatchStreaming(const std::vector<std::string> &addresses, GeoLevel level,
                                              const std::vector<std::string> &variables, size_t chunk_size,
                                              const BatchSink &sink) const {
	if (chunk_size == 0) {
		chunk_size = addresses.size();
	}
	size_t delivered = 0;
	size_t matched = 0;
	size_t errors = 0;
	const auto threads = config.EffectiveThreads();
	auto logger = GeocodeLogger();
	while (delivered < addresses.size()) {
		const size_t first = delivered;
		const size_t count = std::min(chunk_size, addresses.size() - first);
		std::vector<GeocodeResult> chunk(count);
		ParallelFor(count, threads, [&](size_t i) { chunk[i] = GeocodeRow(addresses[first + i], level, variables); });

		for (size_t i = 0; i < count; i++) {
			const auto &row = chunk[i];
			if (row.IsMatched()) {
				matched++;
			} else {
				if (row.error) {
					errors++;
				}
				logger->debug("row {}: unmatched ({}){}{}", first + i, GeocodeFailureName(row.failure),
				              row.error ? ": " : "", row.error ? *row.error : std::string());
			}
		}
		delivered += count;
		if (!sink(first, chunk)) {
			break;
		}
	}
	logger->info("geocoded {} of {} addresses: {} matched, {} unmatched, {} dataset errors", delivered,
	             addresses.size(), matched, delivered - matched, errors);
	return delivered;
}

std::vector<GeocodeResult> GeocodePipeline::GeocodeBatch(const std::vector<std::string> &addresses, GeoLevel level,
                                                         const std::vector<std::string> &variables) const {
	std::vector<GeocodeResult> out;
	out.reserve(addresses.size());
	GeocodeBatchStreaming(addresses, level, variables, addresses.size(),
	                      [&](size_t, std::vector<GeocodeResult> &chunk) {
		                      for (auto &row : chunk) {
			                      out.push_back(std::move(row));
		                      }
		                      return true;
	                      });
	return out;
}

} // namespace census_geocode
