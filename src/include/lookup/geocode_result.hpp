#pragma once

#include "census/census_joiner.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace census_geocode {

enum class MatchType : uint8_t { EXACT, INTERPOLATED, UNMATCHED };

// Why a lookup ended unmatched.
enum class GeocodeFailure : uint8_t {
	NONE,
	INCOMPLETE_ADDRESS,
	AMBIGUOUS_PARSE,
	NO_STATE,
	NO_MATCH,
	NO_CONTAINMENT,
	DATASET_UNAVAILABLE
};

const char *MatchTypeName(MatchType type);
const char *GeocodeFailureName(GeocodeFailure failure);

struct GeocodeResult {
	std::string input_address;
	std::optional<std::string> matched_address;
	std::optional<double> latitude;
	std::optional<double> longitude;
	MatchType match_type = MatchType::UNMATCHED;
	double match_score = 0;
	// GEOID at the requested level, and the hierarchy above it
	std::optional<std::string> geoid;
	std::optional<std::string> state_fips;
	std::optional<std::string> county_fips;
	std::optional<std::string> tract;
	std::optional<std::string> block_group;
	// 4-digit block code, only at block level
	std::optional<std::string> block;
	// One entry per requested variable, in request order
	std::vector<CensusValue> variables;
	GeocodeFailure failure = GeocodeFailure::NONE;
	std::optional<std::string> error;

	bool IsMatched() const {
		return match_type != MatchType::UNMATCHED;
	}
};

} // namespace census_geocode
