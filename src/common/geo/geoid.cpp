#include "geo/geoid.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <cctype>

namespace census_geocode {

size_t GeoidLength(GeoLevel level) {
	switch (level) {
	case GeoLevel::STATE:
		return STATE_GEOID_LENGTH;
	case GeoLevel::COUNTY:
		return COUNTY_GEOID_LENGTH;
	case GeoLevel::TRACT:
		return TRACT_GEOID_LENGTH;
	case GeoLevel::BLOCK_GROUP:
		return BLOCK_GROUP_GEOID_LENGTH;
	case GeoLevel::BLOCK:
		return BLOCK_GEOID_LENGTH;
	}
	return BLOCK_GEOID_LENGTH;
}

const char *GeoLevelName(GeoLevel level) {
	switch (level) {
	case GeoLevel::STATE:
		return "state";
	case GeoLevel::COUNTY:
		return "county";
	case GeoLevel::TRACT:
		return "tract";
	case GeoLevel::BLOCK_GROUP:
		return "block_group";
	case GeoLevel::BLOCK:
		return "block";
	}
	return "block";
}

bool TryParseGeoLevel(const std::string &text, GeoLevel &level_out) {
	auto name = duckdb::StringUtil::Lower(text);
	duckdb::StringUtil::Trim(name);
	if (name == "state") {
		level_out = GeoLevel::STATE;
	} else if (name == "county") {
		level_out = GeoLevel::COUNTY;
	} else if (name == "tract") {
		level_out = GeoLevel::TRACT;
	} else if (name == "block_group" || name == "block group" || name == "blockgroup" || name == "bg") {
		level_out = GeoLevel::BLOCK_GROUP;
	} else if (name == "block") {
		level_out = GeoLevel::BLOCK;
	} else {
		return false;
	}
	return true;
}

GeoLevel ParseGeoLevel(const std::string &text) {
	GeoLevel level;
	if (!TryParseGeoLevel(text, level)) {
		throw duckdb::InvalidInputException(
		    "Unknown geo level '%s' (expected state, county, tract, block_group or block)", text);
	}
	return level;
}

bool IsDigitString(const std::string &text) {
	if (text.empty()) {
		return false;
	}
	for (char c : text) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

bool IsValidBlockGeoid(const std::string &geoid) {
	return geoid.size() == BLOCK_GEOID_LENGTH && IsDigitString(geoid);
}

std::string GeoidPrefix(const std::string &geoid, GeoLevel level) {
	return geoid.substr(0, GeoidLength(level));
}

std::string ExtractGeoid(const std::string &key) {
	size_t end = key.size();
	while (end > 0 && std::isspace(static_cast<unsigned char>(key[end - 1]))) {
		end--;
	}
	size_t begin = end;
	while (begin > 0 && std::isdigit(static_cast<unsigned char>(key[begin - 1]))) {
		begin--;
	}
	return key.substr(begin, end - begin);
}

bool SplitBlockGeoid(const std::string &geoid, GeoidParts &parts_out) {
	if (!IsValidBlockGeoid(geoid)) {
		return false;
	}
	parts_out.state = GeoidPrefix(geoid, GeoLevel::STATE);
	parts_out.county = GeoidPrefix(geoid, GeoLevel::COUNTY);
	parts_out.tract = GeoidPrefix(geoid, GeoLevel::TRACT);
	parts_out.block_group = GeoidPrefix(geoid, GeoLevel::BLOCK_GROUP);
	parts_out.block = geoid.substr(TRACT_GEOID_LENGTH, BLOCK_GEOID_LENGTH - TRACT_GEOID_LENGTH);
	return true;
}

} // namespace census_geocode
