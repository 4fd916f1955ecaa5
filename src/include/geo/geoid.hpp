#pragma once

#include <cstdint>
#include <string>

namespace census_geocode {

// Census summary levels addressable by GEOID prefix length.
enum class GeoLevel : uint8_t { STATE, COUNTY, TRACT, BLOCK_GROUP, BLOCK };

static constexpr size_t STATE_GEOID_LENGTH = 2;
static constexpr size_t COUNTY_GEOID_LENGTH = 5;
static constexpr size_t TRACT_GEOID_LENGTH = 11;
static constexpr size_t BLOCK_GROUP_GEOID_LENGTH = 12;
static constexpr size_t BLOCK_GEOID_LENGTH = 15;

size_t GeoidLength(GeoLevel level);
const char *GeoLevelName(GeoLevel level);

// "state", "county", "tract", "block_group" (or "block group", "bg"), "block"; case-insensitive.
bool TryParseGeoLevel(const std::string &text, GeoLevel &level_out);
// Same, throwing InvalidInputException for an unknown name.
GeoLevel ParseGeoLevel(const std::string &text);

bool IsDigitString(const std::string &text);
bool IsValidBlockGeoid(const std::string &geoid);

// GEOID of the geography at `level` containing the block `geoid`.
std::string GeoidPrefix(const std::string &geoid, GeoLevel level);

// Trailing digit run of a census key ("1000000US060372073011001" -> "060372073011001").
std::string ExtractGeoid(const std::string &key);

// The hierarchy derived from one 15-digit block GEOID. `block` is the
// 4-digit block code (geoid[11:15]); the others are full prefixes.
struct GeoidParts {
	std::string state;
	std::string county;
	std::string tract;
	std::string block_group;
	std::string block;
};

bool SplitBlockGeoid(const std::string &geoid, GeoidParts &parts_out);

} // namespace census_geocode
