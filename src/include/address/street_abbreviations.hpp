#pragma once

#include <string>

namespace census_geocode {

// Lookups over the USPS / TIGER abbreviation tables. All inputs must already be
// upper case with punctuation removed. Each returns the canonical TIGER form
// (e.g. "NORTHWEST" -> "NW", "AVENUE" -> "AVE", "FIRST" -> "1ST") or nullptr
// when the word is not in the table.
const char *LookupDirectional(const std::string &word);
const char *LookupStreetType(const std::string &word);
const char *LookupOrdinal(const std::string &word);

// APT, UNIT, STE, SUITE, RM, FL, BLDG and their long forms.
bool IsOccupancyDesignator(const std::string &word);

} // namespace census_geocode
