#pragma once

#include <string>

namespace census_geocode {

// Accepts a USPS abbreviation ("CA"), a full name ("California", any case,
// spaces collapsed) or a 2-digit FIPS code ("06"). Covers the 50 states, DC
// and PR. Returns false for anything else.
bool TryNormalizeState(const std::string &text, std::string &fips_out);

// "06" -> "CA"; empty for an unknown FIPS.
std::string StateAbbreviation(const std::string &fips);

} // namespace census_geocode
