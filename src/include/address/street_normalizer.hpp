#pragma once

#include "address/address_token.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace census_geocode {

// Canonical comparison key for one address. Street parts use the TIGER
// abbreviations (ST, AVE, N, NE ...) so they compare directly against
// FULLNAME-derived labels.
struct NormalizedKey {
	std::string state_fips;
	std::string street_name;
	std::string street_type;
	std::string predirectional;
	std::string postdirectional;
	std::string zip;
	uint32_t house_number = 0;

	std::string StreetLabel() const;
};

// A street label split into its canonical parts.
struct StreetLabel {
	std::string predirectional;
	std::string name;
	std::string type;
	std::string postdirectional;

	std::string ToString() const;
};

// Unaccent, upper case, drop punctuation except '-', collapse whitespace and
// fold spelled ordinals to numeric form. Returns the words.
std::vector<std::string> FoldStreetWords(const std::string &text);
std::string FoldStreetText(const std::string &text);

// Splits a folded label ("N MAIN ST", "AVENUE OF THE AMERICAS") into parts.
// A trailing directional / type, or a leading directional, is only peeled
// off while at least one word remains for the name.
StreetLabel ParseStreetLabel(const std::string &label);

// Leading digit run of a house number ("123B" -> 123, "12-14" -> 12).
// Returns false when there is no leading digit or it overflows 9 digits.
bool ParseHouseNumber(const std::string &text, uint32_t &number_out);

// Builds the matching key. Fails (IncompleteAddress) when the house number or
// street name is missing or unusable. `state_fips` is taken as given.
bool NormalizeAddressKey(const AddressToken &token, const std::string &state_fips, NormalizedKey &key_out);

} // namespace census_geocode
