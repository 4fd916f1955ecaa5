#pragma once

#include <cstdint>
#include <string>

namespace census_geocode {

// Labeled fields of one postal address as produced by a tokenizer.
// Absent fields are empty strings; absence is missing information, not an error.
struct AddressToken {
	std::string house_number;
	std::string predirectional;
	std::string street_name;
	std::string street_type;
	std::string postdirectional;
	std::string occupancy;
	std::string city;
	std::string state;
	std::string zip;

	bool HasStreetInfo() const {
		return !house_number.empty() && !street_name.empty();
	}

	// "PREDIR NAME TYPE POSTDIR" with empty parts skipped.
	std::string FullStreetName() const;
};

enum class ParseStatus : uint8_t {
	OK,
	EMPTY,     // nothing to tokenize
	AMBIGUOUS  // repeated or contradictory labels (two ZIPs, two states, an intersection)
};

const char *ParseStatusName(ParseStatus status);

// Turns free text into an AddressToken. Implementations must be safe to call
// concurrently from several threads.
class AddressTokenizer {
public:
	virtual ~AddressTokenizer() = default;

	virtual ParseStatus Tokenize(const std::string &text, AddressToken &token_out) const = 0;
};

// Comma-aware, table-driven tokenizer for US addresses of the usual
// "NUMBER STREET [UNIT], CITY, STATE ZIP" shape.
class RuleBasedTokenizer : public AddressTokenizer {
public:
	ParseStatus Tokenize(const std::string &text, AddressToken &token_out) const override;
};

} // namespace census_geocode
