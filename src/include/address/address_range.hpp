#pragma once

#include "address/street_normalizer.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace census_geocode {

struct LonLat {
	double lon = 0;
	double lat = 0;
};

enum class StreetSide : uint8_t { LEFT, RIGHT };

const char *StreetSideName(StreetSide side);

// One side's inclusive house-number range. `from` may be greater than `to`.
struct HouseRange {
	uint32_t from = 0;
	uint32_t to = 0;
	bool valid = false;
	// 'O' odd, 'E' even, 'B' both, 0 when the dataset does not say
	char parity = 0;

	uint32_t Low() const {
		return from < to ? from : to;
	}
	uint32_t High() const {
		return from < to ? to : from;
	}
	uint32_t Span() const {
		return High() - Low();
	}
	// Without an explicit parity the side follows the parity of its from-number.
	bool ParityAccepts(uint32_t number) const;
	bool Contains(uint32_t number) const;
	// Distance from `number` to the nearest range boundary; 0 inside.
	uint32_t Distance(uint32_t number) const;
};

struct AddressRangeRecord {
	std::string segment_id;
	// FULLNAME as published; reported back as the matched street
	std::string street_label;
	StreetLabel label;
	HouseRange left;
	HouseRange right;
	std::string zip_left;
	std::string zip_right;
	LonLat start;
	LonLat end;
	// full line geometry when available (first == start, last == end)
	std::vector<LonLat> shape;
	std::string left_block_geoid;
	std::string right_block_geoid;

	const HouseRange &Range(StreetSide side) const {
		return side == StreetSide::LEFT ? left : right;
	}
	const std::string &BlockGeoid(StreetSide side) const {
		return side == StreetSide::LEFT ? left_block_geoid : right_block_geoid;
	}
	bool HasZip(const std::string &zip) const {
		return !zip.empty() && (zip_left == zip || zip_right == zip);
	}
};

// Address ranges for one state in load order, indexed by canonical street name.
class AddressRangeSet {
public:
	size_t Add(AddressRangeRecord record);

	const std::vector<AddressRangeRecord> &Records() const {
		return records;
	}
	const AddressRangeRecord &Get(size_t index) const {
		return records[index];
	}
	size_t Size() const {
		return records.size();
	}
	// Indices (ascending) of the records whose canonical name equals `name`.
	const std::vector<size_t> *FindByName(const std::string &name) const;

	const std::unordered_map<std::string, std::vector<size_t>> &NameIndex() const {
		return by_name;
	}

private:
	std::vector<AddressRangeRecord> records;
	std::unordered_map<std::string, std::vector<size_t>> by_name;
};

} // namespace census_geocode
