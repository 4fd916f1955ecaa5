#include "address/address_range.hpp"

#include <utility>

namespace census_geocode {

const char *StreetSideName(StreetSide side) {
	return side == StreetSide::LEFT ? "left" : "right";
}

bool HouseRange::ParityAccepts(uint32_t number) const {
	char effective = parity;
	if (effective != 'O' && effective != 'E' && effective != 'B') {
		effective = (from % 2 == 1) ? 'O' : 'E';
	}
	switch (effective) {
	case 'O':
		return number % 2 == 1;
	case 'E':
		return number % 2 == 0;
	default:
		return true;
	}
}

bool HouseRange::Contains(uint32_t number) const {
	return valid && number >= Low() && number <= High() && ParityAccepts(number);
}

uint32_t HouseRange::Distance(uint32_t number) const {
	if (number < Low()) {
		return Low() - number;
	}
	if (number > High()) {
		return number - High();
	}
	return 0;
}

size_t AddressRangeSet::Add(AddressRangeRecord record) {
	const size_t index = records.size();
	by_name[record.label.name].push_back(index);
	records.push_back(std::move(record));
	return index;
}

const std::vector<size_t> *AddressRangeSet::FindByName(const std::string &name) const {
	auto it = by_name.find(name);
	return it == by_name.end() ? nullptr : &it->second;
}

} // namespace census_geocode
