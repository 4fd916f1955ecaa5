#pragma once

#include "address/address_range.hpp"
#include "address/range_match_params.hpp"
#include "address/street_normalizer.hpp"

#include <cstdint>

namespace census_geocode {

// Rungs of the match ladder, tried in order until one yields candidates.
enum class MatchRung : uint8_t { EXACT, TYPE_RELAXED, DIRECTIONAL_RELAXED, NAME_ONLY, FUZZY_NAME };

const char *MatchRungName(MatchRung rung);

struct RangeMatch {
	size_t record_index = 0;
	const AddressRangeRecord *record = nullptr;
	StreetSide side = StreetSide::LEFT;
	MatchRung rung = MatchRung::EXACT;
	// false when the number lies outside every candidate range (nearest range fallback)
	bool contained = true;
	double score = 0;
};

// Picks the best (record, side) for `key` among `ranges`. Returns false
// (NoMatch) when no rung finds a candidate street. Ties are broken by the
// smallest span, then insertion order, then left before right.
bool MatchAddressRange(const NormalizedKey &key, const AddressRangeSet &ranges, const RangeMatchParams &params,
                       RangeMatch &match_out);

inline bool MatchAddressRange(const NormalizedKey &key, const AddressRangeSet &ranges, RangeMatch &match_out) {
	return MatchAddressRange(key, ranges, DefaultRangeMatchParams(), match_out);
}

} // namespace census_geocode
