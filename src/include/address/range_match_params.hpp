#pragma once

#include <cstdint>

namespace census_geocode {

// Tunable constants of the address-range match ladder.
struct RangeMatchParams {
	double exact_score = 1.0;              // name, type and directionals agree
	double type_relaxed_score = 0.9;       // street type ignored
	double directional_relaxed_score = 0.8; // directionals ignored
	double name_only_score = 0.75;         // type and directionals ignored
	double fuzzy_name_score = 0.7;         // name within fuzzy_max_edits
	double out_of_range_factor = 0.75;     // applied when no range contains the number
	int64_t fuzzy_max_edits = 1;
	uint32_t fuzzy_min_name_length = 5;    // shorter names never match fuzzily
	bool use_zip_filter = true;
};

inline const RangeMatchParams &DefaultRangeMatchParams() {
	static const RangeMatchParams defaults;
	return defaults;
}

} // namespace census_geocode
