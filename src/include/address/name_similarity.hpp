// This file links against RapidFuzz-CPP (MIT, © 2020-2025 Max Bachmann et al.)

#pragma once

#include <rapidfuzz/distance/Levenshtein.hpp>

#include <cstdint>
#include <cstdlib>
#include <string>

namespace census_geocode {

// Cheap length guard before running the full edit distance.
inline bool LengthsDifferByMoreThan(const std::string &a, const std::string &b, int64_t k) {
	return std::llabs(static_cast<long long>(a.size()) - static_cast<long long>(b.size())) > k;
}

// Edit distance between two already folded (ASCII, upper case) street names,
// capped at max_dist + 1.
inline int64_t StreetNameDistance(const std::string &a, const std::string &b, int64_t max_dist) {
	if (max_dist < 0) {
		return static_cast<int64_t>(rapidfuzz::levenshtein_distance(a, b));
	}
	if (LengthsDifferByMoreThan(a, b, max_dist)) {
		return max_dist + 1;
	}
	return static_cast<int64_t>(rapidfuzz::levenshtein_distance(a, b, {1, 1, 1}, static_cast<size_t>(max_dist)));
}

} // namespace census_geocode
