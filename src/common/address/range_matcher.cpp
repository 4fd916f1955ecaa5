#include "address/range_matcher.hpp"

#include "address/name_similarity.hpp"

#include <algorithm>
#include <tuple>
#include <utility>
#include <vector>

namespace census_geocode {

namespace {

constexpr MatchRung RUNGS[] = {MatchRung::EXACT, MatchRung::TYPE_RELAXED, MatchRung::DIRECTIONAL_RELAXED,
                               MatchRung::NAME_ONLY, MatchRung::FUZZY_NAME};

double RungCeiling(MatchRung rung, const RangeMatchParams &params) {
	switch (rung) {
	case MatchRung::EXACT:
		return params.exact_score;
	case MatchRung::TYPE_RELAXED:
		return params.type_relaxed_score;
	case MatchRung::DIRECTIONAL_RELAXED:
		return params.directional_relaxed_score;
	case MatchRung::NAME_ONLY:
		return params.name_only_score;
	case MatchRung::FUZZY_NAME:
		return params.fuzzy_name_score;
	}
	return 0;
}

bool SameDirectionals(const NormalizedKey &key, const StreetLabel &label) {
	return key.predirectional == label.predirectional && key.postdirectional == label.postdirectional;
}

bool RungAccepts(MatchRung rung, const NormalizedKey &key, const StreetLabel &label) {
	switch (rung) {
	case MatchRung::EXACT:
		return key.street_type == label.type && SameDirectionals(key, label);
	case MatchRung::TYPE_RELAXED:
		return SameDirectionals(key, label);
	case MatchRung::DIRECTIONAL_RELAXED:
		return key.street_type == label.type;
	case MatchRung::NAME_ONLY:
	case MatchRung::FUZZY_NAME:
		return true;
	}
	return false;
}

std::vector<size_t> FuzzyNameCandidates(const NormalizedKey &key, const AddressRangeSet &ranges,
                                        const RangeMatchParams &params) {
	std::vector<size_t> out;
	if (params.fuzzy_max_edits <= 0 || key.street_name.size() < params.fuzzy_min_name_length) {
		return out;
	}
	for (const auto &entry : ranges.NameIndex()) {
		const auto &name = entry.first;
		if (name == key.street_name || name.size() < params.fuzzy_min_name_length) {
			continue;
		}
		if (StreetNameDistance(key.street_name, name, params.fuzzy_max_edits) <= params.fuzzy_max_edits) {
			out.insert(out.end(), entry.second.begin(), entry.second.end());
		}
	}
	// name index iteration order is unspecified
	std::sort(out.begin(), out.end());
	return out;
}

std::vector<size_t> RungCandidates(MatchRung rung, const NormalizedKey &key, const AddressRangeSet &ranges,
                                   const RangeMatchParams &params) {
	std::vector<size_t> out;
	if (rung == MatchRung::FUZZY_NAME) {
		out = FuzzyNameCandidates(key, ranges, params);
	} else if (auto same_name = ranges.FindByName(key.street_name)) {
		for (auto index : *same_name) {
			if (RungAccepts(rung, key, ranges.Get(index).label)) {
				out.push_back(index);
			}
		}
	}
	if (params.use_zip_filter && !key.zip.empty() && !out.empty()) {
		std::vector<size_t> in_zip;
		for (auto index : out) {
			if (ranges.Get(index).HasZip(key.zip)) {
				in_zip.push_back(index);
			}
		}
		if (!in_zip.empty()) {
			out.swap(in_zip);
		}
	}
	return out;
}

constexpr StreetSide SIDES[] = {StreetSide::LEFT, StreetSide::RIGHT};

// Tightest range containing the number; ties on insertion order then side.
bool BestContaining(const std::vector<size_t> &candidates, const AddressRangeSet &ranges, uint32_t number,
                    size_t &index_out, StreetSide &side_out) {
	bool found = false;
	uint32_t best_span = 0;
	for (auto index : candidates) {
		const auto &record = ranges.Get(index);
		for (auto side : SIDES) {
			const auto &range = record.Range(side);
			if (!range.Contains(number)) {
				continue;
			}
			// candidates are ascending, so only a strictly smaller span displaces
			if (!found || range.Span() < best_span) {
				found = true;
				best_span = range.Span();
				index_out = index;
				side_out = side;
			}
		}
	}
	return found;
}

// Nearest range by distance to its boundary, preferring matching parity.
bool BestNearest(const std::vector<size_t> &candidates, const AddressRangeSet &ranges, uint32_t number,
                 size_t &index_out, StreetSide &side_out) {
	bool found = false;
	std::tuple<uint32_t, int, uint32_t> best;
	for (auto index : candidates) {
		const auto &record = ranges.Get(index);
		for (auto side : SIDES) {
			const auto &range = record.Range(side);
			if (!range.valid) {
				continue;
			}
			auto rank = std::make_tuple(range.Distance(number), range.ParityAccepts(number) ? 0 : 1, range.Span());
			if (!found || rank < best) {
				found = true;
				best = rank;
				index_out = index;
				side_out = side;
			}
		}
	}
	return found;
}

} // namespace

const char *MatchRungName(MatchRung rung) {
	switch (rung) {
	case MatchRung::EXACT:
		return "exact";
	case MatchRung::TYPE_RELAXED:
		return "type_relaxed";
	case MatchRung::DIRECTIONAL_RELAXED:
		return "directional_relaxed";
	case MatchRung::NAME_ONLY:
		return "name_only";
	case MatchRung::FUZZY_NAME:
		return "fuzzy_name";
	}
	return "unknown";
}

bool MatchAddressRange(const NormalizedKey &key, const AddressRangeSet &ranges, const RangeMatchParams &params,
                       RangeMatch &match_out) {
	if (key.street_name.empty() || ranges.Size() == 0) {
		return false;
	}

	bool have_fallback = false;
	MatchRung fallback_rung = MatchRung::EXACT;
	std::vector<size_t> fallback_candidates;

	for (auto rung : RUNGS) {
		auto candidates = RungCandidates(rung, key, ranges, params);
		if (candidates.empty()) {
			continue;
		}
		size_t index = 0;
		StreetSide side = StreetSide::LEFT;
		if (BestContaining(candidates, ranges, key.house_number, index, side)) {
			match_out.record_index = index;
			match_out.record = &ranges.Get(index);
			match_out.side = side;
			match_out.rung = rung;
			match_out.contained = true;
			match_out.score = RungCeiling(rung, params);
			return true;
		}
		if (!have_fallback) {
			have_fallback = true;
			fallback_rung = rung;
			fallback_candidates = std::move(candidates);
		}
	}

	if (!have_fallback) {
		return false;
	}
	size_t index = 0;
	StreetSide side = StreetSide::LEFT;
	if (!BestNearest(fallback_candidates, ranges, key.house_number, index, side)) {
		return false;
	}
	match_out.record_index = index;
	match_out.record = &ranges.Get(index);
	match_out.side = side;
	match_out.rung = fallback_rung;
	match_out.contained = false;
	match_out.score = RungCeiling(fallback_rung, params) * params.out_of_range_factor;
	return true;
}

} // namespace census_geocode
