#include "census/census_joiner.hpp"

#include "lookup/dataset_errors.hpp"

#include "duckdb/common/string_util.hpp"

#include <unordered_set>
#include <utility>

namespace census_geocode {

namespace {

std::vector<std::string> UniqueCodes(const std::vector<std::string> &variables) {
	std::vector<std::string> out;
	std::unordered_set<std::string> seen;
	for (const auto &variable : variables) {
		auto code = duckdb::StringUtil::Upper(variable);
		duckdb::StringUtil::Trim(code);
		if (code.empty() || !seen.insert(code).second) {
			continue;
		}
		out.push_back(std::move(code));
	}
	return out;
}

std::optional<double> PlValue(const CensusVariableTable &pl, const std::string &block_geoid, GeoLevel level,
                              const std::string &code) {
	if (level == GeoLevel::BLOCK) {
		return pl.Lookup(block_geoid, code);
	}
	return pl.SumByPrefix(GeoidPrefix(block_geoid, level), code);
}

std::optional<double> AcsValue(const CensusVariableTable &acs, const std::string &block_geoid,
                               const std::string &code) {
	return acs.Lookup(GeoidPrefix(block_geoid, GeoLevel::TRACT), code);
}

std::string MissingTableMessage(const char *family, const std::string &code, const std::string &reason) {
	std::string message = std::string("no ") + family + " table for variable " + code;
	if (!reason.empty()) {
		message += " (" + reason + ")";
	}
	return message;
}

} // namespace

std::vector<CensusValue> NullCensusValues(const std::vector<std::string> &variables) {
	std::vector<CensusValue> out;
	for (auto &code : UniqueCodes(variables)) {
		out.push_back(CensusValue {std::move(code), std::nullopt});
	}
	return out;
}

std::vector<CensusValue> JoinCensusVariables(const CensusVariableTable *pl, const CensusVariableTable *acs,
                                             const std::string &state_fips, const std::string &block_geoid,
                                             GeoLevel level, const std::vector<std::string> &variables,
                                             const std::string &pl_missing_reason,
                                             const std::string &acs_missing_reason) {
	auto out = NullCensusValues(variables);
	if (!IsValidBlockGeoid(block_geoid)) {
		return out;
	}
	for (auto &entry : out) {
		switch (ClassifyVariable(entry.code)) {
		case VariableFamily::PL94171:
			if (!pl) {
				throw DatasetUnavailableException(state_fips, DatasetKind::PL94171,
				                                  MissingTableMessage("PL 94-171", entry.code, pl_missing_reason));
			}
			entry.value = PlValue(*pl, block_geoid, level, entry.code);
			break;
		case VariableFamily::ACS:
			if (!acs) {
				throw DatasetUnavailableException(state_fips, DatasetKind::ACS5,
				                                  MissingTableMessage("ACS", entry.code, acs_missing_reason));
			}
			entry.value = AcsValue(*acs, block_geoid, entry.code);
			break;
		case VariableFamily::UNKNOWN:
			if (pl && pl->HasColumn(entry.code)) {
				entry.value = PlValue(*pl, block_geoid, level, entry.code);
			} else if (acs && acs->HasColumn(entry.code)) {
				entry.value = AcsValue(*acs, block_geoid, entry.code);
			}
			break;
		}
	}
	return out;
}

} // namespace census_geocode
