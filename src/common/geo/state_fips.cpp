#include "geo/state_fips.hpp"

#include <cctype>
#include <unordered_map>

namespace census_geocode {

namespace {

struct StateEntry {
	const char *fips;
	const char *abbreviation;
	const char *name;
};

constexpr StateEntry STATES[] = {
    {"01", "AL", "ALABAMA"},        {"02", "AK", "ALASKA"},         {"04", "AZ", "ARIZONA"},
    {"05", "AR", "ARKANSAS"},       {"06", "CA", "CALIFORNIA"},     {"08", "CO", "COLORADO"},
    {"09", "CT", "CONNECTICUT"},    {"10", "DE", "DELAWARE"},       {"11", "DC", "DISTRICT OF COLUMBIA"},
    {"12", "FL", "FLORIDA"},        {"13", "GA", "GEORGIA"},        {"15", "HI", "HAWAII"},
    {"16", "ID", "IDAHO"},          {"17", "IL", "ILLINOIS"},       {"18", "IN", "INDIANA"},
    {"19", "IA", "IOWA"},           {"20", "KS", "KANSAS"},         {"21", "KY", "KENTUCKY"},
    {"22", "LA", "LOUISIANA"},      {"23", "ME", "MAINE"},          {"24", "MD", "MARYLAND"},
    {"25", "MA", "MASSACHUSETTS"},  {"26", "MI", "MICHIGAN"},       {"27", "MN", "MINNESOTA"},
    {"28", "MS", "MISSISSIPPI"},    {"29", "MO", "MISSOURI"},       {"30", "MT", "MONTANA"},
    {"31", "NE", "NEBRASKA"},       {"32", "NV", "NEVADA"},         {"33", "NH", "NEW HAMPSHIRE"},
    {"34", "NJ", "NEW JERSEY"},     {"35", "NM", "NEW MEXICO"},     {"36", "NY", "NEW YORK"},
    {"37", "NC", "NORTH CAROLINA"}, {"38", "ND", "NORTH DAKOTA"},   {"39", "OH", "OHIO"},
    {"40", "OK", "OKLAHOMA"},       {"41", "OR", "OREGON"},         {"42", "PA", "PENNSYLVANIA"},
    {"44", "RI", "RHODE ISLAND"},   {"45", "SC", "SOUTH CAROLINA"}, {"46", "SD", "SOUTH DAKOTA"},
    {"47", "TN", "TENNESSEE"},      {"48", "TX", "TEXAS"},          {"49", "UT", "UTAH"},
    {"50", "VT", "VERMONT"},        {"51", "VA", "VIRGINIA"},       {"53", "WA", "WASHINGTON"},
    {"54", "WV", "WEST VIRGINIA"},  {"55", "WI", "WISCONSIN"},      {"56", "WY", "WYOMING"},
    {"72", "PR", "PUERTO RICO"},
};

struct StateTables {
	std::unordered_map<std::string, const StateEntry *> by_key;
	std::unordered_map<std::string, const StateEntry *> by_fips;

	StateTables() {
		for (const auto &entry : STATES) {
			by_key.emplace(entry.fips, &entry);
			by_key.emplace(entry.abbreviation, &entry);
			by_key.emplace(entry.name, &entry);
			by_fips.emplace(entry.fips, &entry);
		}
	}
};

const StateTables &Tables() {
	static const StateTables tables;
	return tables;
}

std::string CanonicalStateText(const std::string &text) {
	std::string out;
	bool pending_space = false;
	for (char c : text) {
		auto uc = static_cast<unsigned char>(c);
		if (std::isalnum(uc)) {
			if (pending_space && !out.empty()) {
				out += ' ';
			}
			pending_space = false;
			out += static_cast<char>(std::toupper(uc));
		} else if (std::isspace(uc)) {
			pending_space = true;
		}
		// "D.C." -> "DC"
	}
	return out;
}

} // namespace

bool TryNormalizeState(const std::string &text, std::string &fips_out) {
	const auto key = CanonicalStateText(text);
	if (key.empty()) {
		return false;
	}
	const auto &tables = Tables();
	auto it = tables.by_key.find(key);
	if (it == tables.by_key.end()) {
		return false;
	}
	fips_out = it->second->fips;
	return true;
}

std::string StateAbbreviation(const std::string &fips) {
	const auto &tables = Tables();
	auto it = tables.by_fips.find(fips);
	return it == tables.by_fips.end() ? std::string() : std::string(it->second->abbreviation);
}

} // namespace census_geocode
