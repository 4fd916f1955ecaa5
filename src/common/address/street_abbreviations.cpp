#include "address/street_abbreviations.hpp"

#include <cstring>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace census_geocode {

namespace {

struct AbbreviationEntry {
	const char *canonical;
	// Space separated spellings that fold to `canonical` (the canonical form is implied).
	const char *variants;
};

// Directionals: TIGER publishes the one/two letter form.
constexpr AbbreviationEntry DIRECTIONALS[] = {
    {"N", "NORTH NO"},    {"S", "SOUTH SO"},    {"E", "EAST"},          {"W", "WEST"},
    {"NE", "NORTHEAST"}, {"NW", "NORTHWEST"}, {"SE", "SOUTHEAST"}, {"SW", "SOUTHWEST"},
};

// Street suffixes (USPS Publication 28, Appendix C1) restricted to the forms seen in TIGER FULLNAME.
constexpr AbbreviationEntry STREET_TYPES[] = {
    {"ALY", "ALLEY ALLY"},
    {"ANX", "ANNEX"},
    {"ARC", "ARCADE"},
    {"AVE", "AVENUE AV AVEN AVN"},
    {"BCH", "BEACH"},
    {"BND", "BEND"},
    {"BLVD", "BOULEVARD BLV BOUL"},
    {"BRG", "BRIDGE"},
    {"BRK", "BROOK"},
    {"BYP", "BYPASS BYPS"},
    {"CSWY", "CAUSEWAY"},
    {"CTR", "CENTER CENTRE CNTR"},
    {"CIR", "CIRCLE CRCL CIRC"},
    {"CLF", "CLIFF"},
    {"CLB", "CLUB"},
    {"CMN", "COMMON"},
    {"CMNS", "COMMONS"},
    {"CT", "COURT CRT"},
    {"CPE", "CAPE"},
    {"CRK", "CREEK"},
    {"CRES", "CRESCENT"},
    {"CRST", "CREST"},
    {"CYN", "CANYON"},
    {"DL", "DALE"},
    {"DM", "DAM"},
    {"DR", "DRIVE DRV"},
    {"DV", "DIVIDE"},
    {"EST", "ESTATE"},
    {"ESTS", "ESTATES"},
    {"EXPY", "EXPRESSWAY EXP EXPW"},
    {"FALL", ""},
    {"FLS", "FALLS"},
    {"FRY", "FERRY"},
    {"FLD", "FIELD"},
    {"FLDS", "FIELDS"},
    {"FLT", "FLAT"},
    {"FLTS", "FLATS"},
    {"FRD", "FORD"},
    {"FRST", "FOREST"},
    {"FRG", "FORGE"},
    {"FRK", "FORK"},
    {"FRKS", "FORKS"},
    {"FT", "FORT"},
    {"FWY", "FREEWAY FRWY"},
    {"GDN", "GARDEN"},
    {"GDNS", "GARDENS"},
    {"GTWY", "GATEWAY"},
    {"GLN", "GLEN"},
    {"GRN", "GREEN"},
    {"GRV", "GROVE"},
    {"HBR", "HARBOR"},
    {"HVN", "HAVEN"},
    {"HTS", "HEIGHTS"},
    {"HWY", "HIGHWAY HWAY"},
    {"HL", "HILL"},
    {"HLS", "HILLS"},
    {"HOLW", "HOLLOW"},
    {"INLT", "INLET"},
    {"IS", "ISLAND"},
    {"ISS", "ISLANDS"},
    {"JCT", "JUNCTION"},
    {"KY", "KEY"},
    {"KYS", "KEYS"},
    {"KNL", "KNOLL"},
    {"KNLS", "KNOLLS"},
    {"LK", "LAKE"},
    {"LKS", "LAKES"},
    {"LNDG", "LANDING"},
    {"LN", "LANE"},
    {"LGT", "LIGHT"},
    {"LF", "LOAF"},
    {"LCK", "LOCK"},
    {"LCKS", "LOCKS"},
    {"LDG", "LODGE"},
    {"LOOP", ""},
    {"MALL", ""},
    {"MNR", "MANOR"},
    {"MDWS", "MEADOWS"},
    {"ML", "MILL"},
    {"MLS", "MILLS"},
    {"MSN", "MISSION"},
    {"MT", "MOUNT"},
    {"MTN", "MOUNTAIN"},
    {"NCK", "NECK"},
    {"ORCH", "ORCHARD"},
    {"OVAL", ""},
    {"PARK", ""},
    {"PKWY", "PARKWAY PKY"},
    {"PASS", ""},
    {"PATH", ""},
    {"PIKE", ""},
    {"PNE", "PINE"},
    {"PNES", "PINES"},
    {"PL", "PLACE"},
    {"PLN", "PLAIN"},
    {"PLNS", "PLAINS"},
    {"PLZ", "PLAZA"},
    {"PT", "POINT"},
    {"PTS", "POINTS"},
    {"PRT", "PORT"},
    {"PRTS", "PORTS"},
    {"PR", "PRAIRIE"},
    {"RADL", "RADIAL"},
    {"RNCH", "RANCH"},
    {"RPD", "RAPID"},
    {"RPDS", "RAPIDS"},
    {"RST", "REST"},
    {"RDG", "RIDGE"},
    {"RDGS", "RIDGES"},
    {"RIV", "RIVER"},
    {"RD", "ROAD"},
    {"ROW", ""},
    {"RUN", ""},
    {"SHL", "SHOAL"},
    {"SHLS", "SHOALS"},
    {"SHR", "SHORE"},
    {"SHRS", "SHORES"},
    {"SPG", "SPRING"},
    {"SPGS", "SPRINGS"},
    {"SPUR", ""},
    {"SQ", "SQUARE"},
    {"SQS", "SQUARES"},
    {"STA", "STATION"},
    {"STRA", "STRAVENUE"},
    {"STRM", "STREAM"},
    {"ST", "STREET STR"},
    {"SMT", "SUMMIT"},
    {"TER", "TERRACE"},
    {"TRCE", "TRACE"},
    {"TRAK", "TRACK"},
    {"TRFY", "TRAFFICWAY"},
    {"TRL", "TRAIL TR"},
    {"TUNL", "TUNNEL"},
    {"TPKE", "TURNPIKE"},
    {"UN", "UNION"},
    {"UNS", "UNIONS"},
    {"VLY", "VALLEY"},
    {"VLYS", "VALLEYS"},
    {"VIA", "VIADUCT"},
    {"VW", "VIEW"},
    {"VWS", "VIEWS"},
    {"VLG", "VILLAGE"},
    {"VLGS", "VILLAGES"},
    {"VL", "VILLE"},
    {"VIS", "VISTA"},
    {"WALK", ""},
    {"WALL", ""},
    {"WAY", ""},
    {"WL", "WELL"},
    {"WLS", "WELLS"},
    {"XING", "CROSSING"},
};

constexpr AbbreviationEntry ORDINALS[] = {
    {"1ST", "FIRST"},   {"2ND", "SECOND"},   {"3RD", "THIRD"},     {"4TH", "FOURTH"},
    {"5TH", "FIFTH"},   {"6TH", "SIXTH"},    {"7TH", "SEVENTH"},   {"8TH", "EIGHTH"},
    {"9TH", "NINTH"},   {"10TH", "TENTH"},   {"11TH", "ELEVENTH"}, {"12TH", "TWELFTH"},
};

using AbbreviationMap = std::unordered_map<std::string, const char *>;

template <size_t N>
AbbreviationMap BuildMap(const AbbreviationEntry (&entries)[N]) {
	AbbreviationMap map;
	for (const auto &entry : entries) {
		map.emplace(entry.canonical, entry.canonical);
		const char *p = entry.variants;
		while (*p) {
			const char *space = std::strchr(p, ' ');
			const size_t len = space ? static_cast<size_t>(space - p) : std::strlen(p);
			if (len > 0) {
				map.emplace(std::string(p, len), entry.canonical);
			}
			p += len;
			while (*p == ' ') {
				++p;
			}
		}
	}
	return map;
}

const char *Lookup(const AbbreviationMap &map, const std::string &word) {
	auto it = map.find(word);
	return it == map.end() ? nullptr : it->second;
}

} // namespace

const char *LookupDirectional(const std::string &word) {
	static const AbbreviationMap map = BuildMap(DIRECTIONALS);
	return Lookup(map, word);
}

const char *LookupStreetType(const std::string &word) {
	static const AbbreviationMap map = BuildMap(STREET_TYPES);
	return Lookup(map, word);
}

const char *LookupOrdinal(const std::string &word) {
	static const AbbreviationMap map = BuildMap(ORDINALS);
	return Lookup(map, word);
}

bool IsOccupancyDesignator(const std::string &word) {
	static const std::unordered_set<std::string> designators = {
	    "APT", "APARTMENT", "UNIT", "STE", "SUITE", "RM", "ROOM", "FL", "FLOOR", "BLDG", "BUILDING", "LOT", "SPC",
	    "SPACE", "TRLR", "#"};
	return designators.count(word) > 0;
}

} // namespace census_geocode
