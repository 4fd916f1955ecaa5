#include "address/address_token.hpp"

#include "address/street_abbreviations.hpp"
#include "address/strip_diacritics.hpp"
#include "geo/state_fips.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <utility>
#include <vector>

namespace census_geocode {

namespace {

struct Word {
	std::string text;
	size_t part; // index of the comma separated part the word came from
};

bool IsDigits(const std::string &s, size_t begin, size_t end) {
	if (begin >= end || end > s.size()) {
		return false;
	}
	for (size_t i = begin; i < end; i++) {
		if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
			return false;
		}
	}
	return true;
}

bool IsAlpha(const std::string &s) {
	if (s.empty()) {
		return false;
	}
	for (char c : s) {
		if (!std::isalpha(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

// 12345, 12345-6789 or 123456789. Returns the 5-digit ZIP.
bool TryZip(const std::string &word, std::string &zip_out) {
	const bool plain = word.size() == 5 && IsDigits(word, 0, 5);
	const bool plus4 = word.size() == 10 && IsDigits(word, 0, 5) && word[5] == '-' && IsDigits(word, 6, 10);
	const bool nine = word.size() == 9 && IsDigits(word, 0, 9);
	if (!plain && !plus4 && !nine) {
		return false;
	}
	zip_out = word.substr(0, 5);
	return true;
}

bool IsOccupancyWord(const std::string &word) {
	return word == "#" || IsOccupancyDesignator(word);
}

bool IsIntersectionWord(const std::string &word) {
	return word == "&" || word == "@" || word == "AND";
}

bool IsStreetVocabulary(const std::string &word) {
	return LookupDirectional(word) || LookupStreetType(word) || IsOccupancyWord(word);
}

std::vector<Word> SplitWords(const std::string &text) {
	const std::string ascii = Unaccent(text);
	std::vector<Word> words;
	std::string current;
	size_t part = 0;
	auto flush = [&]() {
		while (!current.empty() && current.back() == '-') {
			current.pop_back();
		}
		if (!current.empty()) {
			words.push_back(Word {current, part});
		}
		current.clear();
	};
	for (char c : ascii) {
		auto uc = static_cast<unsigned char>(c);
		if (std::isalnum(uc)) {
			current += static_cast<char>(std::toupper(uc));
		} else if (c == '-') {
			if (!current.empty()) {
				current += c;
			}
		} else if (c == '#' || c == '&' || c == '@') {
			flush();
			words.push_back(Word {std::string(1, c), part});
		} else if (c == ',' || c == ';') {
			flush();
			part++;
		} else if (std::isspace(uc)) {
			flush();
		}
	}
	flush();
	return words;
}

std::string Join(const std::vector<std::string> &words, size_t begin, size_t end) {
	std::string out;
	for (size_t i = begin; i < end && i < words.size(); i++) {
		if (!out.empty()) {
			out += ' ';
		}
		out += words[i];
	}
	return out;
}

// Fills house number, directionals, name, type and occupancy from one street line.
ParseStatus TokenizeStreetLine(std::vector<std::string> line, AddressToken &token) {
	for (const auto &word : line) {
		if (IsIntersectionWord(word)) {
			return ParseStatus::AMBIGUOUS;
		}
	}
	for (size_t k = 2; k < line.size(); k++) {
		if (IsOccupancyWord(line[k])) {
			token.occupancy = Join(line, k, line.size());
			line.resize(k);
			break;
		}
	}
	size_t begin = 0;
	size_t end = line.size();
	if (begin < end && std::isdigit(static_cast<unsigned char>(line[begin][0]))) {
		token.house_number = line[begin];
		begin++;
	}
	if (end - begin >= 2 && LookupDirectional(line[end - 1])) {
		token.postdirectional = line[end - 1];
		end--;
	}
	if (end - begin >= 2 && LookupStreetType(line[end - 1])) {
		token.street_type = line[end - 1];
		end--;
	}
	if (end - begin >= 2 && LookupDirectional(line[begin])) {
		token.predirectional = line[begin];
		begin++;
	}
	token.street_name = Join(line, begin, end);
	return ParseStatus::OK;
}

} // namespace

std::string AddressToken::FullStreetName() const {
	std::string out;
	for (const std::string *part : {&predirectional, &street_name, &street_type, &postdirectional}) {
		if (part->empty()) {
			continue;
		}
		if (!out.empty()) {
			out += ' ';
		}
		out += *part;
	}
	return out;
}

const char *ParseStatusName(ParseStatus status) {
	switch (status) {
	case ParseStatus::OK:
		return "ok";
	case ParseStatus::EMPTY:
		return "empty";
	case ParseStatus::AMBIGUOUS:
		return "ambiguous";
	}
	return "unknown";
}

ParseStatus RuleBasedTokenizer::Tokenize(const std::string &text, AddressToken &token_out) const {
	token_out = AddressToken();
	std::vector<Word> words = SplitWords(text);
	if (words.empty()) {
		return ParseStatus::EMPTY;
	}
	const bool has_commas = words.back().part > words.front().part;
	const size_t street_part = words.front().part;

	AddressToken token;

	// ZIP: last word, possibly repeated right before it.
	std::string zip;
	if (words.size() > 1 && TryZip(words.back().text, zip)) {
		words.pop_back();
		std::string other;
		if (words.size() > 1 && TryZip(words.back().text, other)) {
			if (other != zip) {
				return ParseStatus::AMBIGUOUS;
			}
			words.pop_back();
		}
		token.zip = zip;
	}
	if (has_commas) {
		for (const auto &word : words) {
			std::string other;
			if (word.part != street_part && TryZip(word.text, other) && other != token.zip) {
				return ParseStatus::AMBIGUOUS;
			}
		}
	}

	// State: up to three trailing alphabetic words ("NEW YORK", "DISTRICT OF COLUMBIA").
	std::string state_fips;
	for (size_t len = 3; len >= 1 && state_fips.empty(); len--) {
		if (words.size() < len + 1) {
			continue;
		}
		const size_t begin = words.size() - len;
		bool usable = true;
		std::string candidate;
		for (size_t i = begin; i < words.size(); i++) {
			if (!IsAlpha(words[i].text) || words[i].part != words.back().part) {
				usable = false;
				break;
			}
			candidate += (i == begin ? "" : " ") + words[i].text;
		}
		if (!usable) {
			continue;
		}
		if (has_commas) {
			if (words[begin].part == street_part) {
				continue;
			}
		} else {
			// "123 MAIN ST NE" without a ZIP: NE is a directional, not Nebraska
			if (begin < 2 || (token.zip.empty() && len == 1 && IsStreetVocabulary(candidate))) {
				continue;
			}
		}
		std::string fips;
		if (TryNormalizeState(candidate, fips)) {
			state_fips = fips;
			words.resize(begin);
		}
	}
	if (!state_fips.empty()) {
		token.state = StateAbbreviation(state_fips);
		if (has_commas) {
			// a whole tail part naming a different state ("..., CA, NY")
			std::vector<std::string> part_words;
			size_t current_part = words.empty() ? 0 : words.front().part;
			auto check_part = [&]() -> bool {
				if (part_words.size() == 1 && part_words[0].size() == 2) {
					std::string other;
					if (TryNormalizeState(part_words[0], other) && other != state_fips) {
						return false;
					}
				}
				return true;
			};
			for (const auto &word : words) {
				if (word.part != current_part) {
					if (current_part != street_part && !check_part()) {
						return ParseStatus::AMBIGUOUS;
					}
					part_words.clear();
					current_part = word.part;
				}
				part_words.push_back(word.text);
			}
			if (current_part != street_part && !check_part()) {
				return ParseStatus::AMBIGUOUS;
			}
		}
	}

	std::vector<std::string> street_line;
	std::vector<std::string> city;
	if (has_commas) {
		size_t city_part = 0;
		bool city_found = false;
		std::vector<std::string> occupancy;
		for (size_t i = 0; i < words.size(); i++) {
			const auto &word = words[i];
			if (word.part == street_part) {
				street_line.push_back(word.text);
				continue;
			}
			const bool part_start = i == 0 || words[i - 1].part != word.part;
			if (part_start && IsOccupancyWord(word.text)) {
				// "..., APT 4, ..." keeps the whole part as occupancy
				size_t j = i;
				while (j < words.size() && words[j].part == word.part) {
					occupancy.push_back(words[j].text);
					j++;
				}
				i = j - 1;
				continue;
			}
			if (!city_found) {
				city_found = true;
				city_part = word.part;
			}
			if (word.part == city_part) {
				city.push_back(word.text);
			}
		}
		if (!occupancy.empty()) {
			token.occupancy = Join(occupancy, 0, occupancy.size());
		}
	} else {
		std::vector<std::string> flat;
		for (const auto &word : words) {
			flat.push_back(word.text);
		}
		const bool numbered = !flat.empty() && std::isdigit(static_cast<unsigned char>(flat[0][0]));
		size_t street_end = flat.size();
		for (size_t i = numbered ? 2 : 1; i < flat.size(); i++) {
			if (LookupStreetType(flat[i])) {
				street_end = i + 1;
				if (street_end < flat.size() && LookupDirectional(flat[street_end])) {
					street_end++;
				}
				if (street_end < flat.size() && IsOccupancyWord(flat[street_end])) {
					street_end = std::min(flat.size(), street_end + 2);
				}
				break;
			}
		}
		street_line.assign(flat.begin(), flat.begin() + static_cast<std::ptrdiff_t>(street_end));
		city.assign(flat.begin() + static_cast<std::ptrdiff_t>(street_end), flat.end());
	}

	// unit given as its own comma part goes after any unit on the street line
	std::string part_occupancy;
	std::swap(part_occupancy, token.occupancy);
	auto status = TokenizeStreetLine(std::move(street_line), token);
	if (status != ParseStatus::OK) {
		return status;
	}
	if (!part_occupancy.empty()) {
		token.occupancy = token.occupancy.empty() ? part_occupancy : token.occupancy + " " + part_occupancy;
	}
	token.city = Join(city, 0, city.size());
	token_out = std::move(token);
	return ParseStatus::OK;
}

} // namespace census_geocode
