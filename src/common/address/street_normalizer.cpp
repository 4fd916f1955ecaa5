#include "address/street_normalizer.hpp"

#include "address/street_abbreviations.hpp"
#include "address/strip_diacritics.hpp"

#include <cctype>

namespace census_geocode {

namespace {

void AppendWord(std::string &out, const std::string &word) {
	if (word.empty()) {
		return;
	}
	if (!out.empty()) {
		out += ' ';
	}
	out += word;
}

bool AllDigits(const std::string &word) {
	if (word.empty()) {
		return false;
	}
	for (char c : word) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

std::string JoinRange(const std::vector<std::string> &words, size_t begin, size_t end) {
	std::string out;
	for (size_t i = begin; i < end; i++) {
		AppendWord(out, words[i]);
	}
	return out;
}

} // namespace

std::string NormalizedKey::StreetLabel() const {
	std::string out;
	AppendWord(out, predirectional);
	AppendWord(out, street_name);
	AppendWord(out, street_type);
	AppendWord(out, postdirectional);
	return out;
}

std::string StreetLabel::ToString() const {
	std::string out;
	AppendWord(out, predirectional);
	AppendWord(out, name);
	AppendWord(out, type);
	AppendWord(out, postdirectional);
	return out;
}

std::vector<std::string> FoldStreetWords(const std::string &text) {
	const std::string ascii = Unaccent(text);

	std::vector<std::string> words;
	std::string current;
	auto flush = [&]() {
		if (current.empty()) {
			return;
		}
		const char *ordinal = LookupOrdinal(current);
		words.emplace_back(ordinal ? ordinal : current);
		current.clear();
	};
	for (char c : ascii) {
		auto uc = static_cast<unsigned char>(c);
		if (std::isalnum(uc)) {
			current += static_cast<char>(std::toupper(uc));
		} else if (c == '-' && !current.empty()) {
			current += c;
		} else if (std::isspace(uc) || c == ',' || c == '/') {
			flush();
		}
		// other punctuation (periods, apostrophes, '#') is dropped in place
	}
	flush();

	// a trailing '-' left by "FOO- BAR" is not part of the word
	for (auto &word : words) {
		while (!word.empty() && word.back() == '-') {
			word.pop_back();
		}
	}
	std::vector<std::string> result;
	result.reserve(words.size());
	for (auto &word : words) {
		if (!word.empty()) {
			result.push_back(std::move(word));
		}
	}
	return result;
}

std::string FoldStreetText(const std::string &text) {
	auto words = FoldStreetWords(text);
	return JoinRange(words, 0, words.size());
}

StreetLabel ParseStreetLabel(const std::string &label) {
	auto words = FoldStreetWords(label);
	StreetLabel parts;
	size_t begin = 0;
	size_t end = words.size();

	if (end - begin >= 2) {
		if (const char *dir = LookupDirectional(words[end - 1])) {
			parts.postdirectional = dir;
			end--;
		}
	}
	if (end - begin >= 2) {
		if (const char *type = LookupStreetType(words[end - 1])) {
			parts.type = type;
			end--;
		}
	}
	if (end - begin >= 2) {
		if (const char *dir = LookupDirectional(words[begin])) {
			parts.predirectional = dir;
			begin++;
		}
	}
	// "AVENUE B", "HWY 101": a leading type word stays in the name, canonicalized
	if (end - begin >= 2) {
		if (const char *type = LookupStreetType(words[begin])) {
			words[begin] = type;
		}
	}
	parts.name = JoinRange(words, begin, end);
	return parts;
}

bool ParseHouseNumber(const std::string &text, uint32_t &number_out) {
	size_t i = 0;
	while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
		i++;
	}
	size_t digits = 0;
	uint32_t value = 0;
	while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
		if (++digits > 9) {
			return false;
		}
		value = value * 10 + static_cast<uint32_t>(text[i] - '0');
		i++;
	}
	if (digits == 0) {
		return false;
	}
	number_out = value;
	return true;
}

bool NormalizeAddressKey(const AddressToken &token, const std::string &state_fips, NormalizedKey &key_out) {
	if (!token.HasStreetInfo()) {
		return false;
	}
	uint32_t house_number = 0;
	if (!ParseHouseNumber(token.house_number, house_number)) {
		return false;
	}

	// Compose and re-parse so both sides of the comparison go through the same rules.
	std::string composed;
	AppendWord(composed, token.predirectional);
	AppendWord(composed, token.street_name);
	AppendWord(composed, token.street_type);
	AppendWord(composed, token.postdirectional);
	StreetLabel parts = ParseStreetLabel(composed);
	if (parts.name.empty()) {
		return false;
	}

	NormalizedKey key;
	key.state_fips = state_fips;
	key.street_name = std::move(parts.name);
	key.street_type = std::move(parts.type);
	key.predirectional = std::move(parts.predirectional);
	key.postdirectional = std::move(parts.postdirectional);
	key.house_number = house_number;
	std::string zip = token.zip.substr(0, 5);
	key.zip = (zip.size() == 5 && AllDigits(zip)) ? zip : std::string();
	key_out = std::move(key);
	return true;
}

} // namespace census_geocode
