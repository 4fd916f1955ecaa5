#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <utf8proc.h>

namespace census_geocode {

struct Utf8procDeleter {
	void operator()(utf8proc_uint8_t *p) const {
		free(p);
	}
};
using Utf8Buf = std::unique_ptr<utf8proc_uint8_t, Utf8procDeleter>;

// NFKD + mark stripping. Returns false (and leaves `out` untouched) when the
// input is not valid UTF-8; callers then fall back to the raw bytes.
inline bool StripDiacritics(const std::string &utf8, std::string &out) {
	utf8proc_uint8_t *out_raw = nullptr;
	constexpr utf8proc_option_t FLAGS = static_cast<utf8proc_option_t>(UTF8PROC_NULLTERM | UTF8PROC_COMPAT |
	                                                                   UTF8PROC_DECOMPOSE | UTF8PROC_STRIPMARK |
	                                                                   UTF8PROC_LUMP);
	utf8proc_ssize_t rc = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t *>(utf8.c_str()), 0, &out_raw, FLAGS);
	if (rc < 0) {
		return false;
	}
	Utf8Buf holder(out_raw);
	out.assign(reinterpret_cast<char *>(holder.get()), static_cast<size_t>(rc));
	return true;
}

// Latin letters with no decomposition. nullptr when the code point is not one.
inline const char *LatinLetterFold(utf8proc_int32_t cp) {
	switch (cp) {
	case 0x00D8: // Ø
	case 0x00F8:
		return "O";
	case 0x00DE: // Þ
	case 0x00FE:
		return "TH";
	case 0x00D0: // Ð
	case 0x00F0:
	case 0x0110: // Đ
	case 0x0111:
		return "D";
	case 0x00DF: // ß
		return "SS";
	case 0x00C6: // Æ
	case 0x00E6:
		return "AE";
	case 0x0152: // Œ
	case 0x0153:
		return "OE";
	case 0x0141: // Ł
	case 0x0142:
		return "L";
	default:
		return nullptr;
	}
}

// Diacritic stripping, then a code point pass for the letters NFKD leaves
// alone. Folded letters come out upper case; address text is upper-cased
// right after this anyway.
inline std::string Unaccent(const std::string &utf8) {
	std::string stripped;
	if (!StripDiacritics(utf8, stripped)) {
		return utf8;
	}

	std::string result;
	result.reserve(stripped.size());
	auto p = reinterpret_cast<const utf8proc_uint8_t *>(stripped.data());
	utf8proc_ssize_t remaining = static_cast<utf8proc_ssize_t>(stripped.size());
	while (remaining > 0) {
		utf8proc_int32_t cp;
		auto n = utf8proc_iterate(p, remaining, &cp);
		if (n <= 0) {
			result.push_back(static_cast<char>(*p));
			p++;
			remaining--;
			continue;
		}
		if (const char *fold = LatinLetterFold(cp)) {
			result += fold;
		} else {
			result.append(reinterpret_cast<const char *>(p), static_cast<size_t>(n));
		}
		p += n;
		remaining -= n;
	}
	return result;
}

} // namespace census_geocode
