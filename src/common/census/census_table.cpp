#include "census/census_table.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace census_geocode {

namespace {

bool DigitsAt(const std::string &s, size_t pos, size_t count) {
	if (pos + count > s.size()) {
		return false;
	}
	for (size_t i = pos; i < pos + count; i++) {
		if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
			return false;
		}
	}
	return true;
}

// [PH]<digits>_<3 digits>N
bool IsPlCode(const std::string &code) {
	if (code.size() < 7 || (code[0] != 'P' && code[0] != 'H') || code.back() != 'N') {
		return false;
	}
	size_t pos = 1;
	while (pos < code.size() && std::isdigit(static_cast<unsigned char>(code[pos]))) {
		pos++;
	}
	return pos > 1 && pos < code.size() && code[pos] == '_' && DigitsAt(code, pos + 1, 3) && pos + 5 == code.size();
}

// [BC]<5 digits>[A-Z]?_<3 digits>[EM]
bool IsAcsCode(const std::string &code) {
	if (code.size() < 11 || (code[0] != 'B' && code[0] != 'C') || !DigitsAt(code, 1, 5)) {
		return false;
	}
	size_t pos = 6;
	if (pos < code.size() && std::isalpha(static_cast<unsigned char>(code[pos]))) {
		pos++;
	}
	const char last = code.back();
	return code.size() == pos + 5 && code[pos] == '_' && DigitsAt(code, pos + 1, 3) && (last == 'E' || last == 'M');
}

} // namespace

VariableFamily ClassifyVariable(const std::string &code) {
	const auto upper = duckdb::StringUtil::Upper(code);
	if (IsPlCode(upper)) {
		return VariableFamily::PL94171;
	}
	if (IsAcsCode(upper)) {
		return VariableFamily::ACS;
	}
	return VariableFamily::UNKNOWN;
}

const char *VariableFamilyName(VariableFamily family) {
	switch (family) {
	case VariableFamily::PL94171:
		return "pl94171";
	case VariableFamily::ACS:
		return "acs5";
	case VariableFamily::UNKNOWN:
		return "unknown";
	}
	return "unknown";
}

CensusVariableTable::CensusVariableTable(std::vector<std::string> column_codes) {
	columns.reserve(column_codes.size());
	for (auto &code : column_codes) {
		auto upper = duckdb::StringUtil::Upper(code);
		column_index.emplace(upper, columns.size());
		columns.push_back(std::move(upper));
	}
}

bool CensusVariableTable::ColumnIndex(const std::string &code, size_t &index_out) const {
	auto it = column_index.find(duckdb::StringUtil::Upper(code));
	if (it == column_index.end()) {
		return false;
	}
	index_out = it->second;
	return true;
}

bool CensusVariableTable::HasColumn(const std::string &code) const {
	size_t index;
	return ColumnIndex(code, index);
}

void CensusVariableTable::AddRow(std::string geoid, std::vector<std::optional<double>> values) {
	if (finalized) {
		throw duckdb::InternalException("CensusVariableTable::AddRow called after Finalize");
	}
	if (values.size() != columns.size()) {
		throw duckdb::InternalException("CensusVariableTable row has %s values for %s columns",
		                                std::to_string(values.size()), std::to_string(columns.size()));
	}
	rows.push_back(Row {std::move(geoid), std::move(values)});
}

void CensusVariableTable::Finalize() {
	std::stable_sort(rows.begin(), rows.end(), [](const Row &a, const Row &b) { return a.geoid < b.geoid; });
	rows.erase(std::unique(rows.begin(), rows.end(), [](const Row &a, const Row &b) { return a.geoid == b.geoid; }),
	           rows.end());
	finalized = true;
}

std::optional<double> CensusVariableTable::Lookup(const std::string &geoid, const std::string &code) const {
	size_t column;
	if (!ColumnIndex(code, column)) {
		return std::nullopt;
	}
	auto it = std::lower_bound(rows.begin(), rows.end(), geoid,
	                           [](const Row &row, const std::string &key) { return row.geoid < key; });
	if (it == rows.end() || it->geoid != geoid) {
		return std::nullopt;
	}
	return it->values[column];
}

std::optional<double> CensusVariableTable::SumByPrefix(const std::string &prefix, const std::string &code) const {
	size_t column;
	if (!ColumnIndex(code, column)) {
		return std::nullopt;
	}
	auto it = std::lower_bound(rows.begin(), rows.end(), prefix,
	                           [](const Row &row, const std::string &key) { return row.geoid < key; });
	double sum = 0;
	bool any = false;
	for (; it != rows.end() && it->geoid.compare(0, prefix.size(), prefix) == 0; ++it) {
		const auto &value = it->values[column];
		if (value) {
			sum += *value;
			any = true;
		}
	}
	if (!any) {
		return std::nullopt;
	}
	return sum;
}

} // namespace census_geocode
