#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace census_geocode {

// Which published product a variable code belongs to.
enum class VariableFamily : uint8_t {
	PL94171, // P1_001N, H1_001N: block level counts
	ACS,     // B19013_001E, C17002_002M: tract level estimates
	UNKNOWN
};

VariableFamily ClassifyVariable(const std::string &code);
const char *VariableFamilyName(VariableFamily family);

// Numeric census variables keyed by GEOID. Rows are kept sorted by GEOID so
// that all rows under a prefix (e.g. every block of a tract) are contiguous.
class CensusVariableTable {
public:
	explicit CensusVariableTable(std::vector<std::string> column_codes);

	// Column codes are stored upper case.
	const std::vector<std::string> &Columns() const {
		return columns;
	}
	bool HasColumn(const std::string &code) const;

	// `values` aligned with Columns(). Call Finalize once all rows are in.
	void AddRow(std::string geoid, std::vector<std::optional<double>> values);
	// Sorts by GEOID; for a repeated GEOID the first row added wins.
	void Finalize();

	size_t RowCount() const {
		return rows.size();
	}

	// Value of `code` for exactly `geoid`; null when either is absent.
	std::optional<double> Lookup(const std::string &geoid, const std::string &code) const;
	// Sum of `code` over every row whose GEOID starts with `prefix`. Nulls are
	// skipped; the result is null when no row contributes a value.
	std::optional<double> SumByPrefix(const std::string &prefix, const std::string &code) const;

private:
	struct Row {
		std::string geoid;
		std::vector<std::optional<double>> values;
	};

	bool ColumnIndex(const std::string &code, size_t &index_out) const;

	std::vector<std::string> columns;
	std::unordered_map<std::string, size_t> column_index;
	std::vector<Row> rows;
	bool finalized = false;
};

} // namespace census_geocode
