#include "lookup/duckdb_dataset_provider.hpp"

#include "address/street_normalizer.hpp"
#include "geo/geoid.hpp"
#include "geo/geometry_codec.hpp"
#include "lookup/geocode_log.hpp"

#include "duckdb/common/string_util.hpp"

#include <geos/util/GEOSException.h>

#include <cctype>
#include <chrono>
#include <initializer_list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace census_geocode {

using duckdb::idx_t;

namespace {

const char *DatasetSubdir(DatasetKind kind) {
	switch (kind) {
	case DatasetKind::ADDRESS_RANGES:
		return "tiger/addrfeat";
	case DatasetKind::BLOCK_POLYGONS:
		return "tiger/blocks";
	case DatasetKind::PL94171:
		return "census/pl94171";
	case DatasetKind::ACS5:
		return "census/acs5/tract";
	}
	return "";
}

std::string SqlQuote(const std::string &text) {
	return "'" + duckdb::StringUtil::Replace(text, "'", "''") + "'";
}

// Upper-cased column name -> column index.
class ColumnMap {
public:
	explicit ColumnMap(const duckdb::MaterializedQueryResult &result) {
		for (idx_t i = 0; i < result.names.size(); i++) {
			by_name.emplace(duckdb::StringUtil::Upper(result.names[i]), i);
		}
	}

	bool Find(const std::string &name, idx_t &index_out) const {
		auto it = by_name.find(name);
		if (it == by_name.end()) {
			return false;
		}
		index_out = it->second;
		return true;
	}

	// First of `names` present; -1 when none.
	int64_t FindAny(std::initializer_list<const char *> names) const {
		for (auto name : names) {
			idx_t index;
			if (Find(name, index)) {
				return static_cast<int64_t>(index);
			}
		}
		return -1;
	}

private:
	std::unordered_map<std::string, idx_t> by_name;
};

std::string CellText(duckdb::MaterializedQueryResult &result, int64_t column, idx_t row) {
	if (column < 0) {
		return std::string();
	}
	auto value = result.GetValue(static_cast<idx_t>(column), row);
	if (value.IsNull()) {
		return std::string();
	}
	auto text = value.ToString();
	duckdb::StringUtil::Trim(text);
	return text;
}

bool CellDouble(duckdb::MaterializedQueryResult &result, int64_t column, idx_t row, double &out) {
	if (column < 0) {
		return false;
	}
	auto value = result.GetValue(static_cast<idx_t>(column), row);
	if (value.IsNull()) {
		return false;
	}
	duckdb::Value cast;
	std::string error;
	if (!value.DefaultTryCastAs(duckdb::LogicalType::DOUBLE, cast, &error) || cast.IsNull()) {
		return false;
	}
	out = cast.GetValue<double>();
	return true;
}

// Raw bytes for BLOB cells, text otherwise.
bool CellGeometry(duckdb::MaterializedQueryResult &result, int64_t column, idx_t row, std::string &payload_out,
                  bool &is_blob_out) {
	auto value = result.GetValue(static_cast<idx_t>(column), row);
	if (value.IsNull()) {
		return false;
	}
	is_blob_out = value.type().id() == duckdb::LogicalTypeId::BLOB;
	payload_out = is_blob_out ? duckdb::StringValue::Get(value) : value.ToString();
	return !payload_out.empty();
}

HouseRange MakeHouseRange(const std::string &from, const std::string &to, const std::string &parity) {
	HouseRange range;
	range.valid = ParseHouseNumber(from, range.from) && ParseHouseNumber(to, range.to);
	if (!parity.empty()) {
		char p = static_cast<char>(std::toupper(static_cast<unsigned char>(parity[0])));
		if (p == 'O' || p == 'E' || p == 'B') {
			range.parity = p;
		}
	}
	return range;
}

std::string NormalizeZip(const std::string &zip) {
	if (zip.size() < 5 || !IsDigitString(zip.substr(0, 5))) {
		return std::string();
	}
	return zip.substr(0, 5);
}

int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

DuckDBDatasetProvider::DuckDBDatasetProvider(std::string data_dir_p)
    : data_dir(std::move(data_dir_p)), db(nullptr), fs(duckdb::FileSystem::CreateLocal()) {
}

std::string DuckDBDatasetProvider::ResolveFile(const std::string &state_fips, DatasetKind kind) const {
	const auto dir = fs->JoinPath(data_dir, DatasetSubdir(kind));
	for (auto extension : {".parquet", ".csv"}) {
		auto path = fs->JoinPath(dir, state_fips + extension);
		if (fs->FileExists(path)) {
			return path;
		}
	}
	return std::string();
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult> DuckDBDatasetProvider::ReadTable(const std::string &state_fips,
                                                                                     DatasetKind kind) {
	auto path = ResolveFile(state_fips, kind);
	if (path.empty()) {
		throw DatasetUnavailableException(state_fips, kind,
		                                  "no cached file under " + fs->JoinPath(data_dir, DatasetSubdir(kind)));
	}
	std::string source;
	if (duckdb::StringUtil::EndsWith(path, ".parquet")) {
		source = "read_parquet(" + SqlQuote(path) + ")";
	} else {
		source = "read_csv(" + SqlQuote(path) + ", header = true, all_varchar = true)";
	}
	duckdb::Connection con(db);
	auto result = con.Query("SELECT * FROM " + source);
	if (result->HasError()) {
		throw DatasetUnavailableException(state_fips, kind, result->GetError());
	}
	return result;
}

AddressRangeSet DuckDBDatasetProvider::LoadAddressRanges(const std::string &state_fips) {
	const auto start = std::chrono::steady_clock::now();
	auto result = ReadTable(state_fips, DatasetKind::ADDRESS_RANGES);
	ColumnMap columns(*result);

	const auto fullname = columns.FindAny({"FULLNAME"});
	const auto lfrom = columns.FindAny({"LFROMHN"});
	const auto lto = columns.FindAny({"LTOHN"});
	const auto rfrom = columns.FindAny({"RFROMHN"});
	const auto rto = columns.FindAny({"RTOHN"});
	const auto geometry = columns.FindAny({"GEOMETRY", "GEOM", "WKT", "WKB_GEOMETRY"});
	const auto start_lon = columns.FindAny({"START_LON"});
	const auto start_lat = columns.FindAny({"START_LAT"});
	const auto end_lon = columns.FindAny({"END_LON"});
	const auto end_lat = columns.FindAny({"END_LAT"});
	const bool has_endpoints = start_lon >= 0 && start_lat >= 0 && end_lon >= 0 && end_lat >= 0;
	if (fullname < 0 || lfrom < 0 || lto < 0 || rfrom < 0 || rto < 0 || (geometry < 0 && !has_endpoints)) {
		throw DatasetUnavailableException(state_fips, DatasetKind::ADDRESS_RANGES,
		                                  "required columns FULLNAME, LFROMHN, LTOHN, RFROMHN, RTOHN and a "
		                                  "geometry or START_/END_ coordinates are missing");
	}
	const auto linearid = columns.FindAny({"LINEARID", "TLID"});
	const auto zipl = columns.FindAny({"ZIPL"});
	const auto zipr = columns.FindAny({"ZIPR"});
	const auto parityl = columns.FindAny({"PARITYL"});
	const auto parityr = columns.FindAny({"PARITYR"});
	const auto geoidl = columns.FindAny({"GEOIDL"});
	const auto geoidr = columns.FindAny({"GEOIDR"});

	auto factory = geos::geom::GeometryFactory::create();
	AddressRangeSet ranges;
	idx_t skipped = 0;
	for (idx_t row = 0; row < result->RowCount(); row++) {
		AddressRangeRecord record;
		record.street_label = CellText(*result, fullname, row);
		record.label = ParseStreetLabel(record.street_label);
		record.left = MakeHouseRange(CellText(*result, lfrom, row), CellText(*result, lto, row),
		                             CellText(*result, parityl, row));
		record.right = MakeHouseRange(CellText(*result, rfrom, row), CellText(*result, rto, row),
		                              CellText(*result, parityr, row));
		if (record.label.name.empty() || (!record.left.valid && !record.right.valid)) {
			skipped++;
			continue;
		}
		record.segment_id = CellText(*result, linearid, row);
		record.zip_left = NormalizeZip(CellText(*result, zipl, row));
		record.zip_right = NormalizeZip(CellText(*result, zipr, row));
		auto left_geoid = CellText(*result, geoidl, row);
		auto right_geoid = CellText(*result, geoidr, row);
		record.left_block_geoid = IsValidBlockGeoid(left_geoid) ? left_geoid : std::string();
		record.right_block_geoid = IsValidBlockGeoid(right_geoid) ? right_geoid : std::string();

		bool located = false;
		std::string payload;
		bool is_blob = false;
		if (geometry >= 0 && CellGeometry(*result, geometry, row, payload, is_blob)) {
			try {
				auto line = ReadAnyGeometry(*factory, payload, is_blob);
				record.shape = LineVertices(*line);
			} catch (const geos::util::GEOSException &ex) {
				GeocodeLogger()->debug("state {}: unreadable range geometry at row {}: {}", state_fips, row,
				                       ex.what());
			}
			if (record.shape.size() >= 2) {
				record.start = record.shape.front();
				record.end = record.shape.back();
				located = true;
			} else {
				record.shape.clear();
			}
		}
		if (!located && has_endpoints) {
			located = CellDouble(*result, start_lon, row, record.start.lon) &&
			          CellDouble(*result, start_lat, row, record.start.lat) &&
			          CellDouble(*result, end_lon, row, record.end.lon) &&
			          CellDouble(*result, end_lat, row, record.end.lat);
		}
		if (!located) {
			skipped++;
			continue;
		}
		ranges.Add(std::move(record));
	}
	if (skipped > 0) {
		GeocodeLogger()->warn("state {}: skipped {} unusable address range rows", state_fips, skipped);
	}
	GeocodeLogger()->info("state {}: loaded {} address ranges in {} ms", state_fips, ranges.Size(),
	                      ElapsedMs(start));
	return ranges;
}

std::unique_ptr<BlockIndex> DuckDBDatasetProvider::LoadBlockPolygons(const std::string &state_fips) {
	const auto start = std::chrono::steady_clock::now();
	auto result = ReadTable(state_fips, DatasetKind::BLOCK_POLYGONS);
	ColumnMap columns(*result);
	const auto geoid = columns.FindAny({"GEOID20", "GEOID"});
	const auto geometry = columns.FindAny({"GEOMETRY", "GEOM", "WKT", "WKB_GEOMETRY"});
	if (geoid < 0 || geometry < 0) {
		throw DatasetUnavailableException(state_fips, DatasetKind::BLOCK_POLYGONS,
		                                  "required columns GEOID20 (or GEOID) and geometry are missing");
	}

	auto index = std::make_unique<BlockIndex>();
	idx_t skipped = 0;
	for (idx_t row = 0; row < result->RowCount(); row++) {
		auto block_geoid = ExtractGeoid(CellText(*result, geoid, row));
		std::string payload;
		bool is_blob = false;
		if (!IsValidBlockGeoid(block_geoid) || !CellGeometry(*result, geometry, row, payload, is_blob)) {
			skipped++;
			continue;
		}
		try {
			if (!index->Add(block_geoid, ReadAnyGeometry(index->Factory(), payload, is_blob))) {
				skipped++;
			}
		} catch (const geos::util::GEOSException &ex) {
			GeocodeLogger()->debug("state {}: unreadable block geometry for {}: {}", state_fips, block_geoid,
			                       ex.what());
			skipped++;
		}
	}
	if (skipped > 0) {
		GeocodeLogger()->warn("state {}: skipped {} unusable block rows", state_fips, skipped);
	}
	if (index->Size() == 0) {
		throw DatasetUnavailableException(state_fips, DatasetKind::BLOCK_POLYGONS,
		                                  "cached block file has no usable polygons");
	}
	index->Build();
	GeocodeLogger()->info("state {}: indexed {} block polygons in {} ms", state_fips, index->Size(),
	                      ElapsedMs(start));
	return index;
}

std::unique_ptr<CensusVariableTable> DuckDBDatasetProvider::LoadCensusTable(const std::string &state_fips,
                                                                            DatasetKind kind) {
	if (kind != DatasetKind::PL94171 && kind != DatasetKind::ACS5) {
		throw duckdb::InternalException("LoadCensusTable called for %s", DatasetKindName(kind));
	}
	const auto start = std::chrono::steady_clock::now();
	auto result = ReadTable(state_fips, kind);
	ColumnMap columns(*result);
	const auto key = columns.FindAny({"GEO_ID", "GEOID", "GEOID20", "GEOCODE"});
	if (key < 0) {
		throw DatasetUnavailableException(state_fips, kind, "no GEO_ID / GEOID key column");
	}

	// every other column is a candidate variable; non-numeric cells become null
	std::vector<idx_t> value_columns;
	std::vector<std::string> codes;
	for (idx_t i = 0; i < result->names.size(); i++) {
		if (static_cast<int64_t>(i) == key) {
			continue;
		}
		value_columns.push_back(i);
		codes.push_back(result->names[i]);
	}

	const size_t key_length = kind == DatasetKind::PL94171 ? BLOCK_GEOID_LENGTH : TRACT_GEOID_LENGTH;
	auto table = std::make_unique<CensusVariableTable>(codes);
	idx_t skipped = 0;
	for (idx_t row = 0; row < result->RowCount(); row++) {
		auto geoid = ExtractGeoid(CellText(*result, key, row));
		if (geoid.size() != key_length) {
			skipped++;
			continue;
		}
		std::vector<std::optional<double>> values;
		values.reserve(value_columns.size());
		for (auto column : value_columns) {
			double value;
			if (CellDouble(*result, static_cast<int64_t>(column), row, value)) {
				values.emplace_back(value);
			} else {
				values.emplace_back(std::nullopt);
			}
		}
		table->AddRow(std::move(geoid), std::move(values));
	}
	table->Finalize();
	if (skipped > 0) {
		GeocodeLogger()->warn("state {}: skipped {} {} rows without a {}-digit GEOID", state_fips, skipped,
		                      DatasetKindName(kind), key_length);
	}
	GeocodeLogger()->info("state {}: loaded {} {} rows ({} columns) in {} ms", state_fips, table->RowCount(),
	                      DatasetKindName(kind), codes.size(), ElapsedMs(start));
	return table;
}

} // namespace census_geocode
