// =============================================================================
// Shared fixtures: a tiny Los Angeles dataset and a scratch data directory
// =============================================================================

#pragma once

#include "lookup/state_dataset.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <thread>

namespace census_geocode {
namespace testing_support {

// Block layout (all at latitude 33.99..34.01):
//   060372073011001  lon -118.000 .. -117.995   tract 06037207301
//   060372073011002  lon -117.995 .. -117.990   tract 06037207301
//   060372074001000  lon -117.990 .. -117.980   tract 06037207400
// "Main St" runs along lat 34.0 from lon -118.000 to -117.990.
// "Broadway" runs from lon -117.990 to -117.980 along lat 34.0.
static constexpr const char *BLOCK_A = "060372073011001";
static constexpr const char *BLOCK_B = "060372073011002";
static constexpr const char *BLOCK_C = "060372074001000";

inline std::string BoxWkt(double x0, double y0, double x1, double y1) {
	auto p = [](double x, double y) { return std::to_string(x) + " " + std::to_string(y); };
	return "POLYGON((" + p(x0, y0) + ", " + p(x1, y0) + ", " + p(x1, y1) + ", " + p(x0, y1) + ", " + p(x0, y0) +
	       "))";
}

// Scratch directory removed on destruction.
class TempDir {
public:
	TempDir() {
		std::random_device rd;
		auto base = std::filesystem::temp_directory_path();
		path = base / ("census_geocode_test_" + std::to_string(rd()) + "_" +
		               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
		std::filesystem::create_directories(path);
	}
	~TempDir() {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}
	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	std::string Path() const {
		return path.string();
	}

	void Write(const std::string &relative, const std::string &content) const {
		auto file = path / relative;
		std::filesystem::create_directories(file.parent_path());
		std::ofstream out(file, std::ios::binary);
		out << content;
	}

private:
	std::filesystem::path path;
};

inline void WriteAddressRanges(const TempDir &dir) {
	dir.Write("tiger/addrfeat/06.csv",
	          "LINEARID,FULLNAME,LFROMHN,LTOHN,RFROMHN,RTOHN,ZIPL,ZIPR,START_LON,START_LAT,END_LON,END_LAT\n"
	          "1001,Main St,101,199,100,198,90012,90012,-118.0,34.0,-117.99,34.0\n"
	          "1002,Broadway,201,299,200,298,90012,90012,-117.99,34.0,-117.98,34.0\n"
	          "1003,Ocean Ave,1,99,2,98,90012,90012,-117.5,34.5,-117.49,34.5\n");
}

inline void WriteBlocks(const TempDir &dir) {
	dir.Write("tiger/blocks/06.csv", std::string("GEOID20,geometry\n") + BLOCK_A + ",\"" +
	                                     BoxWkt(-118.0, 33.99, -117.995, 34.01) + "\"\n" + BLOCK_B + ",\"" +
	                                     BoxWkt(-117.995, 33.99, -117.99, 34.01) + "\"\n" + BLOCK_C + ",\"" +
	                                     BoxWkt(-117.99, 33.99, -117.98, 34.01) + "\"\n");
}

inline void WritePl94171(const TempDir &dir) {
	dir.Write("census/pl94171/06.csv", "GEO_ID,P1_001N,H1_001N\n"
	                                   "1000000US060372073011001,120,50\n"
	                                   "1000000US060372073011002,80,30\n"
	                                   "1000000US060372074001000,40,\n");
}

inline void WriteAcs(const TempDir &dir) {
	dir.Write("census/acs5/tract/06.csv", "GEO_ID,NAME,B19013_001E\n"
	                                      "1400000US06037207301,\"Census Tract 2073.01\",65000\n"
	                                      "1400000US06037207400,\"Census Tract 2074\",72000\n");
}

inline void WriteLosAngelesDataset(const TempDir &dir) {
	WriteAddressRanges(dir);
	WriteBlocks(dir);
	WritePl94171(dir);
	WriteAcs(dir);
}

// In-memory provider: one straight street and one block per state. Counts
// loads and can be slowed down or told to fail.
class FakeDatasetProvider : public DatasetProvider {
public:
	std::atomic<int> range_loads {0};
	std::atomic<bool> fail_ranges {false};
	std::chrono::milliseconds load_delay {0};

	AddressRangeSet LoadAddressRanges(const std::string &state_fips) override {
		range_loads++;
		if (load_delay.count() > 0) {
			std::this_thread::sleep_for(load_delay);
		}
		if (fail_ranges) {
			throw DatasetUnavailableException(state_fips, DatasetKind::ADDRESS_RANGES, "not downloaded");
		}
		AddressRangeSet ranges;
		AddressRangeRecord record;
		record.segment_id = "1";
		record.street_label = "Main St";
		record.label = ParseStreetLabel(record.street_label);
		record.left = HouseRange {101, 199, true, 0};
		record.right = HouseRange {100, 198, true, 0};
		record.start = LonLat {-118.0, 34.0};
		record.end = LonLat {-117.99, 34.0};
		ranges.Add(record);
		return ranges;
	}

	std::unique_ptr<BlockIndex> LoadBlockPolygons(const std::string &state_fips) override {
		auto index = std::make_unique<BlockIndex>();
		index->AddWkt(state_fips + "0372073011001", BoxWkt(-118.0, 33.99, -117.98, 34.01));
		index->Build();
		return index;
	}

	std::unique_ptr<CensusVariableTable> LoadCensusTable(const std::string &state_fips, DatasetKind kind) override {
		throw DatasetUnavailableException(state_fips, kind, "census tables not cached");
	}
};

} // namespace testing_support
} // namespace census_geocode
