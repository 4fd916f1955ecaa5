// =============================================================================
// Census variable tables and the block -> level joiner
// =============================================================================

#include <gtest/gtest.h>

#include "census/census_joiner.hpp"
#include "lookup/dataset_errors.hpp"

#include "duckdb/common/error_data.hpp"

using namespace census_geocode;

class CensusJoinerTest : public ::testing::Test {
protected:
	void SetUp() override {
		pl.AddRow("060372073011002", {80.0, 30.0});
		pl.AddRow("060372073011001", {120.0, 50.0});
		pl.AddRow("060372073012000", {10.0, std::nullopt});
		pl.AddRow("060372074001000", {40.0, std::nullopt});
		pl.Finalize();

		acs.AddRow("06037207301", {65000.0});
		acs.AddRow("06037207400", {std::nullopt});
		acs.Finalize();
	}

	std::vector<CensusValue> Join(GeoLevel level, const std::vector<std::string> &variables,
	                              const std::string &block = "060372073011001") {
		return JoinCensusVariables(&pl, &acs, "06", block, level, variables);
	}

	CensusVariableTable pl {{"P1_001N", "h1_001n"}};
	CensusVariableTable acs {{"B19013_001E"}};
};

TEST_F(CensusJoinerTest, ClassifyVariable) {
	EXPECT_EQ(ClassifyVariable("P1_001N"), VariableFamily::PL94171);
	EXPECT_EQ(ClassifyVariable("h1_002n"), VariableFamily::PL94171);
	EXPECT_EQ(ClassifyVariable("P12_003N"), VariableFamily::PL94171);
	EXPECT_EQ(ClassifyVariable("B19013_001E"), VariableFamily::ACS);
	EXPECT_EQ(ClassifyVariable("C17002_002M"), VariableFamily::ACS);
	EXPECT_EQ(ClassifyVariable("B01001A_001E"), VariableFamily::ACS);
	EXPECT_EQ(ClassifyVariable("NAME"), VariableFamily::UNKNOWN);
	EXPECT_EQ(ClassifyVariable("P1_01N"), VariableFamily::UNKNOWN);
	EXPECT_STREQ(VariableFamilyName(VariableFamily::ACS), "acs5");
}

TEST_F(CensusJoinerTest, BlockLevelLookup) {
	auto values = Join(GeoLevel::BLOCK, {"P1_001N", "H1_001N"});
	ASSERT_EQ(values.size(), 2u);
	EXPECT_EQ(values[0].code, "P1_001N");
	ASSERT_TRUE(values[0].value);
	EXPECT_DOUBLE_EQ(*values[0].value, 120);
	ASSERT_TRUE(values[1].value);
	EXPECT_DOUBLE_EQ(*values[1].value, 50);
}

TEST_F(CensusJoinerTest, PlSumsOverCoarserLevels) {
	auto values = Join(GeoLevel::BLOCK_GROUP, {"P1_001N"});
	ASSERT_TRUE(values[0].value);
	EXPECT_DOUBLE_EQ(*values[0].value, 200);

	values = Join(GeoLevel::TRACT, {"P1_001N", "H1_001N"});
	ASSERT_TRUE(values[0].value);
	EXPECT_DOUBLE_EQ(*values[0].value, 210);
	// the null H1 on block group 2 is skipped, not treated as zero or poison
	ASSERT_TRUE(values[1].value);
	EXPECT_DOUBLE_EQ(*values[1].value, 80);

	values = Join(GeoLevel::COUNTY, {"P1_001N"});
	ASSERT_TRUE(values[0].value);
	EXPECT_DOUBLE_EQ(*values[0].value, 250);
}

TEST_F(CensusJoinerTest, RepeatedAggregateIsStable) {
	auto first = Join(GeoLevel::TRACT, {"P1_001N", "H1_001N"});
	auto second = Join(GeoLevel::TRACT, {"P1_001N", "H1_001N"});
	ASSERT_EQ(first.size(), second.size());
	for (size_t i = 0; i < first.size(); i++) {
		ASSERT_TRUE(first[i].value && second[i].value) << first[i].code;
		EXPECT_DOUBLE_EQ(*first[i].value, *second[i].value) << first[i].code;
	}
	EXPECT_DOUBLE_EQ(*second[0].value, 210);

	// two blocks of the same tract aggregate to the same tract value
	auto sibling = Join(GeoLevel::TRACT, {"P1_001N"}, "060372073012000");
	ASSERT_TRUE(sibling[0].value);
	EXPECT_DOUBLE_EQ(*sibling[0].value, 210);
}

TEST_F(CensusJoinerTest, AllNullSumIsNull) {
	auto values = Join(GeoLevel::TRACT, {"H1_001N"}, "060372074001000");
	ASSERT_EQ(values.size(), 1u);
	EXPECT_FALSE(values[0].value);
}

TEST_F(CensusJoinerTest, AcsComesFromTractAtEveryLevel) {
	const GeoLevel levels[] = {GeoLevel::BLOCK, GeoLevel::BLOCK_GROUP, GeoLevel::TRACT};
	for (auto level : levels) {
		auto values = Join(level, {"B19013_001E"});
		ASSERT_TRUE(values[0].value) << GeoLevelName(level);
		EXPECT_DOUBLE_EQ(*values[0].value, 65000) << GeoLevelName(level);
	}
	auto values = Join(GeoLevel::BLOCK, {"B19013_001E"}, "060372074001000");
	EXPECT_FALSE(values[0].value);
}

TEST_F(CensusJoinerTest, RequestOrderAndDuplicates) {
	auto values = Join(GeoLevel::BLOCK, {"b19013_001e", "P1_001N", "B19013_001E", "P1_999N"});
	ASSERT_EQ(values.size(), 3u);
	EXPECT_EQ(values[0].code, "B19013_001E");
	EXPECT_EQ(values[1].code, "P1_001N");
	EXPECT_EQ(values[2].code, "P1_999N");
	EXPECT_FALSE(values[2].value);
}

TEST_F(CensusJoinerTest, UnknownCodeReadsWhicheverTableHasIt) {
	CensusVariableTable custom {{"POP_DENSITY"}};
	custom.AddRow("06037207301", {1234.5});
	custom.Finalize();
	auto values = JoinCensusVariables(&pl, &custom, "06", "060372073011001", GeoLevel::BLOCK, {"pop_density", "XYZ"});
	ASSERT_EQ(values.size(), 2u);
	ASSERT_TRUE(values[0].value);
	EXPECT_DOUBLE_EQ(*values[0].value, 1234.5);
	EXPECT_FALSE(values[1].value);
}

TEST_F(CensusJoinerTest, MissingTableForRequestedFamilyThrows) {
	EXPECT_THROW(JoinCensusVariables(nullptr, &acs, "06", "060372073011001", GeoLevel::BLOCK, {"P1_001N"}),
	             DatasetUnavailableException);
	try {
		JoinCensusVariables(&pl, nullptr, "06", "060372073011001", GeoLevel::BLOCK, {"B19013_001E"});
		FAIL() << "expected DatasetUnavailableException";
	} catch (const DatasetUnavailableException &ex) {
		EXPECT_EQ(ex.StateFips(), "06");
		EXPECT_EQ(ex.Kind(), DatasetKind::ACS5);
	}
	try {
		JoinCensusVariables(nullptr, &acs, "06", "060372073011001", GeoLevel::BLOCK, {"P1_001N"},
		                    "pl94171/06.csv not found");
		FAIL() << "expected DatasetUnavailableException";
	} catch (const DatasetUnavailableException &ex) {
		const auto message = duckdb::ErrorData(ex).RawMessage();
		EXPECT_NE(message.find("P1_001N"), std::string::npos);
		EXPECT_NE(message.find("pl94171/06.csv not found"), std::string::npos);
	}
	// a missing table is fine when nothing asks for it
	auto values = JoinCensusVariables(&pl, nullptr, "06", "060372073011001", GeoLevel::BLOCK, {"P1_001N"});
	ASSERT_TRUE(values[0].value);
}

TEST_F(CensusJoinerTest, NullCensusValues) {
	auto values = NullCensusValues({"p1_001n", " B19013_001E ", "P1_001N", ""});
	ASSERT_EQ(values.size(), 2u);
	EXPECT_EQ(values[0].code, "P1_001N");
	EXPECT_EQ(values[1].code, "B19013_001E");
	EXPECT_FALSE(values[0].value);
	EXPECT_FALSE(values[1].value);
}

TEST(CensusVariableTableTest, FirstDuplicateWins) {
	CensusVariableTable table {{"P1_001N"}};
	table.AddRow("060372073011001", {1.0});
	table.AddRow("060372073011001", {2.0});
	table.Finalize();
	EXPECT_EQ(table.RowCount(), 1u);
	ASSERT_TRUE(table.Lookup("060372073011001", "p1_001n"));
	EXPECT_DOUBLE_EQ(*table.Lookup("060372073011001", "P1_001N"), 1.0);
	EXPECT_FALSE(table.Lookup("060372073011009", "P1_001N"));
	EXPECT_FALSE(table.Lookup("060372073011001", "P2_001N"));
	EXPECT_TRUE(table.HasColumn("p1_001n"));
}
