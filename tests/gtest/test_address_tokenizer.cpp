// =============================================================================
// RuleBasedTokenizer
// =============================================================================

#include <gtest/gtest.h>

#include "address/address_token.hpp"

using namespace census_geocode;

class AddressTokenizerTest : public ::testing::Test {
protected:
	ParseStatus Parse(const std::string &text) {
		return tokenizer.Tokenize(text, token);
	}

	RuleBasedTokenizer tokenizer;
	AddressToken token;
};

TEST_F(AddressTokenizerTest, CommaSeparatedAddress) {
	ASSERT_EQ(Parse("123 Main St, Los Angeles, CA 90012"), ParseStatus::OK);
	EXPECT_EQ(token.house_number, "123");
	EXPECT_EQ(token.street_name, "MAIN");
	EXPECT_EQ(token.street_type, "ST");
	EXPECT_EQ(token.city, "LOS ANGELES");
	EXPECT_EQ(token.state, "CA");
	EXPECT_EQ(token.zip, "90012");
	EXPECT_TRUE(token.predirectional.empty());
	EXPECT_TRUE(token.HasStreetInfo());
}

TEST_F(AddressTokenizerTest, FreeTextWithUnitAndDirectional) {
	ASSERT_EQ(Parse("123 N Main St Apt 4 Los Angeles CA 90012-1234"), ParseStatus::OK);
	EXPECT_EQ(token.house_number, "123");
	EXPECT_EQ(token.predirectional, "N");
	EXPECT_EQ(token.street_name, "MAIN");
	EXPECT_EQ(token.street_type, "ST");
	EXPECT_EQ(token.occupancy, "APT 4");
	EXPECT_EQ(token.city, "LOS ANGELES");
	EXPECT_EQ(token.state, "CA");
	EXPECT_EQ(token.zip, "90012");
	EXPECT_EQ(token.FullStreetName(), "N MAIN ST");
}

TEST_F(AddressTokenizerTest, TrailingDirectionalIsNotAState) {
	ASSERT_EQ(Parse("123 Main St NE"), ParseStatus::OK);
	EXPECT_EQ(token.postdirectional, "NE");
	EXPECT_EQ(token.street_type, "ST");
	EXPECT_TRUE(token.state.empty());
}

TEST_F(AddressTokenizerTest, FullStateName) {
	ASSERT_EQ(Parse("350 5th Ave, New York, New York 10118"), ParseStatus::OK);
	EXPECT_EQ(token.state, "NY");
	EXPECT_EQ(token.city, "NEW YORK");
	EXPECT_EQ(token.street_name, "5TH");
	EXPECT_EQ(token.street_type, "AVE");
}

TEST_F(AddressTokenizerTest, OccupancyAsOwnPart) {
	ASSERT_EQ(Parse("123 Main St, Apt 4, Los Angeles, CA 90012"), ParseStatus::OK);
	EXPECT_EQ(token.occupancy, "APT 4");
	EXPECT_EQ(token.city, "LOS ANGELES");
	EXPECT_EQ(token.street_name, "MAIN");
}

TEST_F(AddressTokenizerTest, HashUnit) {
	ASSERT_EQ(Parse("500 Elm Ave #12, Austin, TX 78701"), ParseStatus::OK);
	EXPECT_EQ(token.street_name, "ELM");
	EXPECT_EQ(token.street_type, "AVE");
	EXPECT_EQ(token.occupancy, "# 12");
	EXPECT_EQ(token.state, "TX");
}

TEST_F(AddressTokenizerTest, DiacriticsAreFolded) {
	ASSERT_EQ(Parse("8500 Peña Blvd, Denver, CO 80249"), ParseStatus::OK);
	EXPECT_EQ(token.street_name, "PENA");
	EXPECT_EQ(token.street_type, "BLVD");
	EXPECT_EQ(token.state, "CO");
}

TEST_F(AddressTokenizerTest, MissingHouseNumberIsNotAnError) {
	ASSERT_EQ(Parse("Main St, Los Angeles, CA"), ParseStatus::OK);
	EXPECT_TRUE(token.house_number.empty());
	EXPECT_EQ(token.street_name, "MAIN");
	EXPECT_FALSE(token.HasStreetInfo());
}

TEST_F(AddressTokenizerTest, EmptyInput) {
	EXPECT_EQ(Parse(""), ParseStatus::EMPTY);
	EXPECT_EQ(Parse("  , ;  "), ParseStatus::EMPTY);
}

TEST_F(AddressTokenizerTest, ConflictingZipsAreAmbiguous) {
	EXPECT_EQ(Parse("123 Main St, Los Angeles, CA 90012 90013"), ParseStatus::AMBIGUOUS);
	// the same ZIP twice is harmless
	EXPECT_EQ(Parse("123 Main St, Los Angeles, CA 90012 90012"), ParseStatus::OK);
	EXPECT_EQ(token.zip, "90012");
}

TEST_F(AddressTokenizerTest, ConflictingStatesAreAmbiguous) {
	EXPECT_EQ(Parse("123 Main St, Springfield, CA, NY"), ParseStatus::AMBIGUOUS);
}

TEST_F(AddressTokenizerTest, IntersectionsAreAmbiguous) {
	EXPECT_EQ(Parse("Main St & 1st Ave, Los Angeles, CA"), ParseStatus::AMBIGUOUS);
	EXPECT_EQ(Parse("Main St and 1st Ave, Los Angeles, CA"), ParseStatus::AMBIGUOUS);
}

TEST_F(AddressTokenizerTest, FailedParseLeavesEmptyToken) {
	ASSERT_EQ(Parse("123 Main St, Los Angeles, CA 90012"), ParseStatus::OK);
	ASSERT_EQ(Parse("Main St & 1st Ave, Los Angeles, CA"), ParseStatus::AMBIGUOUS);
	EXPECT_TRUE(token.street_name.empty());
	EXPECT_TRUE(token.zip.empty());
}

TEST(ParseStatusTest, Names) {
	EXPECT_STREQ(ParseStatusName(ParseStatus::OK), "ok");
	EXPECT_STREQ(ParseStatusName(ParseStatus::EMPTY), "empty");
	EXPECT_STREQ(ParseStatusName(ParseStatus::AMBIGUOUS), "ambiguous");
}
