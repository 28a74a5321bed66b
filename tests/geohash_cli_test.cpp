#include "command_registry.hpp"
#include "geohash_cli.hpp"
#include "geohash_errors.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

class GeohashCliTest : public ::testing::Test {
protected:
	void SetUp() override {
		registerGeohashCommands(registry);
	}

	std::string run(const std::string& verb,
					std::vector<std::string> args,
					OutputFormat format = OutputFormat::Text,
					double radiusKm		= 0.0) {
		CommandRequest request;
		request.args	 = std::move(args);
		request.format	 = format;
		request.radiusKm = radiusKm;
		return registry.dispatch(verb, request);
	}

	CommandRegistry registry;
};

TEST_F(GeohashCliTest, RegistersAllVerbs) {
	for (const char* verb : {"encode", "decode", "bbox", "distance", "length"}) {
		EXPECT_TRUE(registry.contains(verb)) << verb;
	}
	EXPECT_FALSE(registry.contains("neighbors"));

	std::string usage = registry.usage();
	EXPECT_NE(usage.find("encode"), std::string::npos);
	EXPECT_NE(usage.find("decode"), std::string::npos);
}

TEST_F(GeohashCliTest, UnknownVerbThrows) {
	EXPECT_THROW(run("neighbors", {"w7er87fpgd52"}), std::invalid_argument);
}

TEST_F(GeohashCliTest, EncodeAndDecodeText) {
	EXPECT_EQ(run("encode", {"21.0278, 105.8342"}), "w7er87fpgd52");
	EXPECT_EQ(run("decode", {"w7er87fpgd52"}), "21.0278, 105.8342");
}

TEST_F(GeohashCliTest, EncodeJson) {
	auto j = nlohmann::json::parse(run("encode", {"21.0278, 105.8342"}, OutputFormat::Json));
	EXPECT_EQ(j["geohash"].get<std::string>(), "w7er87fpgd52");
	EXPECT_DOUBLE_EQ(j["coordinate"]["latitude"].get<double>(), 21.0278);
	EXPECT_DOUBLE_EQ(j["coordinate"]["longitude"].get<double>(), 105.8342);
}

TEST_F(GeohashCliTest, DecodeJson) {
	auto j = nlohmann::json::parse(run("decode", {"w7er87fpgd52"}, OutputFormat::Json));
	EXPECT_EQ(j["geohash"].get<std::string>(), "w7er87fpgd52");
	EXPECT_NEAR(j["coordinate"]["latitude"].get<double>(), 21.0278, 0.00005);
	EXPECT_NEAR(j["coordinate"]["longitude"].get<double>(), 105.8342, 0.00005);
}

TEST_F(GeohashCliTest, ErrorsPropagateFromCore) {
	EXPECT_THROW(run("encode", {"abc"}), FormatError);
	EXPECT_THROW(run("encode", {"91.0, 0.0"}), RangeError);
	EXPECT_THROW(run("decode", {"w7er87fpgd5a"}), InvalidCharacterError);
	EXPECT_THROW(run("encode", {}), FormatError);
	EXPECT_THROW(run("distance", {"1, 2"}), FormatError);
	EXPECT_THROW(run("length", {"ten"}), ParseError);
}

TEST_F(GeohashCliTest, BoundingBoxText) {
	EXPECT_EQ(run("bbox", {"0, 0"}, OutputFormat::Text, 111.1), "-1.000000, 1.000000, -0.998024, 0.998024");
}

TEST_F(GeohashCliTest, BoundingBoxJson) {
	auto j = nlohmann::json::parse(run("bbox", {"60, 10"}, OutputFormat::Json, 10.0));
	EXPECT_DOUBLE_EQ(j["radiusKm"].get<double>(), 10.0);
	EXPECT_NEAR(j["boundingBox"]["maxLat"].get<double>(), 60.0900090009, 1e-9);
	EXPECT_NEAR(j["boundingBox"]["minLng"].get<double>(), 9.8203377650, 1e-9);
}

TEST_F(GeohashCliTest, DistanceText) {
	EXPECT_EQ(run("distance", {"51.5074, -0.1278", "48.8566, 2.3522"}), "343.556");
}

TEST_F(GeohashCliTest, LengthFromArgumentOrRadius) {
	EXPECT_EQ(run("length", {"0"}), "12");
	EXPECT_EQ(run("length", {"10"}), "2");
	EXPECT_EQ(run("length", {}, OutputFormat::Text, 1.0), "3");

	auto j = nlohmann::json::parse(run("length", {"0.001"}, OutputFormat::Json));
	EXPECT_EQ(j["length"].get<int>(), 5);
}

TEST_F(GeohashCliTest, ReadLastLineSkipsBlankLines) {
	std::istringstream in("first line\n  21.0278, 105.8342  \n\n   \n");
	EXPECT_EQ(readLastLine(in), "21.0278, 105.8342");

	std::istringstream empty("");
	EXPECT_EQ(readLastLine(empty), "");
}

TEST_F(GeohashCliTest, LaterRegistrationReplacesVerb) {
	registry.add("encode", "stub", [](const CommandRequest&) { return std::string("replaced"); });
	EXPECT_EQ(run("encode", {"0, 0"}), "replaced");
}
