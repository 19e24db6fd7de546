/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <gtest/gtest.h>
#include <json/json.h>
#include <string>
#include <vector>

#include <colorweight.hpp>
#include <jsonutils.hpp>
#include <malformedpairexception.hpp>

using std::string;

using namespace au;

static ColorWeight decode(const string &str)
{
	Json::Value v;
	parseJson(str, v);
	return ColorWeight(v);
}

TEST(ColorWeight, DecodesIntegerWeight)
{
	EXPECT_EQ(decode("[\"#E4E4A8\",71]"), ColorWeight("#E4E4A8", 71.0));
}

TEST(ColorWeight, DecodesFractionalWeight)
{
	EXPECT_EQ(decode("[\"#2F2F2F\",8.7]"), ColorWeight("#2F2F2F", 8.7));
	EXPECT_EQ(decode("[\"brown\", 7.4]"), ColorWeight("brown", 7.4));
}

TEST(ColorWeight, EncodesWithoutFractionForWholeWeights)
{
	EXPECT_EQ(writeJson(ColorWeight("#E4E4A8", 71.0).toJson()), "[\"#E4E4A8\",71]");
}

TEST(ColorWeight, EncodesShortestDecimal)
{
	EXPECT_EQ(writeJson(ColorWeight("#2F2F2F", 8.7).toJson()), "[\"#2F2F2F\",8.7]");
	EXPECT_EQ(writeJson(ColorWeight("brown", 7.4).toJson()), "[\"brown\",7.4]");
	EXPECT_EQ(writeJson(ColorWeight("grey", 0.1).toJson()), "[\"grey\",0.1]");
}

TEST(ColorWeight, EncodesEveryWeightWithItsOwnPrecision)
{
	const std::vector<ColorWeight> colors { ColorWeight("#2F2F2F", 8.7), ColorWeight("#ABCDEF", 100.0/3) };

	EXPECT_EQ(writeJson(toJson(colors)), "[[\"#2F2F2F\",8.7],[\"#ABCDEF\",33.333333333333336]]");
}

TEST(ColorWeight, ReencodesToTheSameText)
{
	for(const string &json : { "[\"#E4E4A8\",71]", "[\"#2F2F2F\",8.7]", "[\"brown\",7.4]" })
		EXPECT_EQ(writeJson(decode(json).toJson()), json);
}

TEST(ColorWeight, RejectsWrongArity)
{
	EXPECT_THROW(decode("[\"onlyOneField\"]"), MalformedPairException);
	EXPECT_THROW(decode("[]"), MalformedPairException);
	EXPECT_THROW(decode("[\"#E4E4A8\",71,1]"), MalformedPairException);
}

TEST(ColorWeight, RejectsSwappedTypes)
{
	EXPECT_THROW(decode("[71,\"#E4E4A8\"]"), MalformedPairException);
	EXPECT_THROW(decode("[\"#E4E4A8\",\"71\"]"), MalformedPairException);
	EXPECT_THROW(decode("[\"#E4E4A8\",true]"), MalformedPairException);
}

TEST(ColorWeight, RejectsNonArrays)
{
	EXPECT_THROW(decode("{\"color\":\"#E4E4A8\",\"weight\":71}"), MalformedPairException);
	EXPECT_THROW(decode("\"#E4E4A8\""), MalformedPairException);
}

TEST(ColorWeight, MalformedPairIsAMalformedResponse)
{
	EXPECT_THROW(decode("[\"onlyOneField\"]"), MalformedResponseException);
}

TEST(ColorWeights, DecodesListsAndReportsTheBrokenEntry)
{
	Json::Value v;
	parseJson("[[\"yellow\",71],[\"black\",8.7]]", v);
	EXPECT_EQ(decodeColorWeights(v, "colors"), ColorWeights({ ColorWeight("yellow", 71), ColorWeight("black", 8.7) }));

	parseJson("[[\"yellow\",71],[8.7]]", v);
	try {
		decodeColorWeights(v, "colors");
		FAIL()<<"Expected a MalformedPairException";
	} catch(const MalformedPairException &e) {
		EXPECT_NE(string(e.what()).find("entry 1"), string::npos)<<e.what();
	}
}

TEST(ColorWeights, NullIsEmpty)
{
	EXPECT_TRUE(decodeColorWeights(Json::Value(), "colors").empty());
	EXPECT_TRUE(decodePredominantColors(Json::Value(), "predominant").empty());
}

TEST(PredominantColors, DecodesEveryProvider)
{
	Json::Value v;
	parseJson("{\"google\":[[\"yellow\",71]],\"cloudinary\":[[\"brown\",7.8]]}", v);

	const PredominantColors predominant = decodePredominantColors(v, "predominant");

	ASSERT_EQ(predominant.size(), 2u);
	EXPECT_EQ(predominant.at("google"), ColorWeights({ ColorWeight("yellow", 71) }));
	EXPECT_EQ(predominant.at("cloudinary"), ColorWeights({ ColorWeight("brown", 7.8) }));
}

TEST(PredominantColors, RejectsNonObjects)
{
	Json::Value v;
	parseJson("[[\"yellow\",71]]", v);
	EXPECT_THROW(decodePredominantColors(v, "predominant"), MalformedResponseException);
}
