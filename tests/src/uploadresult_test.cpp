/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include <fixtures.hpp>
#include <jsonutils.hpp>
#include <malformedpairexception.hpp>
#include <uploadresult.hpp>

using std::string;

using namespace au;

TEST(UploadResult, DecodesCompleteImageResponse)
{
	const UploadResult result = decodeUploadResult(fixtures::imageUploadResponse);

	EXPECT_EQ(result, fixtures::imageUploadResult());
}

TEST(UploadResult, DecodesIndividualFields)
{
	const UploadResult result = decodeUploadResult(fixtures::imageUploadResponse);

	EXPECT_EQ(result.publicId, "testimage");
	EXPECT_EQ(result.version, 1645288244);
	EXPECT_EQ(result.width, 600);
	EXPECT_EQ(result.height, 600);
	EXPECT_EQ(result.bytes, 31543u);
	EXPECT_EQ(formatRfc3339(result.createdAt), "2022-02-19T16:30:44Z");
	ASSERT_EQ(result.colors.size(), 4u);
	EXPECT_EQ(result.colors[1], ColorWeight("#2F2F2F", 8.7));
	ASSERT_EQ(result.predominant.count("google"), 1u);
	EXPECT_EQ(result.predominant.at("google")[0], ColorWeight("yellow", 71));
}

TEST(UploadResult, IgnoresUnknownFields)
{
	const UploadResult result = decodeUploadResult("{\"public_id\":\"a\",\"api_key\":\"1234\",\"moderation\":[{\"kind\":\"manual\"}]}");

	EXPECT_EQ(result.publicId, "a");
}

TEST(UploadResult, AbsentAndNullFieldsHaveZeroValues)
{
	const UploadResult result = decodeUploadResult("{\"public_id\":\"a\",\"width\":null,\"colors\":null}");

	UploadResult expected;
	expected.publicId = "a";
	EXPECT_EQ(result, expected);
	EXPECT_EQ(result.createdAt, Timestamp());
	EXPECT_TRUE(result.colors.empty());
	EXPECT_FALSE(result.placeholder);
}

TEST(UploadResult, RequiresPublicId)
{
	EXPECT_THROW(decodeUploadResult("{\"asset_id\":\"c3f435bff0410515f8fdadb2a5037881\"}"), MalformedResponseException);
}

TEST(UploadResult, RejectsFieldsOfTheWrongType)
{
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"width\":\"600\"}"), MalformedResponseException);
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"bytes\":-1}"), MalformedResponseException);
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"tags\":\"one,two\"}"), MalformedResponseException);
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"context\":[]}"), MalformedResponseException);
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"created_at\":\"yesterday\"}"), MalformedResponseException);
}

TEST(UploadResult, RejectsInvalidJson)
{
	EXPECT_THROW(decodeUploadResult("{\"public_id\":"), MalformedResponseException);
	EXPECT_THROW(decodeUploadResult("[\"public_id\"]"), MalformedResponseException);
}

TEST(UploadResult, MalformedColorsAreMalformedPairs)
{
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"colors\":[[\"onlyOneField\"]]}"), MalformedPairException);
	EXPECT_THROW(decodeUploadResult("{\"public_id\":\"a\",\"predominant\":{\"google\":[[71,\"#E4E4A8\"]]}}"), MalformedPairException);
}

TEST(UploadResult, DecodesExtras)
{
	const UploadResult result = decodeUploadResult(
		"{\"public_id\":\"a\",\"tags\":[\"one\",\"two\"],\"placeholder\":true,"
		"\"access_mode\":\"public\",\"type\":\"authenticated\","
		"\"context\":{\"custom\":{\"alt\":\"A photo\"}},"
		"\"responsive_breakpoints\":[{\"transformation\":\"a_90\",\"breakpoints\":"
		"[{\"width\":600,\"height\":600,\"bytes\":31543,\"url\":\"http://foo.com/a.png\",\"secure_url\":\"https://foo.com/a.png\"}]}],"
		"\"error\":{\"message\":\"Partial failure\"}}");

	EXPECT_EQ(result.tags, std::vector<string>({ "one", "two" }));
	EXPECT_TRUE(result.placeholder);
	EXPECT_EQ(result.accessMode, "public");
	EXPECT_EQ(result.type, "authenticated");
	ASSERT_EQ(result.context.count("custom"), 1u);
	EXPECT_EQ(result.context.at("custom")["alt"].asString(), "A photo");
	ASSERT_EQ(result.responsiveBreakpoints.size(), 1u);
	EXPECT_EQ(result.responsiveBreakpoints[0].transformation, "a_90");
	ASSERT_EQ(result.responsiveBreakpoints[0].breakpoints.size(), 1u);
	EXPECT_EQ(result.responsiveBreakpoints[0].breakpoints[0].width, 600);
	EXPECT_EQ(result.errorMessage, "Partial failure");
}

TEST(UploadResult, EncodedResultDecodesToTheSameValue)
{
	const UploadResult result = fixtures::imageUploadResult();

	EXPECT_EQ(decodeUploadResult(writeJson(result.toJson())), result);
}

TEST(UploadResult, EncodesColorsCompactly)
{
	const string json = writeJson(fixtures::imageUploadResult().toJson());

	EXPECT_NE(json.find("[\"#E4E4A8\",71]"), string::npos)<<json;
	EXPECT_NE(json.find("[\"#2F2F2F\",8.7]"), string::npos)<<json;
}

TEST(UploadResult, PreciseContextValueKeepsColorsShort)
{
	const UploadResult result = decodeUploadResult(
		"{\"public_id\":\"x\",\"colors\":[[\"#2F2F2F\",8.7]],"
		"\"context\":{\"custom\":{\"score\":0.30000000000000004}}}");

	const string json = writeJson(result.toJson());
	EXPECT_NE(json.find("[\"#2F2F2F\",8.7]"), string::npos)<<json;
	EXPECT_NE(json.find("0.30000000000000004"), string::npos)<<json;
}

TEST(UploadResult, PrintsAsJson)
{
	std::stringstream ss;
	ss<<fixtures::imageUploadResult();

	Json::Value root;
	parseJson(ss.str(), root);
	EXPECT_EQ(root["public_id"].asString(), "testimage");
}
