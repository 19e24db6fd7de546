/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <gtest/gtest.h>

#include <uploadparams.hpp>

using namespace au;

TEST(UploadParams, DefaultsSendNothing)
{
	EXPECT_TRUE(UploadParams().toParams().empty());
	EXPECT_EQ(UploadParams().resourceType, "auto");
}

TEST(UploadParams, SerialisesSetFields)
{
	UploadParams params;
	params.publicId = "testimage";
	params.folder = "samples";
	params.overwrite = Toggle::on;
	params.uniqueFilename = Toggle::off;
	params.type = "authenticated";
	params.tags = { "one", "two" };
	params.colors = true;
	params.qualityAnalysis = true;
	params.eager = "c_fill,w_200";
	params.notificationUrl = "https://example.com/hook";

	const Params fields = params.toParams();

	EXPECT_EQ(fields.at("public_id"), "testimage");
	EXPECT_EQ(fields.at("folder"), "samples");
	EXPECT_EQ(fields.at("overwrite"), "true");
	EXPECT_EQ(fields.at("unique_filename"), "false");
	EXPECT_EQ(fields.at("type"), "authenticated");
	EXPECT_EQ(fields.at("tags"), "one,two");
	EXPECT_EQ(fields.at("colors"), "true");
	EXPECT_EQ(fields.at("quality_analysis"), "true");
	EXPECT_EQ(fields.at("eager"), "c_fill,w_200");
	EXPECT_EQ(fields.at("notification_url"), "https://example.com/hook");

	EXPECT_EQ(fields.count("phash"), 0u);
	EXPECT_EQ(fields.count("resource_type"), 0u);
}

TEST(UploadParams, EncodesContext)
{
	UploadParams params;
	params.context["alt"] = "A photo";
	params.context["caption"] = "a=b|c";

	EXPECT_EQ(params.toParams().at("context"), "alt=A photo|caption=a\\=b\\|c");
}

TEST(UploadParams, EncodesResponsiveBreakpoints)
{
	UploadParams params;
	params.responsiveBreakpoints.push_back(BreakpointsRequest("a_90"));

	BreakpointsRequest limited("", true);
	limited.maxWidth = 1000;
	limited.maxImages = 5;
	params.responsiveBreakpoints.push_back(limited);

	EXPECT_EQ(params.toParams().at("responsive_breakpoints"),
		"[{\"create_derived\":false,\"transformation\":\"a_90\"},"
		"{\"create_derived\":true,\"max_images\":5,\"max_width\":1000}]");
}
