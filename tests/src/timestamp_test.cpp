/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <chrono>
#include <gtest/gtest.h>

#include <malformedresponseexception.hpp>
#include <timestamp.hpp>

using std::chrono::milliseconds;

using namespace au;

TEST(Timestamp, ParsesUtc)
{
	EXPECT_EQ(parseRfc3339("2022-02-19T16:30:44Z"), makeUtcTimestamp(2022, 2, 19, 16, 30, 44));
	EXPECT_EQ(parseRfc3339("2022-02-19 16:30:44z"), makeUtcTimestamp(2022, 2, 19, 16, 30, 44));
}

TEST(Timestamp, ParsesOffsets)
{
	EXPECT_EQ(parseRfc3339("2022-02-19T18:30:44+02:00"), makeUtcTimestamp(2022, 2, 19, 16, 30, 44));
	EXPECT_EQ(parseRfc3339("2022-02-19T11:30:44-05:00"), makeUtcTimestamp(2022, 2, 19, 16, 30, 44));
	EXPECT_EQ(parseRfc3339("2022-02-20T00:30:44+08:00"), makeUtcTimestamp(2022, 2, 19, 16, 30, 44));
}

TEST(Timestamp, ParsesFractions)
{
	EXPECT_EQ(parseRfc3339("2022-02-19T16:30:44.25Z"), makeUtcTimestamp(2022, 2, 19, 16, 30, 44) + milliseconds(250));
}

TEST(Timestamp, Formats)
{
	EXPECT_EQ(formatRfc3339(makeUtcTimestamp(2022, 2, 19, 16, 30, 44)), "2022-02-19T16:30:44Z");
	EXPECT_EQ(formatRfc3339(makeUtcTimestamp(2022, 2, 19, 16, 30, 44) + milliseconds(250)), "2022-02-19T16:30:44.25Z");
	EXPECT_EQ(formatRfc3339(parseRfc3339("2022-02-19T18:30:44+02:00")), "2022-02-19T16:30:44Z");
}

TEST(Timestamp, RejectsInvalidInput)
{
	EXPECT_THROW(parseRfc3339(""), MalformedResponseException);
	EXPECT_THROW(parseRfc3339("yesterday"), MalformedResponseException);
	EXPECT_THROW(parseRfc3339("2022-02-19"), MalformedResponseException);
	EXPECT_THROW(parseRfc3339("2022-02-19T16:30:44"), MalformedResponseException);
	EXPECT_THROW(parseRfc3339("2022-13-19T16:30:44Z"), MalformedResponseException);
	EXPECT_THROW(parseRfc3339("2022-02-19T16:30:44.Z"), MalformedResponseException);
	EXPECT_THROW(parseRfc3339("2022-02-19T16:30:44Z trailing"), MalformedResponseException);
}
