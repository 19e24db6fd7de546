/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <gtest/gtest.h>
#include <vector>

#include <chunkplanner.hpp>
#include <uploadexception.hpp>

using std::vector;

using namespace au;

/**
  * Checks that the ranges are contiguous, ascending and
  * cover exactly [0, size)
 **/
static void expectCoverage(unsigned long long size, unsigned long long chunkSize)
{
	const ChunkPlanner planner(size, chunkSize);
	const vector<ChunkRange> ranges = planner.ranges();

	ASSERT_FALSE(ranges.empty());
	EXPECT_EQ(ranges.size(), planner.count());

	unsigned long long expectedOffset = 0;
	for(const ChunkRange &range : ranges)
	{
		EXPECT_EQ(range.offset, expectedOffset);
		EXPECT_LE(range.length, chunkSize);
		if(size != 0)EXPECT_GT(range.length, 0u);
		expectedOffset = range.end();
	}

	EXPECT_EQ(expectedOffset, size);
}

TEST(ChunkPlanner, CoversAllSizes)
{
	for(unsigned long long size = 0; size <= 50; ++size)
		for(unsigned long long chunkSize = 1; chunkSize <= 12; ++chunkSize)
			expectCoverage(size, chunkSize);
}

TEST(ChunkPlanner, LargeImageIsSplitIntoTwoChunks)
{
	const ChunkPlanner planner(5880138, 5243000);

	ASSERT_EQ(planner.count(), 2u);
	EXPECT_EQ(planner.range(0), ChunkRange(0, 5243000));
	EXPECT_EQ(planner.range(1), ChunkRange(5243000, 637138));
	EXPECT_EQ(planner.range(1).contentRange(5880138), "bytes 5243000-5880137/5880138");
}

TEST(ChunkPlanner, EmptySourceIsOneEmptyRange)
{
	const ChunkPlanner planner(0, 20000000);

	EXPECT_TRUE(planner.isSingleRange());
	EXPECT_EQ(planner.range(0), ChunkRange(0, 0));
}

TEST(ChunkPlanner, SourceNotLargerThanChunkIsOneRange)
{
	EXPECT_TRUE(ChunkPlanner(1, 10).isSingleRange());
	EXPECT_TRUE(ChunkPlanner(10, 10).isSingleRange());
	EXPECT_FALSE(ChunkPlanner(11, 10).isSingleRange());

	EXPECT_EQ(ChunkPlanner(10, 10).range(0), ChunkRange(0, 10));
}

TEST(ChunkPlanner, ExactMultipleHasNoEmptyTail)
{
	const ChunkPlanner planner(30, 10);

	ASSERT_EQ(planner.count(), 3u);
	EXPECT_EQ(planner.range(2), ChunkRange(20, 10));
}

TEST(ChunkPlanner, IsRestartable)
{
	const ChunkPlanner planner(25, 7);

	EXPECT_EQ(planner.ranges(), planner.ranges());

	vector<ChunkRange> iterated;
	for(const ChunkRange &range : planner)
		iterated.push_back(range);

	EXPECT_EQ(iterated, planner.ranges());
}

TEST(ChunkPlanner, RejectsZeroChunkSize)
{
	EXPECT_THROW(ChunkPlanner(10, 0), UploadException);
}

TEST(ChunkPlanner, RejectsIndexOutOfRange)
{
	const ChunkPlanner planner(10, 4);
	EXPECT_THROW(planner.range(3), UploadException);
}
