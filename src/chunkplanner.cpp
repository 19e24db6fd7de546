/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <algorithm>

#include <chunkplanner.hpp>
#include <uploadexception.hpp>

using std::min;
using std::vector;

using namespace au;

ChunkPlanner::ChunkPlanner(unsigned long long ull_sourceSize, unsigned long long ull_chunkSize) :
	sourceSize(ull_sourceSize),
	chunkSize(ull_chunkSize)
{
	if(chunkSize == 0)throw UploadException("Chunk size must be greater than 0");
}

unsigned long long ChunkPlanner::count() const
{
	if(sourceSize == 0)return 1;
	return (sourceSize / chunkSize) + (sourceSize % chunkSize == 0 ? 0 : 1);
}

ChunkRange ChunkPlanner::range(unsigned long long index) const
{
	if(index >= count())throw UploadException("Chunk index ", index, " is out of range (", count(), " chunks)");

	const unsigned long long offset = index * chunkSize;
	return ChunkRange(offset, min(chunkSize, sourceSize - offset));
}

vector<ChunkRange> ChunkPlanner::ranges() const
{
	vector<ChunkRange> result;
	result.reserve((std::size_t)count());

	for(const ChunkRange &r : *this)
		result.push_back(r);

	return result;
}
