/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CHUNKRANGE_HPP
#define CHUNKRANGE_HPP

#include <ostream>
#include <string>

#include <utils.hpp>

namespace au
{

/**
  * A contiguous byte range of the source which
  * is transferred using one request
 **/
struct ChunkRange
{

	ChunkRange(unsigned long long ull_offset, unsigned long long ull_length) :
		offset(ull_offset),
		length(ull_length)
	{}

	/**
	  * Returns the offset behind the last byte of the range
	 **/
	unsigned long long end() const
	{
		return offset + length;
	}

	/**
	  * Returns the value of the Content-Range header for this
	  * range, e.g. "bytes 0-999/2500"
	 **/
	std::string contentRange(unsigned long long sourceSize) const
	{
		return utils::concat("bytes ", offset, "-", offset + length - 1, "/", sourceSize);
	}

	bool operator== (const ChunkRange &other) const
	{
		return offset == other.offset && length == other.length;
	}

	bool operator!= (const ChunkRange &other) const
	{
		return !(*this == other);
	}

	unsigned long long offset;

	unsigned long long length;

}; //end struct ChunkRange

inline std::ostream& operator<< (std::ostream &out, const ChunkRange &range)
{
	out<<"["<<range.offset<<", "<<range.end()<<")";
	return out;
}

} //end namespace au

#endif //CHUNKRANGE_HPP
