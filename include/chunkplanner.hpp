/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CHUNKPLANNER_HPP
#define CHUNKPLANNER_HPP

#include <cstddef>
#include <iterator>
#include <vector>

#include <chunkrange.hpp>

namespace au
{

/**
  * The ChunkPlanner splits a source of a known size into
  * ChunkRanges of at most chunkSize bytes. The ranges are
  * computed on demand, so the planner can be iterated as
  * often as needed and always yields the same sequence.
  * A source of size 0 yields one empty range because the
  * service still expects one request.
 **/
class ChunkPlanner
{

public:

	/**
	  * Iterates the ranges of a ChunkPlanner in ascending order
	 **/
	class const_iterator : public std::iterator<std::forward_iterator_tag, ChunkRange, std::ptrdiff_t, const ChunkRange*, ChunkRange>
	{

	public:
		const_iterator(const ChunkPlanner *p_planner, unsigned long long ull_index) :
			planner(p_planner),
			index(ull_index)
		{}

		ChunkRange operator* () const
		{
			return planner->range(index);
		}

		const_iterator& operator++ ()
		{
			++index;
			return *this;
		}

		const_iterator operator++ (int)
		{
			const_iterator old(*this);
			++index;
			return old;
		}

		bool operator== (const const_iterator &other) const
		{
			return planner == other.planner && index == other.index;
		}

		bool operator!= (const const_iterator &other) const
		{
			return !(*this == other);
		}

	private:
		const ChunkPlanner *planner;
		unsigned long long index;

	}; //end class const_iterator

	/**
	  * Creates a planner for the given source size. Throws
	  * an UploadException if chunkSize is 0
	 **/
	ChunkPlanner(unsigned long long sourceSize, unsigned long long chunkSize);

	unsigned long long getSourceSize() const
	{
		return sourceSize;
	}

	unsigned long long getChunkSize() const
	{
		return chunkSize;
	}

	/**
	  * Returns the number of ranges, which is at least 1
	 **/
	unsigned long long count() const;

	/**
	  * Returns true if the whole source fits into a single range
	 **/
	bool isSingleRange() const
	{
		return count() == 1;
	}

	/**
	  * Returns the range with the given index. Throws an
	  * UploadException if the index is out of range
	 **/
	ChunkRange range(unsigned long long index) const;

	/**
	  * Returns all ranges at once
	 **/
	std::vector<ChunkRange> ranges() const;

	const_iterator begin() const
	{
		return const_iterator(this, 0);
	}

	const_iterator end() const
	{
		return const_iterator(this, count());
	}

private:
	unsigned long long sourceSize;
	unsigned long long chunkSize;

}; //end class ChunkPlanner

} //end namespace au

#endif //CHUNKPLANNER_HPP
