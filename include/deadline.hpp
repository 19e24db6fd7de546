/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef DEADLINE_HPP
#define DEADLINE_HPP

#include <chrono>

namespace au
{

/**
  * An absolute point in time after which an upload session
  * is aborted. A default constructed Deadline never expires.
  * The deadline is taken once when a session starts and is
  * shared by all of its requests
 **/
class Deadline
{

public:
	typedef std::chrono::steady_clock clock;

	/**
	  * Creates a deadline which never expires
	 **/
	Deadline() :
		set(false),
		at()
	{}

	/**
	  * Creates a deadline which expires at the given time
	 **/
	explicit Deadline(clock::time_point tp_at) :
		set(true),
		at(tp_at)
	{}

	static Deadline none()
	{
		return Deadline();
	}

	/**
	  * Creates a deadline which expires after the given
	  * duration, starting from now
	 **/
	template <class Rep, class Period>
	static Deadline after(const std::chrono::duration<Rep,Period> &duration)
	{
		return Deadline(clock::now() + std::chrono::duration_cast<clock::duration>(duration));
	}

	bool isSet() const
	{
		return set;
	}

	bool expired() const
	{
		return set && clock::now() >= at;
	}

	/**
	  * Returns the remaining time in milliseconds. A deadline
	  * which is not set returns a negative value, an expired
	  * deadline returns 0
	 **/
	long long remainingMilliseconds() const
	{
		if(!set)return -1;

		const long long remaining = std::chrono::duration_cast<std::chrono::milliseconds>(at - clock::now()).count();
		return remaining > 0 ? remaining : 0;
	}

	clock::time_point getTime() const
	{
		return at;
	}

private:
	bool set;
	clock::time_point at;

}; //end class Deadline

} //end namespace au

#endif //DEADLINE_HPP
